#pragma once
// =============================================================================
// scrcpy-pilot - Subprocess helpers
// =============================================================================
// posix_spawn based process creation shared by the discovery poller (short
// commands with a hard timeout) and the session launcher (long-lived scrcpy
// children). No shell is involved; argv is passed through verbatim.
// =============================================================================

#include <sys/types.h>
#include <string>
#include <vector>
#include "result.hpp"

namespace pilot {

struct CommandOutput {
    int exit_code = -1;
    std::string output;     // stdout + stderr, merged
};

struct SpawnedProcess {
    pid_t pid = -1;
    int output_fd = -1;     // read end of the merged stdout/stderr pipe
};

// Start argv[0] (PATH lookup applies) with stdin=/dev/null and stdout/stderr
// on a fresh pipe. The child leads its own process group so terminal signals
// aimed at the launcher do not reach it.
Result<SpawnedProcess> spawnWithPipe(const std::vector<std::string>& argv);

// Run a command to completion, bounded by timeout_ms. On timeout the child's
// process group is killed and reaped before returning ErrorKind::Timeout.
Result<CommandOutput> runCommand(const std::vector<std::string>& argv, int timeout_ms);

// Locate an executable: absolute/relative paths are checked as-is, bare names
// are tried in each of search_dirs and then along $PATH.
Result<std::string> findExecutable(const std::string& name,
                                   const std::vector<std::string>& search_dirs);

// Directory containing the running executable ("" if unknown)
std::string executableDir();

} // namespace pilot
