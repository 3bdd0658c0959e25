#include "subprocess.hpp"
#include "pilot_log.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace pilot {

namespace {

// Output beyond this is dropped (adb misbehaving should not eat memory)
constexpr size_t MAX_COMMAND_OUTPUT = 1024 * 1024;

// RAII owner for posix_spawn attribute/file-action objects
struct SpawnSetup {
    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    bool actions_ok = false;
    bool attr_ok = false;

    SpawnSetup() {
        actions_ok = posix_spawn_file_actions_init(&actions) == 0;
        attr_ok = posix_spawnattr_init(&attr) == 0;
    }
    ~SpawnSetup() {
        if (actions_ok) posix_spawn_file_actions_destroy(&actions);
        if (attr_ok) posix_spawnattr_destroy(&attr);
    }
    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

bool isExecutableFile(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

Result<SpawnedProcess> spawnWithPipe(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        return Err<SpawnedProcess>("empty command line", ErrorKind::SpawnFailure);
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        int err = errno;
        return Err<SpawnedProcess>(std::string("pipe: ") + std::strerror(err),
                                   ErrorKind::SpawnFailure, err);
    }

    SpawnSetup setup;
    if (!setup.actions_ok || !setup.attr_ok) {
        ::close(fds[0]);
        ::close(fds[1]);
        return Err<SpawnedProcess>("posix_spawn init failed", ErrorKind::SpawnFailure);
    }

    // dup2 clears FD_CLOEXEC on the target, so only 0/1/2 survive the exec
    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDERR_FILENO);

    // Own process group; default signal dispositions and an empty mask
    sigset_t all_signals;
    sigset_t no_signals;
    sigfillset(&all_signals);
    sigemptyset(&no_signals);
    posix_spawnattr_setpgroup(&setup.attr, 0);
    posix_spawnattr_setsigdefault(&setup.attr, &all_signals);
    posix_spawnattr_setsigmask(&setup.attr, &no_signals);
    posix_spawnattr_setflags(&setup.attr,
        POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
    c_argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, c_argv[0], &setup.actions, &setup.attr, c_argv.data(), environ);
    ::close(fds[1]);
    if (rc != 0) {
        ::close(fds[0]);
        return Err<SpawnedProcess>(argv[0] + ": " + std::strerror(rc), ErrorKind::SpawnFailure, rc);
    }

    SpawnedProcess spawned;
    spawned.pid = pid;
    spawned.output_fd = fds[0];
    return Ok(spawned);
}

Result<CommandOutput> runCommand(const std::vector<std::string>& argv, int timeout_ms) {
    auto spawned = spawnWithPipe(argv);
    if (spawned.is_err()) return spawned.error();
    const pid_t pid = spawned.value().pid;
    const int fd = spawned.value().output_fd;

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    CommandOutput out;
    bool timed_out = false;
    char buffer[4096];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }
        struct pollfd pfd{fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;  // deadline re-checked at loop top

        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;  // EOF: every writer closed the pipe
        if (out.output.size() < MAX_COMMAND_OUTPUT) {
            out.output.append(buffer, static_cast<size_t>(n));
        }
    }
    ::close(fd);

    if (out.output.size() > MAX_COMMAND_OUTPUT) {
        PLOG_WARN("subprocess", "Output truncated (exceeded 1MB)");
        out.output.resize(MAX_COMMAND_OUTPUT);
    }

    // A child may close its output before exiting; reaping honours the same deadline
    int status = 0;
    while (true) {
        if (timed_out) {
            ::kill(-pid, SIGKILL);
        }
        pid_t r = ::waitpid(pid, &status, timed_out ? 0 : WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            return Err<CommandOutput>(std::string("waitpid: ") + std::strerror(err),
                                      ErrorKind::Io, err);
        }
        if (Clock::now() >= deadline) {
            timed_out = true;
            continue;
        }
        ::usleep(5000);
    }

    if (timed_out) {
        return Err<CommandOutput>(argv[0] + " timed out after " +
                                  std::to_string(timeout_ms) + "ms",
                                  ErrorKind::Timeout);
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exit_code = 128 + WTERMSIG(status);
    }
    return Ok(std::move(out));
}

Result<std::string> findExecutable(const std::string& name,
                                   const std::vector<std::string>& search_dirs) {
    if (name.empty()) {
        return Err<std::string>("empty executable name", ErrorKind::ToolMissing);
    }

    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) return Ok(name);
        return Err<std::string>(name + " is not an executable file", ErrorKind::ToolMissing);
    }

    for (const auto& dir : search_dirs) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (isExecutableFile(candidate)) return Ok(candidate);
    }

    const char* path_env = std::getenv("PATH");
    if (path_env) {
        std::istringstream iss(path_env);
        std::string dir;
        while (std::getline(iss, dir, ':')) {
            if (dir.empty()) dir = ".";
            std::string candidate = dir + "/" + name;
            if (isExecutableFile(candidate)) return Ok(candidate);
        }
    }

    return Err<std::string>(name + " not found in search directories or PATH",
                            ErrorKind::ToolMissing);
}

std::string executableDir() {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "";
    std::string path(buf, static_cast<size_t>(n));
    auto slash = path.rfind('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

} // namespace pilot
