#pragma once
// =============================================================================
// scrcpy-pilot - Supervised child processes
// =============================================================================
// ProcessHandle / ProcessLauncher are the seam between the supervisor and the
// OS. The supervisor only ever talks to these interfaces, which is what lets
// the tests drive it with synthetic exits instead of real scrcpy processes.
// =============================================================================

#include <sys/types.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "result.hpp"

namespace pilot {

struct ExitStatus {
    int exit_code = 0;      // valid when !signaled
    bool signaled = false;
    int signal = 0;         // valid when signaled
};

// One running child. Signalling after the child has been reaped is a no-op.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual pid_t pid() const = 0;
    virtual bool isAlive() const = 0;

    // SIGTERM to the child's process group; false if already gone
    virtual bool terminate() = 0;

    // SIGKILL to the child's process group; false if already gone
    virtual bool kill() = 0;

    // Give up on the child: no further callbacks are delivered, and destroying
    // the handle no longer waits for the child to be reaped
    virtual void abandon() = 0;
};

class ProcessLauncher {
public:
    using OutputCallback = std::function<void(const std::string& device_id, pid_t pid,
                                              const std::string& line)>;
    using ExitCallback = std::function<void(const std::string& device_id, pid_t pid,
                                            ExitStatus status)>;

    virtual ~ProcessLauncher() = default;

    virtual Result<std::unique_ptr<ProcessHandle>> spawn(
        const std::string& device_id, const std::vector<std::string>& argv) = 0;
};

// -----------------------------------------------------------------------------
// POSIX implementation
// -----------------------------------------------------------------------------

class ChildProcess : public ProcessHandle {
public:
    ChildProcess(std::string device_id, pid_t pid, int output_fd,
                 ProcessLauncher::OutputCallback on_output,
                 ProcessLauncher::ExitCallback on_exit);
    // Kills the child if still running and joins the watcher threads, or
    // detaches them once the handle has been abandoned
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const override { return shared_->pid; }
    bool isAlive() const override;
    bool terminate() override;
    bool kill() override;
    void abandon() override;

private:
    // Everything the reader and watcher threads touch. They hold it by
    // shared_ptr so an abandoned handle can go away before they finish.
    struct Shared {
        Shared(std::string id, pid_t p, int fd, ProcessLauncher::OutputCallback out,
               ProcessLauncher::ExitCallback exit);
        ~Shared();

        bool sendSignal(int sig);

        const std::string device_id;
        const pid_t pid;
        const int output_fd;

        std::mutex mutex;
        bool reaped = false;                // guarded by mutex
        std::atomic<bool> exited{false};    // tells the reader to drain and stop

        std::mutex reader_mutex;
        std::condition_variable reader_cv;
        bool reader_done = false;           // guarded by reader_mutex

        // Callbacks run under callback_mutex; abandon() sets `silenced`
        // under it so none is running or will run once it returns
        std::mutex callback_mutex;
        bool silenced = false;
        ProcessLauncher::OutputCallback on_output;
        ProcessLauncher::ExitCallback on_exit;
    };

    static void watchExit(std::shared_ptr<Shared> shared);
    static void pumpOutput(std::shared_ptr<Shared> shared);

    std::shared_ptr<Shared> shared_;
    std::atomic<bool> abandoned_{false};

    std::thread reader_;
    std::thread watcher_;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    PosixProcessLauncher(OutputCallback on_output, ExitCallback on_exit);

    Result<std::unique_ptr<ProcessHandle>> spawn(
        const std::string& device_id, const std::vector<std::string>& argv) override;

private:
    OutputCallback on_output_;
    ExitCallback on_exit_;
};

} // namespace pilot
