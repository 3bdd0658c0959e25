#include "child_process.hpp"
#include "subprocess.hpp"
#include "pilot_log.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pilot {

namespace {

// Reader poll period; after exit the pipe is drained until it stays quiet this long
constexpr int OUTPUT_POLL_MS = 100;

// Long scrcpy lines are split rather than buffered without bound
constexpr size_t MAX_LINE_LENGTH = 1024;

} // anonymous namespace

// =============================================================================
// ChildProcess
// =============================================================================

ChildProcess::Shared::Shared(std::string id, pid_t p, int fd,
                             ProcessLauncher::OutputCallback out,
                             ProcessLauncher::ExitCallback exit)
    : device_id(std::move(id)),
      pid(p),
      output_fd(fd),
      on_output(std::move(out)),
      on_exit(std::move(exit)) {}

ChildProcess::Shared::~Shared() {
    if (output_fd >= 0) ::close(output_fd);
}

bool ChildProcess::Shared::sendSignal(int sig) {
    // The pid (and its group id) cannot be recycled until we reap it,
    // and reaping happens under this same lock.
    std::lock_guard<std::mutex> lock(mutex);
    if (reaped) return false;
    if (::kill(-pid, sig) != 0) {
        // Group already empty but leader not yet reaped; fall back to the pid
        if (::kill(pid, sig) != 0) {
            PLOG_WARN("child", "[%s] kill(%d, %d): %s", device_id.c_str(),
                      (int)pid, sig, std::strerror(errno));
            return false;
        }
    }
    return true;
}

ChildProcess::ChildProcess(std::string device_id, pid_t pid, int output_fd,
                           ProcessLauncher::OutputCallback on_output,
                           ProcessLauncher::ExitCallback on_exit)
    : shared_(std::make_shared<Shared>(std::move(device_id), pid, output_fd,
                                       std::move(on_output), std::move(on_exit))) {
    reader_ = std::thread(&ChildProcess::pumpOutput, shared_);
    watcher_ = std::thread(&ChildProcess::watchExit, shared_);
}

ChildProcess::~ChildProcess() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->reaped) {
            PLOG_WARN("child", "[%s] pid %d still running at teardown, killing",
                      shared_->device_id.c_str(), (int)shared_->pid);
            ::kill(-shared_->pid, SIGKILL);
        }
    }
    if (abandoned_.load()) {
        // The threads own the shared state; they reap and exit on their own
        if (watcher_.joinable()) watcher_.detach();
        if (reader_.joinable()) reader_.detach();
        return;
    }
    if (watcher_.joinable()) watcher_.join();
    if (reader_.joinable()) reader_.join();
}

bool ChildProcess::isAlive() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return !shared_->reaped;
}

bool ChildProcess::terminate() { return shared_->sendSignal(SIGTERM); }

bool ChildProcess::kill() { return shared_->sendSignal(SIGKILL); }

void ChildProcess::abandon() {
    {
        std::lock_guard<std::mutex> lock(shared_->callback_mutex);
        shared_->silenced = true;
    }
    abandoned_.store(true);
    PLOG_WARN("child", "[%s] abandoning pid %d", shared_->device_id.c_str(),
              (int)shared_->pid);
}

void ChildProcess::watchExit(std::shared_ptr<Shared> shared) {
    // Wait without reaping so signals stay safe until we hold the lock
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(shared->pid), &info, WEXITED | WNOWAIT);
    } while (rc != 0 && errno == EINTR);

    ExitStatus status;
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        int raw = 0;
        pid_t r;
        do {
            r = ::waitpid(shared->pid, &raw, 0);
        } while (r < 0 && errno == EINTR);

        if (r == shared->pid) {
            if (WIFEXITED(raw)) {
                status.exit_code = WEXITSTATUS(raw);
            } else if (WIFSIGNALED(raw)) {
                status.signaled = true;
                status.signal = WTERMSIG(raw);
            }
        } else {
            PLOG_ERROR("child", "[%s] waitpid(%d): %s", shared->device_id.c_str(),
                       (int)shared->pid, std::strerror(errno));
            status.exit_code = -1;
        }
        shared->reaped = true;
    }

    // Output is fully drained before the exit is reported
    shared->exited.store(true);
    {
        std::unique_lock<std::mutex> lock(shared->reader_mutex);
        shared->reader_cv.wait(lock, [&shared] { return shared->reader_done; });
    }

    PLOG_INFO("child", "[%s] pid %d exited (%s %d)", shared->device_id.c_str(),
              (int)shared->pid, status.signaled ? "signal" : "code",
              status.signaled ? status.signal : status.exit_code);

    std::lock_guard<std::mutex> lock(shared->callback_mutex);
    if (!shared->silenced && shared->on_exit) {
        shared->on_exit(shared->device_id, shared->pid, status);
    }
}

void ChildProcess::pumpOutput(std::shared_ptr<Shared> shared) {
    std::string pending;
    char buffer[4096];

    auto emit = [&shared](std::string line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        if (line.empty()) return;
        std::lock_guard<std::mutex> lock(shared->callback_mutex);
        if (!shared->silenced && shared->on_output) {
            shared->on_output(shared->device_id, shared->pid, line);
        }
    };

    while (true) {
        struct pollfd pfd{shared->output_fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, OUTPUT_POLL_MS);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) {
            // Helpers spawned by scrcpy may keep the pipe open after it exits
            if (shared->exited.load()) break;
            continue;
        }

        ssize_t n = ::read(shared->output_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;

        pending.append(buffer, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            emit(pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
        if (pending.size() > MAX_LINE_LENGTH) {
            emit(pending);
            pending.clear();
        }
    }
    if (!pending.empty()) emit(pending);

    std::lock_guard<std::mutex> lock(shared->reader_mutex);
    shared->reader_done = true;
    shared->reader_cv.notify_all();
}

// =============================================================================
// PosixProcessLauncher
// =============================================================================

PosixProcessLauncher::PosixProcessLauncher(OutputCallback on_output, ExitCallback on_exit)
    : on_output_(std::move(on_output)), on_exit_(std::move(on_exit)) {}

Result<std::unique_ptr<ProcessHandle>> PosixProcessLauncher::spawn(
    const std::string& device_id, const std::vector<std::string>& argv) {
    auto spawned = spawnWithPipe(argv);
    if (spawned.is_err()) return spawned.error();

    PLOG_INFO("child", "[%s] spawned %s (pid %d)", device_id.c_str(),
              argv[0].c_str(), (int)spawned.value().pid);

    std::unique_ptr<ProcessHandle> handle = std::make_unique<ChildProcess>(
        device_id, spawned.value().pid, spawned.value().output_fd, on_output_, on_exit_);
    return Result<std::unique_ptr<ProcessHandle>>(std::move(handle));
}

} // namespace pilot
