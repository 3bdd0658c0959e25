#include "instance_lock.hpp"
#include "pilot_log.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <limits.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pilot {

namespace {

// -----------------------------------------------------------------------------
// Process-lifetime finalizer
// -----------------------------------------------------------------------------
// Signal handlers may only touch these two objects.
char g_armed_path[PATH_MAX];
volatile sig_atomic_t g_armed = 0;

constexpr int FATAL_SIGNALS[] = {SIGSEGV, SIGABRT, SIGBUS, SIGFPE, SIGILL};

extern "C" void onFatalSignal(int sig) {
    if (g_armed) {
        ::unlink(g_armed_path);
        g_armed = 0;
    }
    // SA_RESETHAND restored the default action; re-raise to die with sig
    ::raise(sig);
}

void unlinkAtExit() {
    if (g_armed) {
        ::unlink(g_armed_path);
        g_armed = 0;
    }
}

void installFinalizerOnce() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = onFatalSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESETHAND;
        for (int sig : FATAL_SIGNALS) {
            ::sigaction(sig, &sa, nullptr);
        }
        std::atexit(unlinkAtExit);
    });
}

void armFinalizer(const std::string& path) {
    installFinalizerOnce();
    if (path.size() >= sizeof(g_armed_path)) return;
    g_armed = 0;
    std::memcpy(g_armed_path, path.c_str(), path.size() + 1);
    g_armed = 1;
}

void disarmFinalizer(const std::string& path) {
    if (g_armed && path == g_armed_path) g_armed = 0;
}

bool sameInode(int fd, const std::string& path) {
    struct stat by_fd;
    struct stat by_path;
    if (::fstat(fd, &by_fd) != 0) return false;
    if (::stat(path.c_str(), &by_path) != 0) return false;
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

bool writeAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

enum class StaleCheck { Live, Stale, Vanished };

// Decide whether the existing lockfile belongs to a live instance. On Stale
// the file has been unlinked and creation may be retried.
StaleCheck reclaimIfStale(const std::string& path) {
    auto holder = readLockHolder(path);
    bool pid_alive = holder.is_ok() && isProcessAlive(holder.value().pid);

    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return errno == ENOENT ? StaleCheck::Vanished : StaleCheck::Live;
    }

    // A live holder keeps the flock; failing to get it means it is running
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        ::close(fd);
        return StaleCheck::Live;
    }

    // The path may have been replaced by a fresh lock between open and flock
    if (!sameInode(fd, path)) {
        ::close(fd);
        return StaleCheck::Vanished;
    }

    if (holder.is_ok()) {
        PLOG_WARN("lock", "Reclaiming stale lock %s (holder pid %d %s)", path.c_str(),
                  (int)holder.value().pid, pid_alive ? "recycled" : "not running");
    } else {
        PLOG_WARN("lock", "Reclaiming unreadable lock %s: %s", path.c_str(),
                  holder.error().message.c_str());
    }
    ::unlink(path.c_str());
    ::close(fd);
    return StaleCheck::Stale;
}

} // anonymous namespace

// =============================================================================
// InstanceLock
// =============================================================================

InstanceLock::InstanceLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

InstanceLock::~InstanceLock() {
    release();
}

void InstanceLock::release() {
    if (fd_ < 0) return;
    // Only remove the file if it is still ours
    if (sameInode(fd_, path_)) {
        ::unlink(path_.c_str());
        PLOG_INFO("lock", "Released %s", path_.c_str());
    }
    disarmFinalizer(path_);
    ::close(fd_);
    fd_ = -1;
}

std::string InstanceLock::defaultPath() {
    const char* dir = std::getenv("XDG_RUNTIME_DIR");
    if (!dir || !*dir) dir = std::getenv("TMPDIR");
    if (!dir || !*dir) dir = "/tmp";
    return std::string(dir) + "/scrcpy-pilot.lock";
}

Result<InstanceLock> InstanceLock::acquire(const std::string& path) {
    const pid_t self = ::getpid();
    const std::string tmp_path = path + "." + std::to_string(self) + ".tmp";

    std::ostringstream record;
    record << self << " " << static_cast<long long>(std::time(nullptr)) << "\n";

    // First attempt, plus one retry after reclaiming a stale lock
    for (int attempt = 0; attempt < 2; ++attempt) {
        ::unlink(tmp_path.c_str());
        int fd = ::open(tmp_path.c_str(), O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            int err = errno;
            return Err<InstanceLock>("cannot create " + tmp_path + ": " + std::strerror(err),
                                     ErrorKind::Io, err);
        }
        if (!writeAll(fd, record.str()) || ::flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            ::close(fd);
            ::unlink(tmp_path.c_str());
            return Err<InstanceLock>("cannot prepare " + tmp_path + ": " + std::strerror(err),
                                     ErrorKind::Io, err);
        }

        int link_rc = ::link(tmp_path.c_str(), path.c_str());
        int link_err = errno;
        ::unlink(tmp_path.c_str());

        if (link_rc == 0) {
            armFinalizer(path);
            PLOG_INFO("lock", "Acquired %s (pid %d)", path.c_str(), (int)self);
            return Result<InstanceLock>(InstanceLock(path, fd));
        }
        ::close(fd);

        if (link_err != EEXIST) {
            return Err<InstanceLock>("cannot create " + path + ": " + std::strerror(link_err),
                                     ErrorKind::Io, link_err);
        }

        if (reclaimIfStale(path) == StaleCheck::Live) {
            auto holder = readLockHolder(path);
            std::string who = holder.is_ok()
                ? " (pid " + std::to_string(holder.value().pid) + ")"
                : "";
            return Err<InstanceLock>("scrcpy-pilot is already running" + who,
                                     ErrorKind::AlreadyRunning);
        }
    }

    return Err<InstanceLock>("lost the race for " + path + " to another instance",
                             ErrorKind::AlreadyRunning);
}

// =============================================================================
// Helpers
// =============================================================================

Result<LockHolder> readLockHolder(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Err<LockHolder>("cannot open " + path, ErrorKind::Io);
    }
    LockHolder holder;
    long long pid = 0;
    if (!(in >> pid) || pid <= 0 || pid > INT_MAX) {
        return Err<LockHolder>("malformed lock record in " + path, ErrorKind::Io);
    }
    holder.pid = static_cast<pid_t>(pid);
    if (!(in >> holder.started_at)) holder.started_at = 0;
    return Ok(holder);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

} // namespace pilot
