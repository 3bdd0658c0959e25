#pragma once
// =============================================================================
// scrcpy-pilot - Single-instance lock
// =============================================================================
// A lockfile containing "<pid> <start-epoch-seconds>\n".
//
// Creation is link(2) of a fully written temp file onto the lock path, so the
// lock appears atomically and never half-written; link's EEXIST decides races.
// The holder also keeps flock(LOCK_EX) on the file. A lock is stale when its
// pid is dead, or when nobody holds the flock (pid recycled after a crash).
// Stale locks are unlinked and creation is retried once.
//
// Release is RAII. A fatal-signal finalizer unlinks the file if the process
// dies without running destructors; the kernel drops the flock regardless.
// =============================================================================

#include <sys/types.h>
#include <string>
#include "result.hpp"

namespace pilot {

struct LockHolder {
    pid_t pid = 0;
    long long started_at = 0;   // epoch seconds
};

class InstanceLock {
public:
    // ErrorKind::AlreadyRunning when a live instance holds the lock
    static Result<InstanceLock> acquire(const std::string& path);

    // $XDG_RUNTIME_DIR/scrcpy-pilot.lock, else $TMPDIR, else /tmp
    static std::string defaultPath();

    InstanceLock(InstanceLock&& other) noexcept;
    InstanceLock& operator=(InstanceLock&& other) noexcept;
    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;
    ~InstanceLock();

    const std::string& path() const { return path_; }
    bool held() const { return fd_ >= 0; }

    // Unlink the lockfile now (idempotent)
    void release();

private:
    InstanceLock(std::string path, int fd);

    std::string path_;
    int fd_ = -1;
};

// Parse the holder record; malformed content is an Io error
Result<LockHolder> readLockHolder(const std::string& path);

// kill(pid, 0) check; EPERM counts as alive
bool isProcessAlive(pid_t pid);

} // namespace pilot
