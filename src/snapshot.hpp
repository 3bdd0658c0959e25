#pragma once
// =============================================================================
// scrcpy-pilot - Snapshot
// =============================================================================
// Immutable, versioned view of devices, sessions and the log tail. The
// supervisor builds a complete Snapshot and swaps it in with one atomic
// pointer store; readers hold a shared_ptr to whichever version they loaded.
// =============================================================================

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "device_table.hpp"

namespace pilot {

enum class SessionState : uint8_t { Starting, Running, Stopping, Stopped, Failed };

inline const char* sessionStateStr(SessionState s) {
    switch (s) {
        case SessionState::Starting: return "Starting";
        case SessionState::Running:  return "Running";
        case SessionState::Stopping: return "Stopping";
        case SessionState::Stopped:  return "Stopped";
        case SessionState::Failed:   return "Failed";
    }
    return "?";
}

// A live session owns a child process
inline bool isLive(SessionState s) {
    return s == SessionState::Starting || s == SessionState::Running ||
           s == SessionState::Stopping;
}

struct SessionInfo {
    std::string device_id;
    SessionState state = SessionState::Stopped;
    std::string failure_reason;                     // set while Failed
    pid_t pid = -1;                                 // -1 when no process
    std::chrono::system_clock::time_point started_at{};
    int restart_count = 0;
    bool restart_pending = false;
};

enum class LogLevel : uint8_t { Info, Success, Warning, Error, Device, Launch };

inline const char* logLevelStr(LogLevel l) {
    switch (l) {
        case LogLevel::Info:    return "info";
        case LogLevel::Success: return "ok";
        case LogLevel::Warning: return "warn";
        case LogLevel::Error:   return "error";
        case LogLevel::Device:  return "device";
        case LogLevel::Launch:  return "launch";
    }
    return "?";
}

struct LogEntry {
    std::string timestamp;      // "HH:MM:SS" local time
    LogLevel level = LogLevel::Info;
    std::string message;
};

struct Snapshot {
    uint64_t version = 0;
    std::vector<DeviceRecord> devices;      // ordered by id
    std::vector<SessionInfo> sessions;      // ordered by device id
    std::vector<LogEntry> log_tail;         // oldest first
    std::string notice;                     // last rejected command, transient
    bool discovery_available = true;
    std::string discovery_error;
    bool shutting_down = false;

    const DeviceRecord* findDevice(const std::string& id) const;
    const SessionInfo* findSession(const std::string& id) const;
    size_t liveSessionCount() const;

    // Every session references a device present in this snapshot
    bool consistent() const;
};

class SnapshotStore {
public:
    using Observer = std::function<void(const Snapshot&)>;

    SnapshotStore();

    // Never blocks on the writer beyond the pointer load
    std::shared_ptr<const Snapshot> latest() const;

    // Stamps the next version and publishes; returns that version
    uint64_t publish(Snapshot next);

    uint64_t version() const;

    // Called synchronously on the publishing thread after each publish
    void setObserver(Observer observer);

private:
    std::shared_ptr<const Snapshot> current_;
    std::mutex observer_mutex_;
    Observer observer_;
};

} // namespace pilot
