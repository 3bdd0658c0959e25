#pragma once
// =============================================================================
// scrcpy-pilot - Session Supervisor
// =============================================================================
// The single decision point. Drains the CommandChannel one event at a time,
// owns the device table and every session, drives scrcpy processes through a
// ProcessLauncher and publishes a Snapshot after every event.
//
// Session state machine:
//
//   Stopped -> Starting -> Running -> Stopping -> Stopped
//   Starting | Running -> Failed(reason)      abnormal exit / spawn error
//   Failed -> Stopped                         acknowledged (or new Start)
//
// Nothing here auto-restarts: a disconnect stops the session, a reconnect
// leaves it stopped, and a crash leaves it Failed until the user acts.
// =============================================================================

#include <chrono>
#include <cstdarg>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "child_process.hpp"
#include "command_channel.hpp"
#include "config_loader.hpp"
#include "device_table.hpp"
#include "event_bus.hpp"
#include "snapshot.hpp"

namespace pilot {

struct SupervisorConfig {
    std::string scrcpy_path = "scrcpy";
    std::vector<std::string> extra_args;
    bool window_title = true;
    int debounce_ticks = 2;
    int grace_period_ms = 3000;
    int spawn_confirm_ms = 300;
    int log_tail_size = 100;

    static SupervisorConfig fromAppConfig(const config::AppConfig& app,
                                          const std::string& scrcpy_path);
};

class SessionSupervisor {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    SessionSupervisor(SupervisorConfig cfg, CommandChannel& channel,
                      ProcessLauncher& launcher, SnapshotStore& store,
                      NowFn now = Clock::now, EventBus& events = bus());
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    // Event loop; returns once shutdown has stopped every session
    void run();

    // Process one event and publish. run() is just waitPop + handle + onTimer.
    void handle(const SupervisorEvent& event);

    // Fire due timers (spawn confirmation, stop escalation, shutdown cap)
    void onTimer();

    // Earliest pending timer, if any
    std::optional<Clock::time_point> nextDeadline() const;

    // Shutdown requested and no live sessions remain
    bool finished() const;

    bool shuttingDown() const { return shutting_down_; }

    // argv for one session
    std::vector<std::string> buildCommandLine(const Device& device) const;

private:
    struct Session {
        std::string device_id;
        SessionState state = SessionState::Stopped;
        std::string failure_reason;
        std::unique_ptr<ProcessHandle> process;
        pid_t pid = -1;
        std::chrono::system_clock::time_point started_at{};
        int restart_count = 0;

        bool stop_requested = false;
        bool kill_sent = false;
        bool restart_pending = false;
        std::optional<Clock::time_point> confirm_at;     // Starting -> Running check
        std::optional<Clock::time_point> stop_deadline;  // SIGKILL escalation
    };

    void onDiscovery(const DiscoveryUpdate& update);
    void onDiscoveryFailed(const DiscoveryFailed& failed);
    void onCommand(const UserCommand& cmd);
    void onOutput(const ProcessOutput& out);
    void onExited(const ProcessExited& exited);
    void onShutdown(const char* why);

    void startSession(const std::string& device_id);
    void stopSession(Session& s, const char* why);
    void transition(Session& s, SessionState next);
    void reject(const UserCommand& cmd, ErrorKind kind, const std::string& message);
    void pruneDisconnected();

    Session* findSession(const std::string& device_id);
    bool hasLiveSession(const std::string& device_id) const;

    void note(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void publish();

    const SupervisorConfig cfg_;
    CommandChannel& channel_;
    ProcessLauncher& launcher_;
    SnapshotStore& store_;
    NowFn now_;
    EventBus& events_;

    DeviceTable devices_;
    std::map<std::string, Session> sessions_;
    std::deque<LogEntry> log_tail_;
    std::string notice_;
    bool discovery_available_ = true;
    std::string discovery_error_;

    bool shutting_down_ = false;
    std::optional<Clock::time_point> shutdown_deadline_;
};

} // namespace pilot
