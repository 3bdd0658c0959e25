#include "session_supervisor.hpp"
#include "pilot_log.hpp"

#include <cstdio>
#include <ctime>
#include <type_traits>

namespace pilot {

namespace {

constexpr auto kIdleWait = std::chrono::milliseconds(500);
constexpr auto kShutdownSlack = std::chrono::seconds(1);

std::string wallClockStamp() {
    time_t now = time(nullptr);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    return buf;
}

std::string describeExit(const ExitStatus& status) {
    if (status.signaled) return "killed by signal " + std::to_string(status.signal);
    return "exit code " + std::to_string(status.exit_code);
}

log::Level fileLevelFor(LogLevel level) {
    switch (level) {
        case LogLevel::Warning: return log::Level::Warn;
        case LogLevel::Error:   return log::Level::Error;
        default:                return log::Level::Info;
    }
}

} // namespace

SupervisorConfig SupervisorConfig::fromAppConfig(const config::AppConfig& app,
                                                 const std::string& scrcpy_path) {
    SupervisorConfig cfg;
    cfg.scrcpy_path = scrcpy_path;
    cfg.extra_args = app.scrcpy.extra_args;
    cfg.window_title = app.scrcpy.window_title;
    cfg.debounce_ticks = app.discovery.debounce_ticks;
    cfg.grace_period_ms = app.session.grace_period_ms;
    cfg.spawn_confirm_ms = app.session.spawn_confirm_ms;
    cfg.log_tail_size = app.ui.log_tail_size;
    return cfg;
}

SessionSupervisor::SessionSupervisor(SupervisorConfig cfg, CommandChannel& channel,
                                     ProcessLauncher& launcher, SnapshotStore& store,
                                     NowFn now, EventBus& events)
    : cfg_(std::move(cfg)),
      channel_(channel),
      launcher_(launcher),
      store_(store),
      now_(std::move(now)),
      events_(events),
      devices_(cfg_.debounce_ticks) {}

SessionSupervisor::~SessionSupervisor() {
    for (auto& [id, s] : sessions_) {
        if (s.process && s.process->isAlive()) {
            PLOG_WARN("supervisor", "Killing leftover scrcpy for %s (pid %d)", id.c_str(), s.pid);
            s.process->kill();
        }
    }
}

// =============================================================================
// Loop
// =============================================================================

void SessionSupervisor::run() {
    PLOG_INFO("supervisor", "Supervisor loop started");
    note(LogLevel::Info, "scrcpy-pilot started, waiting for devices");
    publish();

    while (!finished()) {
        auto deadline = nextDeadline().value_or(Clock::now() + kIdleWait);
        auto event = channel_.waitPop(deadline);
        if (event) {
            handle(*event);
        } else if (channel_.closed() && !shutting_down_) {
            // Every producer is gone; nothing can ever ask us to stop again
            onShutdown("command channel closed");
            publish();
        }
        onTimer();
    }

    PLOG_INFO("supervisor", "Supervisor loop finished");
}

void SessionSupervisor::handle(const SupervisorEvent& event) {
    std::visit([this](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, DiscoveryUpdate>) {
            onDiscovery(ev);
        } else if constexpr (std::is_same_v<T, DiscoveryFailed>) {
            onDiscoveryFailed(ev);
        } else if constexpr (std::is_same_v<T, UserCommand>) {
            onCommand(ev);
        } else if constexpr (std::is_same_v<T, ProcessOutput>) {
            onOutput(ev);
        } else if constexpr (std::is_same_v<T, ProcessExited>) {
            onExited(ev);
        } else if constexpr (std::is_same_v<T, ShutdownRequest>) {
            onShutdown("shutdown requested");
        }
    }, event);
    publish();
}

void SessionSupervisor::onTimer() {
    const auto now = now_();
    bool changed = false;

    for (auto& [id, s] : sessions_) {
        if (s.state == SessionState::Starting && s.confirm_at && *s.confirm_at <= now) {
            s.confirm_at.reset();
            if (s.process && s.process->isAlive()) {
                transition(s, SessionState::Running);
                note(LogLevel::Success, "Mirroring %s (pid %d)", id.c_str(), s.pid);
                changed = true;
            }
            // Otherwise the exit event is already queued and decides the outcome
        }

        if (s.state == SessionState::Stopping && s.stop_deadline && *s.stop_deadline <= now &&
            !s.kill_sent) {
            s.kill_sent = true;
            s.stop_deadline.reset();
            if (s.process) {
                note(LogLevel::Warning, "%s did not stop within %d ms, killing", id.c_str(),
                     cfg_.grace_period_ms);
                s.process->kill();
                changed = true;
            }
        }
    }

    if (shutting_down_ && shutdown_deadline_ && *shutdown_deadline_ <= now) {
        shutdown_deadline_.reset();
        for (auto& [id, s] : sessions_) {
            if (!isLive(s.state)) continue;
            PLOG_ERROR("supervisor", "%s still alive after shutdown grace, abandoning", id.c_str());
            if (s.process) {
                s.process->kill();
                // Dropping the handle must not wait on a child SIGKILL cannot reap
                s.process->abandon();
            }
            s.process.reset();
            s.pid = -1;
            transition(s, SessionState::Stopped);
        }
        changed = true;
    }

    if (changed) publish();
}

std::optional<SessionSupervisor::Clock::time_point> SessionSupervisor::nextDeadline() const {
    std::optional<Clock::time_point> earliest = shutdown_deadline_;
    auto consider = [&earliest](const std::optional<Clock::time_point>& t) {
        if (t && (!earliest || *t < *earliest)) earliest = t;
    };
    for (const auto& [id, s] : sessions_) {
        if (s.state == SessionState::Starting) consider(s.confirm_at);
        if (s.state == SessionState::Stopping && !s.kill_sent) consider(s.stop_deadline);
    }
    return earliest;
}

bool SessionSupervisor::finished() const {
    if (!shutting_down_) return false;
    for (const auto& [id, s] : sessions_) {
        if (isLive(s.state)) return false;
    }
    return true;
}

std::vector<std::string> SessionSupervisor::buildCommandLine(const Device& device) const {
    std::vector<std::string> argv{cfg_.scrcpy_path, "-s", device.id};
    if (cfg_.window_title) {
        argv.push_back("--window-title");
        argv.push_back(device.label);
    }
    argv.insert(argv.end(), cfg_.extra_args.begin(), cfg_.extra_args.end());
    return argv;
}

// =============================================================================
// Discovery
// =============================================================================

void SessionSupervisor::onDiscovery(const DiscoveryUpdate& update) {
    if (!discovery_available_) {
        discovery_available_ = true;
        discovery_error_.clear();
        note(LogLevel::Success, "Device discovery recovered");
        DiscoveryStatusEvent ev;
        ev.available = true;
        events_.publish(ev);
    }

    auto delta = devices_.apply(update.devices);

    for (const auto& id : delta.added) {
        const DeviceRecord* rec = devices_.find(id);
        note(LogLevel::Device, "Connected: %s (%s, %s)", rec->device.label.c_str(), id.c_str(),
             transportStr(rec->device.transport));
        if (rec->device.state == DeviceState::Unauthorized) {
            note(LogLevel::Warning, "%s is unauthorized; accept the USB debugging prompt",
                 id.c_str());
        }
    }
    for (const auto& id : delta.changed) {
        const DeviceRecord* rec = devices_.find(id);
        note(LogLevel::Device, "%s is now %s", id.c_str(), deviceStateStr(rec->device.state));
    }

    for (const auto& id : delta.disconnected) {
        note(LogLevel::Device, "Disconnected: %s", id.c_str());
        Session* s = findSession(id);
        if (!s) continue;
        s->restart_pending = false;
        if (s->state == SessionState::Starting || s->state == SessionState::Running) {
            stopSession(*s, "device disconnected");
        }
    }

    // A device that dropped out of "device" state can no longer be mirrored
    for (const auto& id : delta.changed) {
        Session* s = findSession(id);
        if (!s || devices_.isOnline(id)) continue;
        s->restart_pending = false;
        if (s->state == SessionState::Starting || s->state == SessionState::Running) {
            stopSession(*s, "device went offline");
        }
    }

    pruneDisconnected();
}

void SessionSupervisor::onDiscoveryFailed(const DiscoveryFailed& failed) {
    discovery_error_ = failed.reason;
    if (!discovery_available_) {
        PLOG_DEBUG("supervisor", "Discovery still unavailable: %s", failed.reason.c_str());
        return;
    }
    discovery_available_ = false;
    note(LogLevel::Warning, "Device discovery unavailable: %s", failed.reason.c_str());
    DiscoveryStatusEvent ev;
    ev.available = false;
    ev.reason = failed.reason;
    events_.publish(ev);
}

void SessionSupervisor::pruneDisconnected() {
    for (const auto& id : devices_.disconnectedIds()) {
        if (hasLiveSession(id)) continue;
        sessions_.erase(id);
        devices_.remove(id);
    }
}

// =============================================================================
// User Commands
// =============================================================================

void SessionSupervisor::onCommand(const UserCommand& cmd) {
    PLOG_DEBUG("supervisor", "Command %s %s", commandKindStr(cmd.kind), cmd.device_id.c_str());

    if (cmd.kind == CommandKind::Quit) {
        onShutdown("quit requested");
        return;
    }

    Session* s = findSession(cmd.device_id);

    switch (cmd.kind) {
        case CommandKind::Start: {
            if (shutting_down_) {
                reject(cmd, ErrorKind::InvalidTarget, "shutting down");
                return;
            }
            if (!devices_.isOnline(cmd.device_id)) {
                reject(cmd, ErrorKind::InvalidTarget,
                       devices_.contains(cmd.device_id) ? "device not online" : "unknown device");
                return;
            }
            if (s && isLive(s->state)) {
                reject(cmd, ErrorKind::AlreadyActive, "session already active");
                return;
            }
            notice_.clear();
            if (s && s->state == SessionState::Failed) {
                s->failure_reason.clear();
                transition(*s, SessionState::Stopped);
            }
            startSession(cmd.device_id);
            return;
        }

        case CommandKind::Stop: {
            notice_.clear();
            if (!s || !isLive(s->state)) {
                PLOG_DEBUG("supervisor", "Stop %s: no live session", cmd.device_id.c_str());
                return;
            }
            s->restart_pending = false;
            if (s->state != SessionState::Stopping) stopSession(*s, "stop requested");
            return;
        }

        case CommandKind::Restart: {
            if (s && isLive(s->state)) {
                if (shutting_down_) {
                    reject(cmd, ErrorKind::InvalidTarget, "shutting down");
                    return;
                }
                notice_.clear();
                s->restart_pending = true;
                note(LogLevel::Launch, "Restarting %s", cmd.device_id.c_str());
                if (s->state != SessionState::Stopping) stopSession(*s, "restart requested");
                return;
            }
            UserCommand start = cmd;
            start.kind = CommandKind::Start;
            onCommand(start);
            return;
        }

        case CommandKind::Acknowledge: {
            notice_.clear();
            if (s && s->state == SessionState::Failed) {
                s->failure_reason.clear();
                transition(*s, SessionState::Stopped);
            }
            return;
        }

        case CommandKind::Quit:
            return;
    }
}

void SessionSupervisor::reject(const UserCommand& cmd, ErrorKind kind, const std::string& message) {
    notice_ = std::string(commandKindStr(cmd.kind)) + " " + cmd.device_id + ": " + message;
    note(LogLevel::Warning, "Rejected %s", notice_.c_str());

    CommandRejectedEvent ev;
    ev.device_id = cmd.device_id;
    ev.command = commandKindStr(cmd.kind);
    ev.reason = errorKindStr(kind);
    events_.publish(ev);
}

// =============================================================================
// Sessions
// =============================================================================

void SessionSupervisor::startSession(const std::string& device_id) {
    const DeviceRecord* rec = devices_.find(device_id);
    if (!rec) return;

    Session& s = sessions_[device_id];
    s.device_id = device_id;
    s.failure_reason.clear();
    s.stop_requested = false;
    s.kill_sent = false;
    s.restart_pending = false;
    s.confirm_at.reset();
    s.stop_deadline.reset();
    s.started_at = std::chrono::system_clock::now();
    transition(s, SessionState::Starting);

    auto argv = buildCommandLine(rec->device);
    note(LogLevel::Launch, "Launching scrcpy for %s", rec->device.label.c_str());

    auto spawned = launcher_.spawn(device_id, argv);
    if (spawned.is_err()) {
        s.failure_reason = spawned.error().withContext("spawn failed").message;
        s.restart_count++;
        s.pid = -1;
        transition(s, SessionState::Failed);
        note(LogLevel::Error, "%s: %s", device_id.c_str(), s.failure_reason.c_str());
        return;
    }

    s.process = std::move(spawned.value());
    s.pid = s.process->pid();
    PLOG_INFO("supervisor", "%s: scrcpy pid %d", device_id.c_str(), s.pid);

    if (cfg_.spawn_confirm_ms <= 0) {
        if (s.process->isAlive()) {
            transition(s, SessionState::Running);
            note(LogLevel::Success, "Mirroring %s (pid %d)", device_id.c_str(), s.pid);
        }
        return;
    }
    s.confirm_at = now_() + std::chrono::milliseconds(cfg_.spawn_confirm_ms);
}

void SessionSupervisor::stopSession(Session& s, const char* why) {
    note(LogLevel::Info, "Stopping %s (%s)", s.device_id.c_str(), why);
    if (!s.process) {
        s.pid = -1;
        transition(s, SessionState::Stopped);
        return;
    }

    s.stop_requested = true;
    s.confirm_at.reset();
    transition(s, SessionState::Stopping);

    if (!s.process->terminate()) {
        // Already reaped; its exit event is on the way
        PLOG_DEBUG("supervisor", "%s: pid %d already gone", s.device_id.c_str(), s.pid);
        return;
    }
    if (cfg_.grace_period_ms <= 0) {
        s.kill_sent = true;
        s.process->kill();
        return;
    }
    s.stop_deadline = now_() + std::chrono::milliseconds(cfg_.grace_period_ms);
}

void SessionSupervisor::onOutput(const ProcessOutput& out) {
    note(LogLevel::Info, "[%s] %s", out.device_id.c_str(), out.line.c_str());
}

void SessionSupervisor::onExited(const ProcessExited& exited) {
    Session* s = findSession(exited.device_id);
    if (!s || !s->process || s->pid != exited.pid) {
        PLOG_DEBUG("supervisor", "Ignoring exit of stale pid %d for %s", exited.pid,
                   exited.device_id.c_str());
        return;
    }

    const std::string how = describeExit(exited.status);
    const bool expected = s->stop_requested || s->state == SessionState::Stopping;
    const bool restart = s->restart_pending;

    s->process.reset();
    s->pid = -1;
    s->confirm_at.reset();
    s->stop_deadline.reset();
    s->stop_requested = false;
    s->kill_sent = false;
    s->restart_pending = false;

    if (expected) {
        transition(*s, SessionState::Stopped);
        note(LogLevel::Info, "%s stopped (%s)", exited.device_id.c_str(), how.c_str());
        if (restart) {
            if (!shutting_down_ && devices_.isOnline(exited.device_id)) {
                startSession(exited.device_id);
            } else {
                note(LogLevel::Warning, "Restart of %s cancelled, device not online",
                     exited.device_id.c_str());
            }
        }
    } else if (!exited.status.signaled && exited.status.exit_code == 0) {
        transition(*s, SessionState::Stopped);
        note(LogLevel::Info, "scrcpy for %s exited", exited.device_id.c_str());
    } else {
        s->failure_reason = how;
        s->restart_count++;
        transition(*s, SessionState::Failed);
        note(LogLevel::Error, "scrcpy for %s failed: %s", exited.device_id.c_str(), how.c_str());
    }

    pruneDisconnected();
}

void SessionSupervisor::onShutdown(const char* why) {
    if (shutting_down_) return;
    shutting_down_ = true;
    note(LogLevel::Info, "Shutting down (%s)", why);

    for (auto& [id, s] : sessions_) {
        s.restart_pending = false;
        if (s.state == SessionState::Starting || s.state == SessionState::Running) {
            stopSession(s, "shutdown");
        }
    }
    shutdown_deadline_ = now_() + std::chrono::milliseconds(cfg_.grace_period_ms) + kShutdownSlack;

    events_.publish(ShutdownEvent{});
}

void SessionSupervisor::transition(Session& s, SessionState next) {
    if (s.state == next) return;
    const SessionState prev = s.state;
    s.state = next;
    PLOG_INFO("supervisor", "%s: %s -> %s%s%s", s.device_id.c_str(), sessionStateStr(prev),
              sessionStateStr(next), s.failure_reason.empty() ? "" : " : ",
              s.failure_reason.c_str());

    SessionStateEvent ev;
    ev.device_id = s.device_id;
    ev.old_state = sessionStateStr(prev);
    ev.new_state = sessionStateStr(next);
    ev.reason = s.failure_reason;
    events_.publish(ev);
}

SessionSupervisor::Session* SessionSupervisor::findSession(const std::string& device_id) {
    auto it = sessions_.find(device_id);
    return it != sessions_.end() ? &it->second : nullptr;
}

bool SessionSupervisor::hasLiveSession(const std::string& device_id) const {
    auto it = sessions_.find(device_id);
    return it != sessions_.end() && isLive(it->second.state);
}

// =============================================================================
// Log tail / Snapshot
// =============================================================================

void SessionSupervisor::note(LogLevel level, const char* fmt, ...) {
    char buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    log::write(fileLevelFor(level), "supervisor", "%s", buf);

    log_tail_.push_back(LogEntry{wallClockStamp(), level, buf});
    while (log_tail_.size() > static_cast<size_t>(cfg_.log_tail_size > 0 ? cfg_.log_tail_size : 1)) {
        log_tail_.pop_front();
    }
}

void SessionSupervisor::publish() {
    Snapshot snap;
    snap.devices = devices_.records();
    snap.sessions.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) {
        SessionInfo info;
        info.device_id = id;
        info.state = s.state;
        info.failure_reason = s.failure_reason;
        info.pid = s.pid;
        info.started_at = s.started_at;
        info.restart_count = s.restart_count;
        info.restart_pending = s.restart_pending;
        snap.sessions.push_back(std::move(info));
    }
    snap.log_tail.assign(log_tail_.begin(), log_tail_.end());
    snap.notice = notice_;
    snap.discovery_available = discovery_available_;
    snap.discovery_error = discovery_error_;
    snap.shutting_down = shutting_down_;

    if (!snap.consistent()) {
        PLOG_ERROR("supervisor", "Snapshot references a session without a device");
    }
    store_.publish(std::move(snap));
}

} // namespace pilot
