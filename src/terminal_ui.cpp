#include "terminal_ui.hpp"
#include "pilot_log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace pilot {

namespace {

// ANSI
constexpr const char* kReset   = "\x1b[0m";
constexpr const char* kBold    = "\x1b[1m";
constexpr const char* kInverse = "\x1b[7m";
constexpr const char* kRed     = "\x1b[31m";
constexpr const char* kGreen   = "\x1b[32m";
constexpr const char* kYellow  = "\x1b[33m";
constexpr const char* kBlue    = "\x1b[34m";
constexpr const char* kMagenta = "\x1b[35m";
constexpr const char* kCyan    = "\x1b[36m";
constexpr const char* kDim     = "\x1b[2m";

constexpr const char* kHelp =
    "up/down or j/k select  enter/s start  x stop  r restart  a ack  q quit";

void writeAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        off += static_cast<size_t>(n);
    }
}

std::string clip(const std::string& text, int cols) {
    if (cols <= 0) return std::string();
    if (text.size() <= static_cast<size_t>(cols)) return text;
    return text.substr(0, static_cast<size_t>(cols));
}

// Clip first, then wrap in color so escape codes never count as columns
std::string paint(const std::string& text, int cols, const char* style, bool color) {
    std::string visible = clip(text, cols);
    if (!color || !style || visible.empty()) return visible;
    return std::string(style) + visible + kReset;
}

const char* sessionColor(SessionState s) {
    switch (s) {
        case SessionState::Starting: return kYellow;
        case SessionState::Running:  return kGreen;
        case SessionState::Stopping: return kYellow;
        case SessionState::Stopped:  return kDim;
        case SessionState::Failed:   return kRed;
    }
    return nullptr;
}

const char* logColor(LogLevel l) {
    switch (l) {
        case LogLevel::Info:    return nullptr;
        case LogLevel::Success: return kGreen;
        case LogLevel::Warning: return kYellow;
        case LogLevel::Error:   return kRed;
        case LogLevel::Device:  return kCyan;
        case LogLevel::Launch:  return kMagenta;
    }
    return nullptr;
}

int selectedIndex(const UiState& state, const Snapshot& snap) {
    for (size_t i = 0; i < snap.devices.size(); i++) {
        if (snap.devices[i].device.id == state.selected_id) return static_cast<int>(i);
    }
    return -1;
}

// -----------------------------------------------------------------------------
// Runtime terminal guards (RAII)
// -----------------------------------------------------------------------------

class RawTermGuard {
public:
    RawTermGuard() {
        if (tcgetattr(STDIN_FILENO, &old_) != 0) return;
        termios raw = old_;
        // ISIG stays on: Ctrl-C still raises SIGINT, which shuts down cleanly
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) return;
        old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
        fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
        active_ = true;
    }
    ~RawTermGuard() {
        if (!active_) return;
        tcsetattr(STDIN_FILENO, TCSANOW, &old_);
        fcntl(STDIN_FILENO, F_SETFL, old_flags_);
    }
    RawTermGuard(const RawTermGuard&) = delete;
    RawTermGuard& operator=(const RawTermGuard&) = delete;

    bool active() const { return active_; }

private:
    bool active_ = false;
    termios old_{};
    int old_flags_ = 0;
};

class AltScreenGuard {
public:
    AltScreenGuard() { writeAll(STDOUT_FILENO, "\x1b[?1049h\x1b[?25l\x1b[2J\x1b[H"); }
    ~AltScreenGuard() { writeAll(STDOUT_FILENO, "\x1b[0m\x1b[?25h\x1b[?1049l"); }
    AltScreenGuard(const AltScreenGuard&) = delete;
    AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

void terminalSize(int& rows, int& cols) {
    struct winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
        rows = ws.ws_row;
        cols = ws.ws_col;
        return;
    }
    rows = 24;
    cols = 80;
}

} // namespace

// =============================================================================
// Input
// =============================================================================

namespace {

Key arrowKey(char final_byte) {
    if (final_byte == 'A') return Key::Up;
    if (final_byte == 'B') return Key::Down;
    return Key::Unknown;
}

} // namespace

PollInput classifyPoll(short revents) {
    if (revents & POLLIN) return PollInput::Data;
    if (revents & (POLLHUP | POLLERR | POLLNVAL)) return PollInput::Closed;
    return PollInput::None;
}

std::vector<Key> decodeKeys(const std::string& bytes) {
    std::vector<Key> keys;
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = static_cast<unsigned char>(bytes[i++]);
        if (c == 0x1b) {
            // SS3 arrows: ESC O A
            if (i + 1 < bytes.size() && bytes[i] == 'O') {
                keys.push_back(arrowKey(bytes[i + 1]));
                i += 2;
                continue;
            }
            // CSI: ESC [ <params 0x20-0x3F>* <final 0x40-0x7E>, e.g. ESC [ 1 ; 5 A
            if (i < bytes.size() && bytes[i] == '[') {
                size_t j = i + 1;
                while (j < bytes.size() && bytes[j] >= 0x20 && bytes[j] <= 0x3f) ++j;
                if (j < bytes.size() && bytes[j] >= 0x40 && bytes[j] <= 0x7e) {
                    keys.push_back(arrowKey(bytes[j]));
                    i = j + 1;
                } else {
                    // Truncated sequence: drop the rest of the read
                    keys.push_back(Key::Unknown);
                    i = bytes.size();
                }
                continue;
            }
            keys.push_back(Key::Quit);   // bare Esc
            continue;
        }
        switch (c) {
            case 'k': case 'K':             keys.push_back(Key::Up); break;
            case 'j': case 'J':             keys.push_back(Key::Down); break;
            case '\r': case '\n':
            case 's': case 'S':             keys.push_back(Key::Start); break;
            case 'x': case 'X':             keys.push_back(Key::Stop); break;
            case 'r': case 'R':             keys.push_back(Key::Restart); break;
            case 'a': case 'A':             keys.push_back(Key::Acknowledge); break;
            case 'q': case 'Q': case 0x03:  keys.push_back(Key::Quit); break;
            default:                        keys.push_back(Key::Unknown); break;
        }
    }
    return keys;
}

void clampSelection(UiState& state, const Snapshot& snap) {
    if (snap.devices.empty()) {
        state.selected_id.clear();
        return;
    }
    if (selectedIndex(state, snap) < 0) state.selected_id = snap.devices.front().device.id;
}

std::vector<UserCommand> translateInput(const std::string& bytes, UiState& state,
                                        const Snapshot& snap) {
    std::vector<UserCommand> commands;
    clampSelection(state, snap);

    for (Key key : decodeKeys(bytes)) {
        int idx = selectedIndex(state, snap);
        int count = static_cast<int>(snap.devices.size());
        switch (key) {
            case Key::Up:
                if (idx > 0) state.selected_id = snap.devices[idx - 1].device.id;
                break;
            case Key::Down:
                if (idx >= 0 && idx + 1 < count) state.selected_id = snap.devices[idx + 1].device.id;
                break;
            case Key::Start:
            case Key::Stop:
            case Key::Restart:
            case Key::Acknowledge: {
                if (state.selected_id.empty()) break;
                UserCommand cmd;
                cmd.device_id = state.selected_id;
                cmd.kind = key == Key::Start   ? CommandKind::Start
                         : key == Key::Stop    ? CommandKind::Stop
                         : key == Key::Restart ? CommandKind::Restart
                                               : CommandKind::Acknowledge;
                commands.push_back(cmd);
                break;
            }
            case Key::Quit: {
                UserCommand cmd;
                cmd.kind = CommandKind::Quit;
                commands.push_back(cmd);
                return commands;
            }
            case Key::Unknown:
                break;
        }
    }
    return commands;
}

// =============================================================================
// Rendering
// =============================================================================

std::vector<std::string> renderFrame(const Snapshot& snap, const UiState& state,
                                     int rows, int cols, bool color) {
    std::vector<std::string> lines;
    if (rows <= 0 || cols <= 0) return lines;

    auto add = [&](const std::string& text, const char* style) {
        if (static_cast<int>(lines.size()) < rows) lines.push_back(paint(text, cols, style, color));
    };

    char buf[512];

    // Header + status
    snprintf(buf, sizeof(buf), " %s %s", config::APP_NAME, config::APP_VERSION);
    std::string header = buf;
    if (header.size() < static_cast<size_t>(cols)) header.append(cols - header.size(), ' ');
    add(header, color ? kInverse : nullptr);

    std::string status;
    if (snap.shutting_down) {
        snprintf(buf, sizeof(buf), " Shutting down... %zu session(s) still stopping",
                 snap.liveSessionCount());
        status = buf;
        add(status, kYellow);
    } else if (!snap.discovery_available) {
        status = " adb: unavailable (" + snap.discovery_error + ")";
        add(status, kRed);
    } else {
        snprintf(buf, sizeof(buf), " adb: ok   devices: %zu   mirroring: %zu",
                 snap.devices.size(), snap.liveSessionCount());
        add(buf, kGreen);
    }
    add("", nullptr);

    // Device list
    snprintf(buf, sizeof(buf), "   %-22s %-4s %-24s %-12s %-9s %7s %3s  %s", "SERIAL", "TYPE",
             "LABEL", "DEVICE", "SESSION", "PID", "ERR", "INFO");
    add(buf, kBold);

    if (snap.devices.empty()) {
        add("   No devices. Connect one with USB debugging enabled.", kDim);
    }
    for (const auto& rec : snap.devices) {
        const Device& dev = rec.device;
        const SessionInfo* s = snap.findSession(dev.id);
        SessionState st = s ? s->state : SessionState::Stopped;

        std::string pid = (s && s->pid > 0) ? std::to_string(s->pid) : "-";
        std::string info;
        if (s && st == SessionState::Failed) info = s->failure_reason;
        else if (s && s->restart_pending) info = "restarting";
        else if (rec.missed_polls > 0) info = "missing";

        const bool selected = dev.id == state.selected_id;
        snprintf(buf, sizeof(buf), " %s %-22.22s %-4s %-24.24s %-12s %-9s %7s %3d  %s",
                 selected ? ">" : " ", dev.id.c_str(), transportStr(dev.transport),
                 dev.label.c_str(), deviceStateStr(dev.state), sessionStateStr(st),
                 pid.c_str(), s ? s->restart_count : 0, info.c_str());

        const char* style = selected && color ? kInverse : sessionColor(st);
        add(buf, style);
    }
    add("", nullptr);

    if (!snap.notice.empty()) add(" ! " + snap.notice, kYellow);
    add(std::string(" ") + kHelp, kDim);
    add("", nullptr);

    // Log tail, newest first, whatever fits
    add(" Log", kBold);
    for (auto it = snap.log_tail.rbegin(); it != snap.log_tail.rend(); ++it) {
        if (static_cast<int>(lines.size()) >= rows) break;
        std::string line = " " + it->timestamp + " [" + logLevelStr(it->level) + "] " + it->message;
        add(line, logColor(it->level));
    }
    return lines;
}

// =============================================================================
// TerminalUi
// =============================================================================

TerminalUi::TerminalUi(const config::UiConfig& cfg, SnapshotStore& store,
                       CommandChannel& channel, EventBus& events)
    : cfg_(cfg), store_(store), channel_(channel), events_(events) {}

void TerminalUi::drawFrame(const Snapshot& snap) {
    int rows = 0, cols = 0;
    terminalSize(rows, cols);
    clampSelection(state_, snap);

    std::string out = "\x1b[H";
    for (const auto& line : renderFrame(snap, state_, rows, cols)) {
        out += line;
        out += "\x1b[K\r\n";
    }
    out += "\x1b[J";
    if (bell_.exchange(false)) out += "\a";
    writeAll(STDOUT_FILENO, out);
}

Result<void> TerminalUi::run(const std::atomic<bool>& stop, const std::atomic<bool>& interrupted) {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        return Err<void>("stdin/stdout is not a terminal", ErrorKind::Io);
    }

    auto rejected = events_.subscribe<CommandRejectedEvent>(
        [this](const CommandRejectedEvent&) { bell_ = true; });

    RawTermGuard raw;
    if (!raw.active()) {
        return Err<void>(std::string("cannot enter raw mode: ") + strerror(errno), ErrorKind::Io);
    }
    AltScreenGuard alt;
    PLOG_INFO("ui", "Terminal UI started (refresh %d ms)", cfg_.refresh_ms);

    bool shutdown_posted = false;
    bool input_open = true;
    while (!stop.load()) {
        if (interrupted.load() && !shutdown_posted) {
            shutdown_posted = true;
            channel_.post(ShutdownRequest{});
        }

        auto snap = store_.latest();
        drawFrame(*snap);

        // fd -1 is ignored by poll(), which then only waits out the frame
        struct pollfd pfd{};
        pfd.fd = input_open ? STDIN_FILENO : -1;
        pfd.events = POLLIN;
        int rv = ::poll(&pfd, 1, cfg_.refresh_ms);
        if (rv < 0) {
            if (errno == EINTR) continue;
            return Err<void>(std::string("poll failed: ") + strerror(errno), ErrorKind::Io);
        }
        if (rv == 0) continue;

        PollInput ready = classifyPoll(pfd.revents);
        ssize_t n = 0;
        char buf[64];
        if (ready == PollInput::Data) {
            n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
            if (n <= 0) ready = PollInput::Closed;
        }
        if (ready == PollInput::Closed) {
            // The terminal hung up; stop polling it and shut down like SIGHUP
            if (input_open) {
                PLOG_WARN("ui", "Terminal input closed, requesting shutdown");
                input_open = false;
            }
            if (!shutdown_posted) {
                shutdown_posted = true;
                channel_.post(ShutdownRequest{});
            }
            continue;
        }
        if (ready == PollInput::None) continue;

        // Commands are resolved against the snapshot the user was looking at
        for (const auto& cmd : translateInput(std::string(buf, static_cast<size_t>(n)), state_, *snap)) {
            if (cmd.kind == CommandKind::Quit) {
                if (shutdown_posted) continue;
                shutdown_posted = true;
            }
            if (!channel_.post(cmd)) {
                PLOG_WARN("ui", "Command channel closed, dropping %s", commandKindStr(cmd.kind));
            }
        }
    }

    PLOG_INFO("ui", "Terminal UI stopped");
    return Ok();
}

} // namespace pilot
