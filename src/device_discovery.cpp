#include "device_discovery.hpp"
#include "pilot_log.hpp"

#include <algorithm>
#include <iterator>
#include <chrono>
#include <sstream>

namespace pilot {

namespace {

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

// mDNS service records (e.g. adb-XXXX-abc._adb-tls-connect._tcp) duplicate a
// device that is also listed by its real address
bool isMdnsRecord(const std::string& id) {
    return id.rfind("adb-", 0) == 0 && id.find("._adb") != std::string::npos;
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

bool isKnownAdbState(const std::string& state) {
    // "no" opens "no permissions (...)"
    static const char* const kStates[] = {
        "device", "offline", "unauthorized", "recovery", "bootloader", "sideload",
        "rescue", "host", "no", "connecting", "authorizing",
    };
    return std::any_of(std::begin(kStates), std::end(kStates),
                       [&state](const char* s) { return state == s; });
}

DeviceState parseAdbState(const std::string& state) {
    if (state == "device") return DeviceState::Online;
    if (state == "unauthorized") return DeviceState::Unauthorized;
    return DeviceState::Offline;
}

Result<std::vector<Device>> parseAdbDevices(const std::string& output) {
    std::vector<Device> devices;
    bool saw_header = false;
    size_t skipped = 0;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
            line.pop_back();
        }
        if (line.empty()) continue;
        if (line.rfind("List of devices", 0) == 0) {
            saw_header = true;
            continue;
        }
        // "* daemon not running; starting now at tcp:5037"
        if (line[0] == '*') continue;

        // stderr is merged into the output: anything ahead of the header is
        // adb talking about itself ("adb server version (41) doesn't match...")
        if (!saw_header) {
            PLOG_DEBUG("discovery", "adb: %s", line.c_str());
            skipped++;
            continue;
        }

        auto tokens = splitWhitespace(line);
        if (tokens.size() < 2 || !isKnownAdbState(tokens[1])) {
            PLOG_WARN("discovery", "Skipping malformed line: [%s]", line.c_str());
            skipped++;
            continue;
        }

        const std::string& id = tokens[0];
        if (isMdnsRecord(id)) continue;
        if (!isValidAdbId(id)) {
            PLOG_WARN("discovery", "Skipping line with invalid device id: [%s]", line.c_str());
            skipped++;
            continue;
        }
        if (std::any_of(devices.begin(), devices.end(),
                        [&id](const Device& d) { return d.id == id; })) {
            continue;
        }

        Device dev;
        dev.id = id;
        dev.state = parseAdbState(tokens[1]);
        dev.transport = classifyTransport(id);

        // -l fields: usb:1-1 product:x model:Pixel_7 device:y transport_id:3
        for (size_t i = 2; i < tokens.size(); ++i) {
            const std::string& tok = tokens[i];
            if (tok.rfind("model:", 0) == 0 && tok.size() > 6) {
                dev.label = tok.substr(6);
                std::replace(dev.label.begin(), dev.label.end(), '_', ' ');
            } else if (tok.rfind("usb:", 0) == 0) {
                dev.transport = Transport::Usb;
            }
        }
        if (dev.label.empty()) dev.label = defaultLabel(id);

        devices.push_back(std::move(dev));
    }

    // Without the header there is no device list at all, only diagnostics;
    // reporting an empty list would read as every device disconnecting
    if (!saw_header) {
        return Err<std::vector<Device>>("unrecognized adb output (" +
                                        std::to_string(skipped) + " line(s), no device list)",
                                        ErrorKind::DiscoveryUnavailable);
    }
    return Ok(std::move(devices));
}

// =============================================================================
// DiscoveryPoller
// =============================================================================

DiscoveryPoller::DiscoveryPoller(std::string adb_path, config::DiscoveryConfig cfg,
                                 CommandChannel& channel, Runner runner)
    : adb_path_(std::move(adb_path)),
      cfg_(cfg),
      channel_(channel),
      runner_(std::move(runner)) {}

DiscoveryPoller::~DiscoveryPoller() {
    stop();
}

void DiscoveryPoller::start() {
    if (thread_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&DiscoveryPoller::loop, this);
    PLOG_INFO("discovery", "Poller started: %s every %dms (timeout %dms)",
              adb_path_.c_str(), cfg_.poll_interval_ms, cfg_.command_timeout_ms);
}

void DiscoveryPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        PLOG_INFO("discovery", "Poller stopped after %llu ticks",
                  (unsigned long long)tick_.load());
    }
}

Result<std::vector<Device>> DiscoveryPoller::pollOnce() {
    const uint64_t tick = ++tick_;

    auto fail = [this, tick](const Error& err) -> Result<std::vector<Device>> {
        PLOG_WARN("discovery", "tick %llu: discovery unavailable: %s",
                  (unsigned long long)tick, err.message.c_str());
        channel_.post(DiscoveryFailed{err.message, tick});
        return Error(err.message, ErrorKind::DiscoveryUnavailable, err.code);
    };

    auto run = runner_({adb_path_, "devices", "-l"}, cfg_.command_timeout_ms);
    if (run.is_err()) return fail(run.error());

    const CommandOutput& out = run.value();
    if (out.exit_code != 0) {
        std::string first_line = out.output.substr(0, out.output.find('\n'));
        return fail(Error("adb exited with code " + std::to_string(out.exit_code) +
                          (first_line.empty() ? "" : ": " + first_line),
                          ErrorKind::DiscoveryUnavailable, out.exit_code));
    }

    auto parsed = parseAdbDevices(out.output);
    if (parsed.is_err()) return fail(parsed.error());

    PLOG_DEBUG("discovery", "tick %llu: %zu device(s)",
               (unsigned long long)tick, parsed.value().size());
    channel_.post(DiscoveryUpdate{parsed.value(), tick});
    return parsed;
}

void DiscoveryPoller::loop() {
    const auto interval = std::chrono::milliseconds(cfg_.poll_interval_ms);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) break;
        }

        auto result = pollOnce();
        (void)result;  // already posted and logged

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) break;
    }
}

} // namespace pilot
