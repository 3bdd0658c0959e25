#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "command_channel.hpp"
#include "config_loader.hpp"
#include "device.hpp"
#include "result.hpp"
#include "subprocess.hpp"

namespace pilot {

/**
 * Parse `adb devices -l` (or plain `adb devices`) output.
 *
 * Blank lines and "* daemon ..." chatter are ignored. Device lines count
 * only after the "List of devices attached" header; anything before it is
 * adb's own stderr. Lines with an unknown state word, mDNS service records
 * and lines whose id fails validation are skipped and logged.
 * Returns DiscoveryUnavailable when the header never appears, so a garbled
 * run is never mistaken for "all devices gone".
 */
Result<std::vector<Device>> parseAdbDevices(const std::string& output);

// "device" -> Online, "unauthorized" -> Unauthorized, everything else -> Offline
DeviceState parseAdbState(const std::string& state);

// The state words adb prints in the second column
bool isKnownAdbState(const std::string& state);

/**
 * Device Discovery Poller
 * Runs `adb devices -l` on its own thread every poll interval and posts one
 * DiscoveryUpdate or DiscoveryFailed per tick onto the command channel.
 */
class DiscoveryPoller {
public:
    using Runner = std::function<Result<CommandOutput>(const std::vector<std::string>& argv,
                                                       int timeout_ms)>;

    DiscoveryPoller(std::string adb_path, config::DiscoveryConfig cfg,
                    CommandChannel& channel, Runner runner = runCommand);
    ~DiscoveryPoller();

    DiscoveryPoller(const DiscoveryPoller&) = delete;
    DiscoveryPoller& operator=(const DiscoveryPoller&) = delete;

    void start();

    // Wakes the poll thread immediately and joins it
    void stop();

    // One enumeration tick (also used by the thread). Posts the result.
    Result<std::vector<Device>> pollOnce();

    uint64_t ticks() const { return tick_.load(); }

private:
    void loop();

    const std::string adb_path_;
    const config::DiscoveryConfig cfg_;
    CommandChannel& channel_;
    Runner runner_;

    std::atomic<uint64_t> tick_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;   // guarded by mutex_
    std::thread thread_;
};

} // namespace pilot
