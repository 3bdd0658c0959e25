#pragma once
// =============================================================================
// scrcpy-pilot - Command Channel
// =============================================================================
// The single FIFO feeding the supervisor loop. Producers (discovery poller,
// child watchers, UI, signal handling) post from any thread; the supervisor
// is the only consumer and drains one event at a time in arrival order.
// =============================================================================

#include <sys/types.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "child_process.hpp"
#include "device.hpp"

namespace pilot {

// =============================================================================
// Event Types
// =============================================================================

// Successful enumeration tick
struct DiscoveryUpdate {
    std::vector<Device> devices;
    uint64_t tick = 0;
};

// Enumeration unavailable this tick; the previous device set stays valid
struct DiscoveryFailed {
    std::string reason;
    uint64_t tick = 0;
};

enum class CommandKind { Start, Stop, Restart, Acknowledge, Quit };

inline const char* commandKindStr(CommandKind k) {
    switch (k) {
        case CommandKind::Start:       return "start";
        case CommandKind::Stop:        return "stop";
        case CommandKind::Restart:     return "restart";
        case CommandKind::Acknowledge: return "acknowledge";
        case CommandKind::Quit:        return "quit";
    }
    return "?";
}

struct UserCommand {
    CommandKind kind = CommandKind::Start;
    std::string device_id;          // empty for Quit
};

// One line of merged scrcpy stdout/stderr
struct ProcessOutput {
    std::string device_id;
    pid_t pid = -1;
    std::string line;
};

struct ProcessExited {
    std::string device_id;
    pid_t pid = -1;
    ExitStatus status;
};

// SIGINT/SIGTERM or end of the UI loop
struct ShutdownRequest {};

using SupervisorEvent = std::variant<DiscoveryUpdate, DiscoveryFailed, UserCommand,
                                     ProcessOutput, ProcessExited, ShutdownRequest>;

// =============================================================================
// CommandChannel
// =============================================================================

class CommandChannel {
public:
    using Clock = std::chrono::steady_clock;

    CommandChannel() = default;
    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    // Returns false once the channel is closed
    bool post(SupervisorEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
        return true;
    }

    // Block until an event arrives, the deadline passes, or the channel is
    // closed and drained
    std::optional<SupervisorEvent> waitPop(Clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return !queue_.empty() || closed_; });
        return popLocked();
    }

    std::optional<SupervisorEvent> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    // Refuse further posts and wake the consumer; queued events stay poppable
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<SupervisorEvent> popLocked() {
        if (queue_.empty()) return std::nullopt;
        SupervisorEvent event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SupervisorEvent> queue_;
    bool closed_ = false;
};

} // namespace pilot
