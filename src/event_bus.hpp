#pragma once
// =============================================================================
// scrcpy-pilot - Event Bus
// =============================================================================
// Synchronous publish/subscribe for transient notifications coming out of the
// supervisor: rejected commands, session transitions, discovery status and
// shutdown. Authoritative state never travels here; it lives in the
// published Snapshot.
//
//   auto sub = pilot::bus().subscribe<CommandRejectedEvent>(
//       [](const CommandRejectedEvent& e) { ... });
//   pilot::bus().publish(ev);
//
// Handler lists are copy-on-write: publish() takes one shared_ptr copy under
// the lock and runs the handlers outside it, so a handler may subscribe or
// unsubscribe (itself included) without deadlocking.
// =============================================================================

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>
#include "pilot_log.hpp"

namespace pilot {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Session lifecycle (supervisor -> observers)
struct SessionStateEvent : Event {
    std::string device_id;
    std::string old_state;
    std::string new_state;
    std::string reason;     // failure reason, empty otherwise
};

// A user command was refused without changing state
struct CommandRejectedEvent : Event {
    std::string device_id;
    std::string command;    // "start", "stop", ...
    std::string reason;     // "InvalidTarget", "AlreadyActive", ...
};

// Discovery availability flipped (adb timed out / recovered)
struct DiscoveryStatusEvent : Event {
    bool available = true;
    std::string reason;
};

struct ShutdownEvent : Event {};

// =============================================================================
// Bus internals
// =============================================================================

namespace detail {

struct Handler {
    uint64_t id;
    std::function<void(const Event&)> fn;
};

using HandlerList = std::vector<Handler>;

struct BusState {
    std::mutex mutex;
    std::unordered_map<std::type_index, std::shared_ptr<const HandlerList>> lists;
    uint64_t next_id = 1;

    void remove(std::type_index key, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = lists.find(key);
        if (it == lists.end()) return;
        auto next = std::make_shared<HandlerList>();
        for (const auto& h : *it->second) {
            if (h.id != id) next->push_back(h);
        }
        if (next->empty()) lists.erase(it);
        else it->second = std::move(next);
    }
};

} // namespace detail

// =============================================================================
// SubscriptionHandle - unsubscribes on destruction
// =============================================================================
// Holds the bus state weakly: a handle that outlives its bus does nothing.

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    SubscriptionHandle(std::weak_ptr<detail::BusState> state, std::type_index key, uint64_t id)
        : state_(std::move(state)), key_(key), id_(id) {}
    ~SubscriptionHandle() { reset(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept
        : state_(std::move(o.state_)), key_(o.key_), id_(o.id_) {
        o.id_ = 0;
    }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (this != &o) {
            reset();
            state_ = std::move(o.state_);
            key_ = o.key_;
            id_ = o.id_;
            o.id_ = 0;
        }
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    // Unsubscribe now
    void reset() {
        if (id_ == 0) return;
        const uint64_t id = id_;
        id_ = 0;
        if (auto state = state_.lock()) state->remove(key_, id);
        state_.reset();
    }

    bool active() const { return id_ != 0 && !state_.expired(); }

private:
    std::weak_ptr<detail::BusState> state_;
    std::type_index key_ = std::type_index(typeid(void));
    uint64_t id_ = 0;
};

// =============================================================================
// EventBus
// =============================================================================

class EventBus {
public:
    EventBus() : state_(std::make_shared<detail::BusState>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");
        const std::type_index key(typeid(T));

        std::lock_guard<std::mutex> lock(state_->mutex);
        const uint64_t id = state_->next_id++;

        auto next = std::make_shared<detail::HandlerList>();
        auto it = state_->lists.find(key);
        if (it != state_->lists.end()) *next = *it->second;
        next->push_back({id, [handler = std::move(handler)](const Event& e) {
            handler(static_cast<const T&>(e));
        }});
        state_->lists[key] = std::move(next);

        return SubscriptionHandle(state_, key, id);
    }

    // Runs every handler subscribed to T on the calling thread. A throwing
    // handler is logged and skipped. Returns the number of handlers run.
    template<typename T>
    size_t publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::shared_ptr<const detail::HandlerList> list;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            auto it = state_->lists.find(std::type_index(typeid(T)));
            if (it == state_->lists.end()) return 0;
            list = it->second;
        }

        for (const auto& h : *list) {
            try {
                h.fn(event);
            } catch (const std::exception& e) {
                PLOG_ERROR("eventbus", "Handler %llu for %s threw: %s",
                           (unsigned long long)h.id, typeid(T).name(), e.what());
            }
        }
        return list->size();
    }

    template<typename T>
    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->lists.find(std::type_index(typeid(T)));
        return it == state_->lists.end() ? 0 : it->second->size();
    }

private:
    std::shared_ptr<detail::BusState> state_;
};

// Process-wide bus; components take an EventBus& so tests can use their own
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace pilot
