#include "snapshot.hpp"

#include <algorithm>
#include <atomic>

namespace pilot {

// =============================================================================
// Snapshot
// =============================================================================

const DeviceRecord* Snapshot::findDevice(const std::string& id) const {
    auto it = std::find_if(devices.begin(), devices.end(),
                           [&id](const DeviceRecord& r) { return r.device.id == id; });
    return it != devices.end() ? &*it : nullptr;
}

const SessionInfo* Snapshot::findSession(const std::string& id) const {
    auto it = std::find_if(sessions.begin(), sessions.end(),
                           [&id](const SessionInfo& s) { return s.device_id == id; });
    return it != sessions.end() ? &*it : nullptr;
}

size_t Snapshot::liveSessionCount() const {
    return static_cast<size_t>(std::count_if(sessions.begin(), sessions.end(),
                                             [](const SessionInfo& s) { return isLive(s.state); }));
}

bool Snapshot::consistent() const {
    return std::all_of(sessions.begin(), sessions.end(),
                       [this](const SessionInfo& s) { return findDevice(s.device_id) != nullptr; });
}

// =============================================================================
// SnapshotStore
// =============================================================================

SnapshotStore::SnapshotStore() : current_(std::make_shared<const Snapshot>()) {}

std::shared_ptr<const Snapshot> SnapshotStore::latest() const {
    return std::atomic_load(&current_);
}

uint64_t SnapshotStore::publish(Snapshot next) {
    // Single writer (the supervisor), so read-increment-store is race free
    next.version = std::atomic_load(&current_)->version + 1;
    auto published = std::make_shared<const Snapshot>(std::move(next));
    std::atomic_store(&current_, published);

    Observer observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(*published);
    return published->version;
}

uint64_t SnapshotStore::version() const {
    return std::atomic_load(&current_)->version;
}

void SnapshotStore::setObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

} // namespace pilot
