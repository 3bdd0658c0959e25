#pragma once
#include <map>
#include <string>
#include <vector>
#include "device.hpp"

namespace pilot {

// =============================================================================
// DeviceRecord: one known device plus its debounce bookkeeping
// =============================================================================
struct DeviceRecord {
    Device device;
    int missed_polls = 0;       // consecutive successful polls without this id
};

// =============================================================================
// DeviceTable: the supervisor's view of every known device
// =============================================================================
// Not thread-safe. Owned and mutated only by the supervisor loop.
class DeviceTable {
public:
    // What one discovery tick changed
    struct Delta {
        std::vector<std::string> added;
        std::vector<std::string> changed;       // state or label differs
        std::vector<std::string> missing;       // absent, still within debounce
        std::vector<std::string> disconnected;  // reached the debounce threshold this tick
        std::vector<std::string> reappeared;    // present again after >= 1 miss
    };

    explicit DeviceTable(int debounce_ticks = 2);

    // Merge one successful enumeration. Records are never removed here;
    // the supervisor removes disconnected ones once no session holds them.
    Delta apply(const std::vector<Device>& seen);

    const DeviceRecord* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    // Known, present at the last poll, and in adb state "device"
    bool isOnline(const std::string& id) const;

    bool remove(const std::string& id);

    // Ordered by id
    std::vector<DeviceRecord> records() const;

    // Absent for at least debounce_ticks consecutive polls
    std::vector<std::string> disconnectedIds() const;

    size_t size() const { return records_.size(); }
    int debounceTicks() const { return debounce_ticks_; }

private:
    int debounce_ticks_;
    std::map<std::string, DeviceRecord> records_;
};

} // namespace pilot
