#include "device_table.hpp"
#include "pilot_log.hpp"

#include <set>

namespace pilot {

DeviceTable::DeviceTable(int debounce_ticks)
    : debounce_ticks_(debounce_ticks < 1 ? 1 : debounce_ticks) {}

DeviceTable::Delta DeviceTable::apply(const std::vector<Device>& seen) {
    Delta delta;
    std::set<std::string> seen_ids;

    for (const auto& dev : seen) {
        seen_ids.insert(dev.id);
        auto it = records_.find(dev.id);
        if (it == records_.end()) {
            records_[dev.id] = DeviceRecord{dev, 0};
            delta.added.push_back(dev.id);
            PLOG_INFO("devices", "New device: %s (%s, %s, %s)", dev.id.c_str(),
                      dev.label.c_str(), transportStr(dev.transport), deviceStateStr(dev.state));
            continue;
        }

        DeviceRecord& rec = it->second;
        if (rec.missed_polls > 0) {
            delta.reappeared.push_back(dev.id);
            PLOG_INFO("devices", "%s back after %d missed poll(s)", dev.id.c_str(), rec.missed_polls);
        }
        if (rec.device != dev) {
            delta.changed.push_back(dev.id);
            PLOG_INFO("devices", "%s: %s -> %s", dev.id.c_str(),
                      deviceStateStr(rec.device.state), deviceStateStr(dev.state));
        }
        rec.device = dev;
        rec.missed_polls = 0;
    }

    for (auto& [id, rec] : records_) {
        if (seen_ids.count(id)) continue;
        rec.missed_polls++;
        if (rec.missed_polls == debounce_ticks_) {
            delta.disconnected.push_back(id);
            PLOG_INFO("devices", "%s disconnected (absent %d polls)", id.c_str(), rec.missed_polls);
        } else if (rec.missed_polls < debounce_ticks_) {
            delta.missing.push_back(id);
            PLOG_DEBUG("devices", "%s missing from poll (%d/%d)", id.c_str(),
                       rec.missed_polls, debounce_ticks_);
        }
    }

    return delta;
}

const DeviceRecord* DeviceTable::find(const std::string& id) const {
    auto it = records_.find(id);
    return (it != records_.end()) ? &it->second : nullptr;
}

bool DeviceTable::isOnline(const std::string& id) const {
    const DeviceRecord* rec = find(id);
    return rec && rec->missed_polls == 0 && rec->device.isOnline();
}

bool DeviceTable::remove(const std::string& id) {
    if (records_.erase(id) > 0) {
        PLOG_INFO("devices", "Removed %s", id.c_str());
        return true;
    }
    return false;
}

std::vector<DeviceRecord> DeviceTable::records() const {
    std::vector<DeviceRecord> result;
    result.reserve(records_.size());
    for (const auto& [id, rec] : records_) {
        result.push_back(rec);
    }
    return result;
}

std::vector<std::string> DeviceTable::disconnectedIds() const {
    std::vector<std::string> result;
    for (const auto& [id, rec] : records_) {
        if (rec.missed_polls >= debounce_ticks_) result.push_back(id);
    }
    return result;
}

} // namespace pilot
