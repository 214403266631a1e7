#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "printlink/core/clock.hpp"
#include "printlink/core/device.hpp"

namespace printlink::core::cache {

// -----------------------------------------------------------------------------
// DeviceInfoCache
// -----------------------------------------------------------------------------
// Last known record of each discovered device, keyed by id. Entries older
// than the cache lifetime are dropped by the governor sweep.
// -----------------------------------------------------------------------------
class DeviceInfoCache {
public:
    inline void put(const DeviceRecord& record, TimePoint now) {
        auto& slot = entries_[record.id];
        slot.record = record;
        slot.seen_at = now;
    }

    [[nodiscard]]
    inline const DeviceRecord* get(std::string_view id) const {
        auto it = entries_.find(std::string(id));
        return it == entries_.end() ? nullptr : &it->second.record;
    }

    // Drop entries not refreshed within ttl; returns entries removed
    inline std::size_t expire(TimePoint now, Millis ttl) {
        std::size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now - it->second.seen_at > ttl) {
                it = entries_.erase(it);
                ++removed;
            }
            else {
                ++it;
            }
        }
        return removed;
    }

    [[nodiscard]]
    inline std::vector<DeviceRecord> snapshot() const {
        std::vector<DeviceRecord> out;
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            out.push_back(entry.record);
        }
        return out;
    }

    inline void clear() noexcept { entries_.clear(); }

    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }

private:
    struct Slot {
        DeviceRecord record;
        TimePoint seen_at;
    };

    std::unordered_map<std::string, Slot> entries_{};
};

} // namespace printlink::core::cache
