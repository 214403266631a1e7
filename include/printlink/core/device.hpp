#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "lcr/optional.hpp"

namespace printlink::core {

// -----------------------------------------------------------------------------
// DeviceRecord
// -----------------------------------------------------------------------------
// Produced by discovery. Immutable per scan cycle and keyed by id (the
// platform device identity, never a pointer).
// -----------------------------------------------------------------------------
struct DeviceRecord {
    std::string id;
    std::string display_name;
    lcr::optional<int> signal_strength{};                    // RSSI in dBm
    lcr::optional<std::vector<std::uint8_t>> raw_advertisement{};

    [[nodiscard]]
    friend bool operator==(const DeviceRecord& a, const DeviceRecord& b) {
        return a.id == b.id
            && a.display_name == b.display_name
            && a.signal_strength == b.signal_strength
            && a.raw_advertisement == b.raw_advertisement;
    }
};

// GATT endpoint used for writes, notifications and battery reads
struct GattEndpoint {
    std::string service;
    std::string characteristic;
};

} // namespace printlink::core
