#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "lcr/optional.hpp"

namespace printlink::core::health {

enum class Status : std::uint8_t {
    Healthy,
    Warning,
    Error
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Healthy: return "healthy";
        case Status::Warning: return "warning";
        case Status::Error:   return "error";
        default:              return "unknown";
    }
}

// Recomputed on demand, never persisted
struct Snapshot {
    Status status{Status::Healthy};
    std::vector<std::string> issues{};
    lcr::optional<int> battery_level{};      // percent
    lcr::optional<int> signal_strength{};    // dBm
    double transmission_quality{0.0};
    bool initialized{false};
    bool connected{false};
    bool can_write{false};

    [[nodiscard]] inline bool healthy() const noexcept { return status == Status::Healthy; }
};

inline std::ostream& operator<<(std::ostream& os, const Snapshot& s) {
    os << to_string(s.status)
       << " (battery=" << lcr::to_string(s.battery_level)
       << ", rssi=" << lcr::to_string(s.signal_strength)
       << ", quality=" << s.transmission_quality
       << ", init=" << s.initialized
       << ", connected=" << s.connected
       << ", write=" << s.can_write << ")";
    for (const auto& issue : s.issues) {
        os << "\n  - " << issue;
    }
    return os;
}

} // namespace printlink::core::health
