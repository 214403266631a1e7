#pragma once

#include <string>
#include <string_view>
#include <cstdint>

#include "printlink/core/device.hpp"

namespace printlink::core::adapter {

// ===============================================================
// ADAPTER EVENTS
// ===============================================================
//
// Control-plane facts pushed by an adapter backend and drained by the
// Link through poll_event(). They replace the platform callbacks
// (adapter state change, device found, connection state change).
//
enum class EventType : std::uint8_t {
    None,
    AdapterStateChanged,     // available = radio usable
    DeviceFound,             // device = discovered record
    ConnectionStateChanged   // device.id + connected
};

struct Event {
    EventType type{EventType::None};
    bool available{false};
    bool connected{false};
    DeviceRecord device{};
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::None:                   return "None";
        case EventType::AdapterStateChanged:    return "AdapterStateChanged";
        case EventType::DeviceFound:            return "DeviceFound";
        case EventType::ConnectionStateChanged: return "ConnectionStateChanged";
        default:                                return "Unknown";
    }
}

} // namespace printlink::core::adapter
