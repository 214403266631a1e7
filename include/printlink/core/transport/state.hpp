#pragma once

#include <cstdint>
#include <string_view>

namespace printlink::core::transport {

// ===============================================================
// LINK STATE ENUM
// ===============================================================
//
// WaitingReconnect is a refinement of Disconnected: no device is
// connected, but a backoff timer is armed for the next attempt.
//
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    WaitingReconnect
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:     return "Disconnected";
        case State::Connecting:       return "Connecting";
        case State::Connected:        return "Connected";
        case State::Disconnecting:    return "Disconnecting";
        case State::WaitingReconnect: return "WaitingReconnect";
        default:                      return "Unknown";
    }
}

// The public four-state view (WaitingReconnect reads as Disconnected)
[[nodiscard]]
inline constexpr State public_state(State s) noexcept {
    return s == State::WaitingReconnect ? State::Disconnected : s;
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : std::uint8_t {
    // --- Caller intent ---
    OpenRequested,
    CloseRequested,

    // --- Adapter outcomes ---
    AdapterConnected,
    AdapterConnectFailed,       // open() path
    AdapterReconnectFailed,     // reconnect path
    AdapterDisconnected,        // close() completed
    LinkLost,                   // unexpected drop while connected

    // --- Retry ---
    RetryScheduled,             // explicit recovery cycle from Disconnected
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:          return "OpenRequested";
        case Event::CloseRequested:         return "CloseRequested";
        case Event::AdapterConnected:       return "AdapterConnected";
        case Event::AdapterConnectFailed:   return "AdapterConnectFailed";
        case Event::AdapterReconnectFailed: return "AdapterReconnectFailed";
        case Event::AdapterDisconnected:    return "AdapterDisconnected";
        case Event::LinkLost:               return "LinkLost";
        case Event::RetryScheduled:         return "RetryScheduled";
        case Event::RetryTimerExpired:      return "RetryTimerExpired";
        default:                            return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : std::uint8_t {
    None,
    LocalClose,     // explicit close()
    LinkLost,       // adapter reported the device gone
    Exhausted       // reconnect attempts used up
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:       return "None";
        case DisconnectReason::LocalClose: return "LocalClose";
        case DisconnectReason::LinkLost:   return "LinkLost";
        case DisconnectReason::Exhausted:  return "Exhausted";
        default:                           return "Unknown";
    }
}

} // namespace printlink::core::transport
