#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "printlink/core/error.hpp"
#include "printlink/core/stats/transmission.hpp"

namespace printlink::core {

// Identifies a submission whose outcome is delivered later (0 = no ticket)
using Ticket = std::uint64_t;

inline constexpr Ticket NO_TICKET = 0;

// Immediate answer of a submitting operation
struct Submission {
    Error error{Error::None};
    Ticket ticket{NO_TICKET};

    [[nodiscard]] inline bool accepted() const noexcept { return error == Error::None; }
};

// -----------------------------------------------------------------------------
// Completion
// -----------------------------------------------------------------------------
// Terminal outcome of a ticketed submission (chunked write, batch, queued
// command). Exactly one completion is produced per accepted ticket, except
// for commands discarded by clear_command_queue(false).
// -----------------------------------------------------------------------------
struct Completion {
    Ticket ticket{NO_TICKET};
    Error error{Error::None};
    std::uint32_t attempts{0};          // delivery attempts (queued commands)
    std::uint32_t failed_count{0};      // failed commands (batches)
    stats::TransmissionStats stats{};

    [[nodiscard]] inline bool ok() const noexcept { return error == Error::None; }
};

// ===============================================================
// NOTICES
// ===============================================================
//
// Structured notification channel (kind + context). Link-wide facts and
// per-submission failures share the channel; `error` tells them apart.
//
enum class NoticeKind : std::uint8_t {
    AdapterStateChanged,
    DeviceFound,
    Connected,
    Disconnected,
    ReconnectScheduled,
    Reconnected,
    ReconnectExhausted,
    Restored,
    RestoreFailed,
    CommandFailed,
    QueueFull,
    QueueCleared,
    SignalWeak,
    QualityPoor,
    HealthRecovered,
    BatteryLow,
    BatteryCritical,
    Optimized,
    PowerModeChanged,
    IdleEntered,
    IdleLeft
};

[[nodiscard]]
inline constexpr std::string_view to_string(NoticeKind k) noexcept {
    switch (k) {
        case NoticeKind::AdapterStateChanged: return "AdapterStateChanged";
        case NoticeKind::DeviceFound:         return "DeviceFound";
        case NoticeKind::Connected:           return "Connected";
        case NoticeKind::Disconnected:        return "Disconnected";
        case NoticeKind::ReconnectScheduled:  return "ReconnectScheduled";
        case NoticeKind::Reconnected:         return "Reconnected";
        case NoticeKind::ReconnectExhausted:  return "ReconnectExhausted";
        case NoticeKind::Restored:            return "Restored";
        case NoticeKind::RestoreFailed:       return "RestoreFailed";
        case NoticeKind::CommandFailed:       return "CommandFailed";
        case NoticeKind::QueueFull:           return "QueueFull";
        case NoticeKind::QueueCleared:        return "QueueCleared";
        case NoticeKind::SignalWeak:          return "SignalWeak";
        case NoticeKind::QualityPoor:         return "QualityPoor";
        case NoticeKind::HealthRecovered:     return "HealthRecovered";
        case NoticeKind::BatteryLow:          return "BatteryLow";
        case NoticeKind::BatteryCritical:     return "BatteryCritical";
        case NoticeKind::Optimized:           return "Optimized";
        case NoticeKind::PowerModeChanged:    return "PowerModeChanged";
        case NoticeKind::IdleEntered:         return "IdleEntered";
        case NoticeKind::IdleLeft:            return "IdleLeft";
        default:                              return "Unknown";
    }
}

struct Notice {
    NoticeKind kind{NoticeKind::AdapterStateChanged};
    Error error{Error::None};
    std::string device_id{};
    std::string message{};
    Ticket ticket{NO_TICKET};
};

} // namespace printlink::core
