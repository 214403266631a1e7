#pragma once

#include <cstdint>
#include <string_view>

namespace printlink::core {

/*
===============================================================================
 core::Error
===============================================================================

Semantic failure classification for every public operation of the core.

Transient failures (a single chunk or command write) are retried locally and
never surface on their own. What surfaces is either the terminal outcome of a
specific submission (WriteFailed, CommandFailed, QueueCleared) or a link-wide
condition (NotConnected, ConnectFailed, AdapterUnavailable). The two families
let a caller tell "your command failed" from "the whole link is down".

No public operation throws.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Link-wide conditions -----------------------------------------------
    AdapterUnavailable,  // Adapter missing, not initialized or init() failed
    NotConnected,        // Operation requires a connected device
    ConnectFailed,       // Connect attempt failed, timed out, or backoff exhausted

    // --- Delivery outcomes --------------------------------------------------
    WriteFailed,         // A write failed after its local retry
    QueueFull,           // Enqueue beyond the configured bound
    CommandFailed,       // Command rejected after maxRetries retries
    QueueCleared,        // Pending command discarded by clear(reject = true)

    // --- Diagnostics --------------------------------------------------------
    DiagnosticFailure,   // Troubleshooting could not restore a healthy link

    // --- Caller contract ----------------------------------------------------
    InvalidArgument,     // Empty payload, zero chunk size, malformed config
    InvalidState,        // Operation not allowed in the current lifecycle state
    Busy                 // A transmission is in flight on the link
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:               return "None";
        case Error::AdapterUnavailable: return "AdapterUnavailable";
        case Error::NotConnected:       return "NotConnected";
        case Error::ConnectFailed:      return "ConnectFailed";
        case Error::WriteFailed:        return "WriteFailed";
        case Error::QueueFull:          return "QueueFull";
        case Error::CommandFailed:      return "CommandFailed";
        case Error::QueueCleared:       return "QueueCleared";
        case Error::DiagnosticFailure:  return "DiagnosticFailure";
        case Error::InvalidArgument:    return "InvalidArgument";
        case Error::InvalidState:       return "InvalidState";
        case Error::Busy:               return "Busy";
        default:                        return "Unknown";
    }
}

// True for conditions that concern the whole link rather than one submission
[[nodiscard]]
inline constexpr bool is_link_error(Error err) noexcept {
    return err == Error::AdapterUnavailable
        || err == Error::NotConnected
        || err == Error::ConnectFailed;
}

} // namespace printlink::core
