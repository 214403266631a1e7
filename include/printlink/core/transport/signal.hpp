/*
===============================================================================
 Link Signals
===============================================================================

link::Signal represents externally observable, edge-triggered facts emitted
by transport::Link and drained with poll_signal().

  - Single-shot per occurrence
  - Poll-driven, callback-free
  - Bounded ring: on overflow the oldest signal is dropped (with a warning)

The Manager turns signals into notices and drives the dependent work
(history updates, monitor start/stop, state restoration, queue resumption).

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected           open() established the link
Closed              close() took the link down (caller intent)
Lost                the adapter reported an unexpected drop
RetryScheduled      a reconnect attempt is armed (see retry_attempt())
RetryFailed         one reconnect attempt failed
Reconnected         a reconnect attempt succeeded
ReconnectExhausted  every attempt failed; the link is Disconnected

===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>

namespace printlink::core::transport::link {

enum class Signal : std::uint8_t {
    None,
    Connected,
    Closed,
    Lost,
    RetryScheduled,
    RetryFailed,
    Reconnected,
    ReconnectExhausted
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:               return "None";
        case Signal::Connected:          return "Connected";
        case Signal::Closed:             return "Closed";
        case Signal::Lost:               return "Lost";
        case Signal::RetryScheduled:     return "RetryScheduled";
        case Signal::RetryFailed:        return "RetryFailed";
        case Signal::Reconnected:        return "Reconnected";
        case Signal::ReconnectExhausted: return "ReconnectExhausted";
        default:                         return "Unknown";
    }
}

} // namespace printlink::core::transport::link
