#pragma once

#include <chrono>
#include <cstdint>
#include <concepts>

namespace printlink::core {

using TimePoint = std::chrono::steady_clock::time_point;
using Millis    = std::chrono::milliseconds;

// -----------------------------------------------------------------------------
// ClockConcept
// -----------------------------------------------------------------------------
//
// Every deadline in the core (chunk spacing, retry delays, reconnect backoff,
// periodic monitors) is read through a Clock instance so poll-driven logic
// stays deterministic under test.
//
//   now()      monotonic time used for all scheduling
//   wall_ms()  wall clock in milliseconds since epoch (history timestamps)
//
// -----------------------------------------------------------------------------
template<class C>
concept ClockConcept =
    requires(const C& c) {
        { c.now() } noexcept -> std::same_as<TimePoint>;
        { c.wall_ms() } noexcept -> std::same_as<std::uint64_t>;
    };

struct SteadyClock {
    [[nodiscard]]
    inline TimePoint now() const noexcept {
        return std::chrono::steady_clock::now();
    }

    [[nodiscard]]
    inline std::uint64_t wall_ms() const noexcept {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }
};
static_assert(ClockConcept<SteadyClock>);

[[nodiscard]]
inline std::uint64_t elapsed_ms(TimePoint from, TimePoint to) noexcept {
    if (to <= from) return 0;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<Millis>(to - from).count());
}

} // namespace printlink::core
