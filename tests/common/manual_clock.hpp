#pragma once

#include <chrono>
#include <cstdint>

#include "printlink/core/clock.hpp"

namespace printlink::core::test {

// -----------------------------------------------------------------------------
// ManualClock
// -----------------------------------------------------------------------------
// Time only moves when the test says so. Monotonic and wall time advance
// together.
// -----------------------------------------------------------------------------
class ManualClock {
public:
    [[nodiscard]]
    inline TimePoint now() const noexcept { return now_; }

    [[nodiscard]]
    inline std::uint64_t wall_ms() const noexcept { return wall_ms_; }

    inline void advance(Millis d) noexcept {
        now_ += d;
        wall_ms_ += static_cast<std::uint64_t>(d.count());
    }

private:
    TimePoint now_{std::chrono::hours{1}};
    std::uint64_t wall_ms_{1'700'000'000'000ULL};
};
static_assert(ClockConcept<ManualClock>);

} // namespace printlink::core::test
