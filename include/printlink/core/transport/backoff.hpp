#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

#include "printlink/core/clock.hpp"

namespace printlink::core::transport {

// ===============================================================
// BACKOFF MODE
// ===============================================================
//
// Linear       delay = base * attempt              (drop recovery)
// Exponential  delay = base * 2^(attempt - 1)      (troubleshoot recovery)
//
// Both are capped at the configured ceiling. Attempts are 1-based.
//
enum class BackoffMode : std::uint8_t {
    Linear,
    Exponential
};

[[nodiscard]]
inline constexpr std::string_view to_string(BackoffMode m) noexcept {
    switch (m) {
        case BackoffMode::Linear:      return "linear";
        case BackoffMode::Exponential: return "exponential";
        default:                       return "unknown";
    }
}

[[nodiscard]]
inline constexpr Millis backoff_delay(BackoffMode mode, Millis base, Millis ceiling, std::uint32_t attempt) noexcept {
    if (attempt == 0) {
        attempt = 1;
    }
    Millis delay{0};
    switch (mode) {
        case BackoffMode::Linear:
            delay = base * attempt;
            break;
        case BackoffMode::Exponential: {
            // Clamp the exponent to avoid overflow, the ceiling caps anyway
            const std::uint32_t exponent = std::min<std::uint32_t>(attempt - 1, 20);
            delay = base * (std::int64_t{1} << exponent);
            break;
        }
    }
    return std::min(delay, ceiling);
}

} // namespace printlink::core::transport
