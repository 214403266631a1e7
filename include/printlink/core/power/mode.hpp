#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

#include "printlink/core/clock.hpp"
#include "lcr/optional.hpp"

namespace printlink::core::power {

// ===============================================================
// POWER MODE
// ===============================================================
enum class Mode : std::uint8_t {
    Aggressive,    // save energy: small chunks, long delays, rare sampling
    Balanced,
    Performance,   // throughput first
    Auto           // derived from battery level
};

[[nodiscard]]
inline constexpr std::string_view to_string(Mode m) noexcept {
    switch (m) {
        case Mode::Aggressive:  return "aggressive";
        case Mode::Balanced:    return "balanced";
        case Mode::Performance: return "performance";
        case Mode::Auto:        return "auto";
        default:                return "unknown";
    }
}

[[nodiscard]]
inline constexpr bool parse_mode(std::string_view s, Mode& out) noexcept {
    if (s == "aggressive")  { out = Mode::Aggressive;  return true; }
    if (s == "balanced")    { out = Mode::Balanced;    return true; }
    if (s == "performance") { out = Mode::Performance; return true; }
    if (s == "auto")        { out = Mode::Auto;        return true; }
    return false;
}

// Fixed triple applied by each concrete mode
struct Profile {
    std::size_t chunk_size;
    Millis chunk_delay;
    Millis quality_interval;
};

[[nodiscard]]
inline constexpr Profile profile_of(Mode m) noexcept {
    switch (m) {
        case Mode::Aggressive:  return {10,  Millis{50}, Millis{60'000}};
        case Mode::Performance: return {100, Millis{5},  Millis{10'000}};
        case Mode::Balanced:
        default:                return {20,  Millis{20}, Millis{30'000}};
    }
}

// Auto resolves to a concrete mode. Unknown battery level keeps Balanced.
[[nodiscard]]
inline Mode resolve(Mode requested, lcr::optional<int> battery_percent) noexcept {
    if (requested != Mode::Auto) {
        return requested;
    }
    if (!battery_percent.has()) {
        return Mode::Balanced;
    }
    const int level = battery_percent.value();
    if (level < 20) return Mode::Aggressive;
    if (level < 50) return Mode::Balanced;
    return Mode::Performance;
}

} // namespace printlink::core::power
