#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "printlink/core/clock.hpp"
#include "printlink/core/config/defaults.hpp"
#include "lcr/optional.hpp"

namespace printlink::core::flow {

// -----------------------------------------------------------------------------
// Params
// -----------------------------------------------------------------------------
// Mutable transport parameters owned by the flow Controller.
//
// Invariant (after clamped()):
//   min_chunk_size  <= chunk_size  <= max_chunk_size
//   min_chunk_delay <= chunk_delay <= max_chunk_delay
//   0 <= quality_threshold <= 1
// -----------------------------------------------------------------------------
struct Params {
    std::size_t chunk_size{config::DEFAULT_CHUNK_SIZE};
    Millis chunk_delay{config::DEFAULT_CHUNK_DELAY_MS};
    Millis command_delay{config::DEFAULT_COMMAND_DELAY_MS};
    bool auto_adjust{true};
    std::size_t min_chunk_size{config::MIN_CHUNK_SIZE};
    std::size_t max_chunk_size{config::MAX_CHUNK_SIZE};
    Millis min_chunk_delay{config::MIN_CHUNK_DELAY_MS};
    Millis max_chunk_delay{config::MAX_CHUNK_DELAY_MS};
    double quality_threshold{config::QUALITY_THRESHOLD};
    double last_quality{1.0};

    [[nodiscard]]
    inline Params clamped() const noexcept {
        Params p = *this;
        if (p.min_chunk_size == 0) p.min_chunk_size = 1;
        if (p.max_chunk_size < p.min_chunk_size) std::swap(p.min_chunk_size, p.max_chunk_size);
        if (p.min_chunk_delay.count() < 0) p.min_chunk_delay = Millis{0};
        if (p.max_chunk_delay < p.min_chunk_delay) std::swap(p.min_chunk_delay, p.max_chunk_delay);
        p.chunk_size  = std::clamp(p.chunk_size, p.min_chunk_size, p.max_chunk_size);
        p.chunk_delay = std::clamp(p.chunk_delay, p.min_chunk_delay, p.max_chunk_delay);
        if (p.command_delay.count() < 0) p.command_delay = Millis{0};
        p.quality_threshold = std::clamp(p.quality_threshold, 0.0, 1.0);
        p.last_quality = std::clamp(p.last_quality, 0.0, 1.0);
        return p;
    }

    [[nodiscard]]
    inline bool within_bounds() const noexcept {
        return chunk_size >= min_chunk_size && chunk_size <= max_chunk_size
            && chunk_delay >= min_chunk_delay && chunk_delay <= max_chunk_delay;
    }

    friend bool operator==(const Params&, const Params&) = default;
};

inline std::ostream& operator<<(std::ostream& os, const Params& p) {
    return os << "{chunk=" << p.chunk_size
              << " [" << p.min_chunk_size << ".." << p.max_chunk_size << "]"
              << ", chunk_delay=" << p.chunk_delay.count() << "ms"
              << " [" << p.min_chunk_delay.count() << ".." << p.max_chunk_delay.count() << "]"
              << ", command_delay=" << p.command_delay.count() << "ms"
              << ", auto=" << (p.auto_adjust ? "on" : "off")
              << ", threshold=" << p.quality_threshold
              << ", last_quality=" << p.last_quality << "}";
}

// -----------------------------------------------------------------------------
// Patch
// -----------------------------------------------------------------------------
// Partial operator override. Unset fields keep their current value.
// -----------------------------------------------------------------------------
struct Patch {
    lcr::optional<std::size_t> chunk_size{};
    lcr::optional<Millis> chunk_delay{};
    lcr::optional<Millis> command_delay{};
    lcr::optional<bool> auto_adjust{};
    lcr::optional<std::size_t> min_chunk_size{};
    lcr::optional<std::size_t> max_chunk_size{};
    lcr::optional<Millis> min_chunk_delay{};
    lcr::optional<Millis> max_chunk_delay{};
    lcr::optional<double> quality_threshold{};
};

// Tuning step sizes
struct Steps {
    std::size_t shrink{config::CHUNK_SHRINK_STEP};
    std::size_t grow{config::CHUNK_GROW_STEP};
    Millis delay{config::DELAY_STEP_MS};
};

} // namespace printlink::core::flow
