#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

#include "printlink/core/error.hpp"
#include "printlink/core/config/config.hpp"
#include "printlink/core/flow/params.hpp"
#include "lcr/log/logger.hpp"

namespace printlink::core::flow {

// Outcome of one tuning step
enum class Adjustment : std::uint8_t {
    None,
    Shrunk,         // chunk size down, delay up
    Grown,          // chunk size up
    DelayReduced    // chunk size at max, delay down
};

[[nodiscard]]
inline constexpr std::string_view to_string(Adjustment a) noexcept {
    switch (a) {
        case Adjustment::None:         return "none";
        case Adjustment::Shrunk:       return "shrunk";
        case Adjustment::Grown:        return "grown";
        case Adjustment::DelayReduced: return "delay_reduced";
        default:                       return "unknown";
    }
}

/*
===============================================================================
 flow::Controller
===============================================================================

Sole owner of the mutable transport parameters. Everything else reads a
copy through snapshot() before a send; nothing else writes them.

Tuning (after each transmission unit, when auto_adjust is on):

    quality <  threshold               shrink chunk, grow delay
    quality >  excellent, no retries   grow chunk, or shrink delay at max
    otherwise                          unchanged

Every write path (tuning, override, profile, restore) ends in clamped(),
so the bounds invariant holds for any sequence of samples.
===============================================================================
*/

class Controller {
public:
    explicit Controller(const FlowConfig& config) noexcept
        : params_(config.initial.clamped())
        , defaults_(params_)
        , steps_(config.steps)
        , excellent_(config.excellent_quality)
    {}

    [[nodiscard]]
    inline Params snapshot() const noexcept {
        return params_;
    }

    // Feed one transmission unit. quality = successful / total (0 if total 0)
    inline Adjustment on_sample(std::uint64_t successful_bytes, std::uint64_t total_bytes, std::uint64_t retries) noexcept {
        const double quality = total_bytes == 0
            ? 0.0
            : std::clamp(static_cast<double>(successful_bytes) / static_cast<double>(total_bytes), 0.0, 1.0);
        return on_quality(quality, retries);
    }

    inline Adjustment on_quality(double quality, std::uint64_t retries) noexcept {
        params_.last_quality = std::clamp(quality, 0.0, 1.0);
        if (!params_.auto_adjust) {
            return Adjustment::None;
        }

        Adjustment adj = Adjustment::None;
        if (params_.last_quality < params_.quality_threshold) {
            params_.chunk_size = (params_.chunk_size > params_.min_chunk_size + steps_.shrink)
                ? params_.chunk_size - steps_.shrink
                : params_.min_chunk_size;
            params_.chunk_delay = params_.chunk_delay + steps_.delay;
            adj = Adjustment::Shrunk;
        }
        else if (params_.last_quality > excellent_ && retries == 0) {
            if (params_.chunk_size < params_.max_chunk_size) {
                params_.chunk_size += steps_.grow;
                adj = Adjustment::Grown;
            }
            else if (params_.chunk_delay > params_.min_chunk_delay) {
                params_.chunk_delay = params_.chunk_delay - steps_.delay;
                adj = Adjustment::DelayReduced;
            }
        }
        params_ = params_.clamped();

        if (adj != Adjustment::None) {
            PL_DEBUG("[FLOW] quality=" << params_.last_quality << " -> " << to_string(adj)
                     << " (chunk=" << params_.chunk_size << ", delay=" << params_.chunk_delay.count() << "ms)");
        }
        return adj;
    }

    // Operator override. Bounds in the patch are applied first and
    // normalised; the remaining fields are then clamped into them.
    [[nodiscard]]
    inline Error apply_patch(const Patch& patch) noexcept {
        if (patch.chunk_size.has() && patch.chunk_size.value() == 0) {
            return Error::InvalidArgument;
        }
        Params next = params_;
        if (patch.min_chunk_size.has())    next.min_chunk_size = patch.min_chunk_size.value();
        if (patch.max_chunk_size.has())    next.max_chunk_size = patch.max_chunk_size.value();
        if (patch.min_chunk_delay.has())   next.min_chunk_delay = patch.min_chunk_delay.value();
        if (patch.max_chunk_delay.has())   next.max_chunk_delay = patch.max_chunk_delay.value();
        if (patch.chunk_size.has())        next.chunk_size = patch.chunk_size.value();
        if (patch.chunk_delay.has())       next.chunk_delay = patch.chunk_delay.value();
        if (patch.command_delay.has())     next.command_delay = patch.command_delay.value();
        if (patch.auto_adjust.has())       next.auto_adjust = patch.auto_adjust.value();
        if (patch.quality_threshold.has()) next.quality_threshold = patch.quality_threshold.value();
        params_ = next.clamped();
        PL_INFO("[FLOW] Parameters overridden: " << params_);
        return Error::None;
    }

    // Power profile (chunk size and inter-chunk delay only)
    inline void apply_profile(std::size_t chunk_size, Millis chunk_delay) noexcept {
        params_.chunk_size = chunk_size;
        params_.chunk_delay = chunk_delay;
        params_ = params_.clamped();
    }

    // Re-apply a previously saved parameter set (state restoration)
    inline void restore(const Params& saved) noexcept {
        params_ = saved.clamped();
    }

    // Optimisation routine: back to the configured starting point, keeping
    // the operator bounds and the auto_adjust choice
    inline void reset_to_defaults() noexcept {
        Params next = defaults_;
        next.min_chunk_size = params_.min_chunk_size;
        next.max_chunk_size = params_.max_chunk_size;
        next.min_chunk_delay = params_.min_chunk_delay;
        next.max_chunk_delay = params_.max_chunk_delay;
        next.auto_adjust = params_.auto_adjust;
        next.last_quality = params_.last_quality;
        params_ = next.clamped();
    }

    [[nodiscard]] inline double last_quality() const noexcept { return params_.last_quality; }

private:
    Params params_;
    Params defaults_;
    Steps steps_;
    double excellent_;
};

} // namespace printlink::core::flow
