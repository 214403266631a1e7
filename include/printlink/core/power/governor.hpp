#pragma once

#include "printlink/core/clock.hpp"
#include "printlink/core/config/config.hpp"
#include "printlink/core/power/mode.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"

namespace printlink::core::power {

/*
===============================================================================
 power::Governor
===============================================================================

Idle and power-mode policy. The Governor decides; the Manager acts
(applies profiles, trims the pool, stops and restarts monitors).

  • effective mode: the requested mode, with Auto resolved from the last
    known battery level
  • idle: entered once no activity was observed for the inactivity window
    (only while power management is enabled); any activity leaves it
===============================================================================
*/

class Governor {
public:
    explicit Governor(const PowerConfig& config) noexcept
        : enabled_(config.enabled)
        , requested_(config.mode)
        , inactivity_(config.inactivity_timeout)
        , sweep_interval_(config.sweep_interval)
        , cache_ttl_(config.device_cache_ttl)
    {}

    inline void configure(bool enabled, Mode mode, Millis inactivity) noexcept {
        enabled_ = enabled;
        requested_ = mode;
        if (inactivity.count() > 0) {
            inactivity_ = inactivity;
        }
        PL_INFO("[POWER] Power management " << (enabled ? "enabled" : "disabled")
                << " (mode " << to_string(mode) << ", inactivity " << inactivity_.count() << " ms)");
    }

    inline void set_battery(lcr::optional<int> percent) noexcept {
        battery_ = percent;
    }

    [[nodiscard]]
    inline Mode effective() const noexcept {
        return resolve(requested_, battery_);
    }

    // True when the effective mode differs from the last applied one;
    // `out` receives the mode to apply
    [[nodiscard]]
    inline bool needs_apply(Mode& out) const noexcept {
        out = effective();
        return !applied_.has() || applied_.value() != out;
    }

    inline void mark_applied(Mode m) noexcept {
        applied_ = m;
    }

    // Power management switched off: the next enable re-applies its profile
    inline void forget_applied() noexcept {
        applied_.reset();
    }

    // Returns true when the call leaves idle mode
    inline bool on_activity(TimePoint now) noexcept {
        last_activity_ = now;
        if (idle_) {
            idle_ = false;
            PL_DEBUG("[POWER] Leaving idle mode");
            return true;
        }
        return false;
    }

    [[nodiscard]]
    inline bool idle_due(TimePoint now) const noexcept {
        return enabled_ && !idle_ && now - last_activity_ >= inactivity_;
    }

    inline void enter_idle() noexcept {
        idle_ = true;
        PL_DEBUG("[POWER] Entering idle mode");
    }

    [[nodiscard]] inline bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] inline bool idle() const noexcept { return idle_; }
    [[nodiscard]] inline Mode requested() const noexcept { return requested_; }
    [[nodiscard]] inline lcr::optional<Mode> applied() const noexcept { return applied_; }
    [[nodiscard]] inline Millis inactivity() const noexcept { return inactivity_; }
    [[nodiscard]] inline Millis sweep_interval() const noexcept { return sweep_interval_; }
    [[nodiscard]] inline Millis cache_ttl() const noexcept { return cache_ttl_; }

private:
    bool enabled_;
    Mode requested_;
    Millis inactivity_;
    Millis sweep_interval_;
    Millis cache_ttl_;
    lcr::optional<int> battery_{};
    lcr::optional<Mode> applied_{};
    TimePoint last_activity_{};
    bool idle_{false};
};

} // namespace printlink::core::power
