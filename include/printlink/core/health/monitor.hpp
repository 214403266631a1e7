#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "printlink/core/config/config.hpp"
#include "printlink/core/health/snapshot.hpp"
#include "lcr/control/binary_hysteresis.hpp"
#include "lcr/optional.hpp"

namespace printlink::core::health {

/*
===============================================================================
 health::Monitor
===============================================================================

Threshold logic of the periodic samplers and of diagnose(). It performs no
I/O: the Manager reads RSSI, battery and the flow controller's last quality
and feeds them in.

Quality sampler
  signal < signal_warn_dbm        → SignalWeak   (edge-triggered)
  quality < quality_warn_ratio    → QualityPoor  (edge-triggered)
  Warnings raise on the first bad sample and clear after 3 good ones.
  `optimize` is set on every poor-quality sample.

Battery sampler
  level < battery_low_percent       → Low
  level < battery_critical_percent  → Critical
  Reported when the band changes; recovering above the low band re-arms it.
===============================================================================
*/

class Monitor {
public:
    using WarningHysteresis = lcr::control::BinaryHysteresis<1, 3>;

    enum class BatteryBand : std::uint8_t {
        Normal,
        Low,
        Critical
    };

    struct QualityVerdict {
        bool signal_weak_raised{false};
        bool quality_poor_raised{false};
        bool recovered{false};          // last active warning cleared
        bool optimize{false};
    };

    explicit Monitor(const HealthConfig& config) noexcept
        : config_(config)
    {}

    [[nodiscard]]
    inline QualityVerdict on_quality_sample(lcr::optional<int> rssi, double quality) noexcept {
        QualityVerdict v;
        const bool had_warning = signal_.active() || quality_.active();

        const bool weak = rssi.has() && rssi.value() < config_.signal_warn_dbm;
        // Unknown RSSI keeps the signal warning where it is
        if (rssi.has()) {
            v.signal_weak_raised = signal_.observe(weak) == WarningHysteresis::Transition::Activated;
        }
        const bool poor = quality < config_.quality_warn_ratio;
        v.quality_poor_raised = quality_.observe(poor) == WarningHysteresis::Transition::Activated;
        v.optimize = poor;

        v.recovered = had_warning && !signal_.active() && !quality_.active();
        return v;
    }

    // Returns true when the band changed to Low or Critical
    [[nodiscard]]
    inline bool on_battery_sample(int percent, BatteryBand& band) noexcept {
        BatteryBand next = BatteryBand::Normal;
        if (percent < config_.battery_critical_percent) {
            next = BatteryBand::Critical;
        }
        else if (percent < config_.battery_low_percent) {
            next = BatteryBand::Low;
        }
        const bool changed = next != battery_band_;
        battery_band_ = next;
        band = next;
        return changed && next != BatteryBand::Normal;
    }

    // Verdict for diagnose()
    [[nodiscard]]
    inline Snapshot evaluate(bool initialized, bool connected, bool can_write,
                             lcr::optional<int> battery, lcr::optional<int> rssi, double quality) const
    {
        Snapshot s;
        s.initialized = initialized;
        s.connected = connected;
        s.can_write = can_write;
        s.battery_level = battery;
        s.signal_strength = rssi;
        s.transmission_quality = quality;

        if (!initialized) {
            raise_(s, Status::Error, "Bluetooth adapter not initialized");
        }
        if (!connected) {
            raise_(s, Status::Error, "No printer connected");
        }
        else if (!can_write) {
            raise_(s, Status::Error, "Write test failed");
        }
        if (battery.has()) {
            if (battery.value() < config_.battery_critical_percent) {
                raise_(s, Status::Error, "Battery critical (" + std::to_string(battery.value()) + "%)");
            }
            else if (battery.value() < config_.battery_low_percent) {
                raise_(s, Status::Warning, "Battery low (" + std::to_string(battery.value()) + "%)");
            }
        }
        if (rssi.has() && rssi.value() < config_.signal_warn_dbm) {
            raise_(s, Status::Warning, "Weak signal (" + std::to_string(rssi.value()) + " dBm)");
        }
        if (connected && quality < config_.quality_warn_ratio) {
            raise_(s, Status::Warning, "Poor transmission quality");
        }
        return s;
    }

    inline void reset() noexcept {
        signal_.reset();
        quality_.reset();
        battery_band_ = BatteryBand::Normal;
    }

    [[nodiscard]] inline bool signal_warning() const noexcept { return signal_.active(); }
    [[nodiscard]] inline bool quality_warning() const noexcept { return quality_.active(); }
    [[nodiscard]] inline BatteryBand battery_band() const noexcept { return battery_band_; }

private:
    static inline void raise_(Snapshot& s, Status level, std::string issue) {
        if (level > s.status) {
            s.status = level;
        }
        s.issues.push_back(std::move(issue));
    }

private:
    HealthConfig config_;
    WarningHysteresis signal_{};
    WarningHysteresis quality_{};
    BatteryBand battery_band_{BatteryBand::Normal};
};

} // namespace printlink::core::health
