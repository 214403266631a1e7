#pragma once

#include <cstdint>

namespace lcr::control {

/*
================================================================================
BinaryHysteresis
================================================================================

A deterministic two-state machine with independent activation and
deactivation thresholds. Collapses an oscillating boolean observation
(e.g. "signal below threshold" sampled periodically) into stable,
edge-triggered transitions.

    Inactive --(ActivateThreshold consecutive active samples)--> Active
    Active   --(DeactivateThreshold consecutive inactive samples)--> Inactive

Transitions are emitted exactly once per stable change. No allocations,
no locks. Single-threaded usage.

Typical usage:

    using WarningHysteresis = BinaryHysteresis<1, 3>;   // raise fast, clear slow

    auto t = warning.observe(rssi < threshold);
    if (t == WarningHysteresis::Transition::Activated) { ... }
================================================================================
*/

template<
    std::uint32_t ActivateThreshold,
    std::uint32_t DeactivateThreshold
>
class BinaryHysteresis {
    static_assert(ActivateThreshold > 0, "ActivateThreshold must be > 0");
    static_assert(DeactivateThreshold > 0, "DeactivateThreshold must be > 0");

public:
    enum class State : std::uint8_t {
        Inactive,
        Active
    };

    enum class Transition : std::uint8_t {
        None,
        Activated,
        Deactivated
    };

    constexpr BinaryHysteresis() noexcept = default;

    // Feeds one observation of the condition
    [[nodiscard]]
    inline Transition observe(bool condition) noexcept {
        return condition ? on_active_signal() : on_inactive_signal();
    }

    [[nodiscard]]
    inline Transition on_active_signal() noexcept {
        deactivate_streak_ = 0;
        if (state_ == State::Inactive) {
            if (++activate_streak_ >= ActivateThreshold) {
                state_ = State::Active;
                activate_streak_ = 0;
                return Transition::Activated;
            }
        } else {
            activate_streak_ = 0;
        }
        return Transition::None;
    }

    [[nodiscard]]
    inline Transition on_inactive_signal() noexcept {
        activate_streak_ = 0;
        if (state_ == State::Active) {
            if (++deactivate_streak_ >= DeactivateThreshold) {
                state_ = State::Inactive;
                deactivate_streak_ = 0;
                return Transition::Deactivated;
            }
        } else {
            deactivate_streak_ = 0;
        }
        return Transition::None;
    }

    [[nodiscard]]
    constexpr bool active() const noexcept {
        return state_ == State::Active;
    }

    inline void reset() noexcept {
        state_ = State::Inactive;
        activate_streak_ = 0;
        deactivate_streak_ = 0;
    }

private:
    State state_{State::Inactive};

    std::uint32_t activate_streak_{0};
    std::uint32_t deactivate_streak_{0};
};

} // namespace lcr::control
