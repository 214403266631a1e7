#pragma once

#include "printlink/core/clock.hpp"

namespace printlink::core {

/*
===============================================================================
 PeriodicTask
===============================================================================

An independently cancellable periodic deadline owned by the Manager.

There is no thread and no callback: the owner asks fire(now) from poll(),
which returns true at most once per elapsed period and re-arms itself.
Cancelling only clears the deadline, so teardown is deterministic.

    task.start(now, 15s);
    ...
    if (task.fire(now)) { sample(); }
===============================================================================
*/

class PeriodicTask {
public:
    PeriodicTask() = default;

    inline void start(TimePoint now, Millis interval) noexcept {
        interval_ = interval;
        next_due_ = now + interval;
        armed_ = interval.count() > 0;
    }

    // Re-arm with a new interval (keeps the task running if it was)
    inline void restart(TimePoint now, Millis interval) noexcept {
        const bool was_armed = armed_;
        start(now, interval);
        armed_ = was_armed && interval.count() > 0;
    }

    inline void cancel() noexcept {
        armed_ = false;
    }

    [[nodiscard]]
    inline bool fire(TimePoint now) noexcept {
        if (!armed_ || now < next_due_) {
            return false;
        }
        // Skip missed periods instead of firing a burst
        do {
            next_due_ += interval_;
        } while (next_due_ <= now);
        return true;
    }

    [[nodiscard]] inline bool armed() const noexcept { return armed_; }
    [[nodiscard]] inline Millis interval() const noexcept { return interval_; }
    [[nodiscard]] inline TimePoint next_due() const noexcept { return next_due_; }

private:
    Millis interval_{0};
    TimePoint next_due_{};
    bool armed_{false};
};

} // namespace printlink::core
