#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

#include "printlink/core/error.hpp"
#include "printlink/core/queue/command.hpp"
#include "lcr/sequence.hpp"

namespace printlink::core::queue {

// ============================================================================
// CommandQueue
// ----------------------------------------------------------------------------
// Bounded, priority-ordered store of pending commands.
//
//   • Kept sorted by (priority desc, seq asc) on insertion
//   • push() fails fast with QueueFull at the bound, length unchanged
//   • requeue() re-inserts a retried command at the tail of its priority
//     class; it never fails (the slot was reserved by the in-flight command)
//   • restore() puts a withdrawn command back at its original position
//   • pop_eligible() takes the first command whose retry delay has elapsed,
//     so a command waiting out its delay never blocks the ones behind it
//
// Single-threaded.
// ============================================================================
class CommandQueue {
public:
    explicit CommandQueue(std::size_t bound) noexcept
        : bound_(bound == 0 ? 1 : bound)
    {}

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // `reserved` counts slots held outside the queue (in-flight command)
    [[nodiscard]]
    inline Error push(QueuedCommand&& cmd, std::size_t reserved = 0) {
        if (items_.size() + reserved >= bound_) {
            return Error::QueueFull;
        }
        cmd.seq = seq_.next();
        insert_(std::move(cmd));
        return Error::None;
    }

    inline void requeue(QueuedCommand&& cmd, TimePoint not_before) {
        cmd.seq = seq_.next();
        cmd.not_before = not_before;
        insert_(std::move(cmd));
    }

    // Keeps the command's sequence number, so it drains where it was
    inline void restore(QueuedCommand&& cmd, TimePoint not_before) {
        cmd.not_before = not_before;
        insert_(std::move(cmd));
    }

    [[nodiscard]]
    inline bool pop_eligible(TimePoint now, QueuedCommand& out) {
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->not_before <= now) {
                out = std::move(*it);
                items_.erase(it);
                return true;
            }
        }
        return false;
    }

    // Earliest retry deadline among pending commands (if any)
    [[nodiscard]]
    inline bool next_eligible_at(TimePoint& out) const noexcept {
        if (items_.empty()) {
            return false;
        }
        out = items_.front().not_before;
        for (const auto& c : items_) {
            out = std::min(out, c.not_before);
        }
        return true;
    }

    // Remove every pending command, returning them in drain order
    [[nodiscard]]
    inline std::vector<QueuedCommand> take_all() {
        std::vector<QueuedCommand> out;
        out.swap(items_);
        return out;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] inline std::size_t bound() const noexcept { return bound_; }

    // Drain-order view (tests and reports)
    [[nodiscard]] inline const std::vector<QueuedCommand>& items() const noexcept { return items_; }

private:
    inline void insert_(QueuedCommand&& cmd) {
        auto pos = std::upper_bound(items_.begin(), items_.end(), cmd,
            [](const QueuedCommand& a, const QueuedCommand& b) { return drains_before(a, b); });
        items_.insert(pos, std::move(cmd));
    }

private:
    std::vector<QueuedCommand> items_{};
    std::size_t bound_;
    lcr::sequence seq_{};
};

} // namespace printlink::core::queue
