#pragma once

#include <cstdint>
#include <vector>

#include "printlink/core/clock.hpp"
#include "printlink/core/error.hpp"
#include "printlink/core/notice.hpp"
#include "printlink/core/config/config.hpp"
#include "printlink/core/flow/controller.hpp"
#include "printlink/core/memory/buffer_pool.hpp"
#include "printlink/core/queue/command_queue.hpp"
#include "printlink/core/stats/transmission.hpp"
#include "printlink/core/transmission/chunked_send.hpp"
#include "lcr/log/logger.hpp"

namespace printlink::core::queue {

// Delivery outcome reported by the scheduler after each attempt
struct Outcome {
    Ticket ticket{NO_TICKET};
    Error error{Error::None};
    std::uint32_t attempts{0};
    bool terminal{true};            // false: command re-queued for retry
    stats::TransmissionStats stats{};
};

/*
===============================================================================
 queue::Scheduler
===============================================================================

Single logical worker draining the CommandQueue one command at a time.

    pump(now, link_ready, ...)
      ├─ in-flight command → advance its ChunkedSend
      │     ├─ success   → Outcome{None}
      │     └─ failure   → attempts++
      │          ├─ attempts <= max_retries → requeue (tail, after retry_delay)
      │          └─ otherwise               → Outcome{CommandFailed}
      └─ idle → dispatch the first eligible command when
                link_ready && !paused && command_delay elapsed

An in-flight command is never cancelled: pause() and clear() only affect
commands that have not started. interrupt() (link lost) settles the attempt
as failed; withdraw() (local close) puts the command back uncounted.

Each drain cycle resets the stats aggregator when it starts from idle and
stamps the end when the queue runs empty. The flow controller is fed after
every attempt.
===============================================================================
*/

class Scheduler {
public:
    explicit Scheduler(const QueueConfig& config) noexcept
        : queue_(config.bound)
        , default_max_retries_(config.default_max_retries)
        , retry_delay_(config.retry_delay)
    {}

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    [[nodiscard]]
    inline Error enqueue(Ticket ticket, std::vector<std::uint8_t> payload, const CommandOptions& opts, TimePoint now) {
        if (payload.empty()) {
            return Error::InvalidArgument;
        }
        QueuedCommand cmd;
        cmd.id = ticket;
        cmd.payload = std::move(payload);
        cmd.priority = opts.priority;
        cmd.enqueued_at = now;
        cmd.max_retries = opts.max_retries.value_or(default_max_retries_);
        cmd.use_chunking = opts.use_chunking;
        cmd.description = opts.description;
        cmd.not_before = now;
        return queue_.push(std::move(cmd), in_flight_ ? 1 : 0);
    }

    inline void pause() noexcept { paused_ = true; }
    inline void resume() noexcept { paused_ = false; }

    // Link lost: the in-flight attempt stops here and settles as a failed
    // attempt on the next pump(), so the command is resent from its start.
    inline void interrupt(TimePoint now) noexcept {
        if (in_flight_) {
            job_.abort(now);
        }
    }

    // Local close: the in-flight attempt is dropped without being counted
    // and the command goes back to its place in the queue. No outcome.
    inline void withdraw(TimePoint now) {
        if (!in_flight_) {
            return;
        }
        job_.abort(now);
        job_.reset();
        in_flight_ = false;
        if (current_.attempts > 0) {
            current_.attempts--;
        }
        PL_DEBUG("[QUEUE] Command #" << current_.id << " withdrawn, attempt not counted");
        queue_.restore(std::move(current_), now);
        current_ = QueuedCommand{};
    }

    // Remove every pending command. The in-flight command (if any) runs on.
    [[nodiscard]]
    inline std::vector<QueuedCommand> clear() {
        return queue_.take_all();
    }

    template<transmission::SinkConcept Sink, class OnOutcome>
    inline void pump(TimePoint now, bool link_ready, memory::BufferPool& pool,
                     flow::Controller& flow, stats::Aggregator& aggregator,
                     Sink&& sink, OnOutcome&& on_outcome)
    {
        for (;;) {
            if (in_flight_) {
                const auto status = job_.pump(now, pool, sink);
                if (status == transmission::Status::Running) {
                    return;
                }
                settle_(now, status == transmission::Status::Succeeded, flow, aggregator, on_outcome);
                continue;
            }

            if (paused_ || !link_ready || now < next_dispatch_) {
                return;
            }
            if (!queue_.pop_eligible(now, current_)) {
                if (queue_.empty() && aggregator.in_cycle() && cycle_open_) {
                    aggregator.end_cycle(now);
                    cycle_open_ = false;
                    PL_DEBUG("[QUEUE] Drained: " << aggregator.current());
                }
                return;
            }
            if (!cycle_open_) {
                aggregator.begin_cycle(now);
                cycle_open_ = true;
            }

            const flow::Params params = flow.snapshot();
            const std::size_t chunk = current_.use_chunking ? params.chunk_size : current_.payload.size();
            current_.attempts++;
            if (job_.start(current_.payload, chunk, params.chunk_delay, now) != Error::None) {
                // Payloads are validated on enqueue; treat as a failed attempt
                settle_(now, false, flow, aggregator, on_outcome);
                continue;
            }
            in_flight_ = true;
            PL_TRACE("[QUEUE] Dispatch #" << current_.id << " priority=" << current_.priority
                     << " attempt=" << current_.attempts << " bytes=" << current_.payload.size());
        }
    }

    [[nodiscard]] inline bool paused() const noexcept { return paused_; }
    [[nodiscard]] inline bool in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] inline std::size_t size() const noexcept { return queue_.size(); }
    [[nodiscard]] inline std::size_t bound() const noexcept { return queue_.bound(); }
    [[nodiscard]] inline const CommandQueue& queue() const noexcept { return queue_; }

    // Pending commands plus the in-flight one
    [[nodiscard]]
    inline std::size_t outstanding() const noexcept {
        return queue_.size() + (in_flight_ ? 1 : 0);
    }

private:
    template<class OnOutcome>
    inline void settle_(TimePoint now, bool ok, flow::Controller& flow, stats::Aggregator& aggregator, OnOutcome& on_outcome) {
        const auto& unit = job_.stats();
        aggregator.merge(unit);
        aggregator.record_command(ok);
        flow.on_sample(unit.successful_bytes, unit.total_bytes, unit.retry_count);
        in_flight_ = false;
        next_dispatch_ = now + flow.snapshot().command_delay;

        Outcome out;
        out.ticket = current_.id;
        out.attempts = current_.attempts;
        out.stats = unit;
        job_.reset();

        if (ok) {
            out.error = Error::None;
            out.terminal = true;
        }
        else if (current_.attempts <= current_.max_retries) {
            out.error = Error::WriteFailed;
            out.terminal = false;
            PL_DEBUG("[QUEUE] Command #" << current_.id << " failed (attempt " << current_.attempts
                     << "), retry in " << retry_delay_.count() << "ms");
            queue_.requeue(std::move(current_), now + retry_delay_);
        }
        else {
            out.error = Error::CommandFailed;
            out.terminal = true;
            PL_WARN("[QUEUE] Command #" << current_.id << " rejected after " << current_.attempts << " attempts");
        }
        current_ = QueuedCommand{};
        on_outcome(out);
    }

private:
    CommandQueue queue_;
    transmission::ChunkedSend job_{};
    QueuedCommand current_{};
    std::uint32_t default_max_retries_;
    Millis retry_delay_;
    TimePoint next_dispatch_{};
    bool in_flight_{false};
    bool paused_{false};
    bool cycle_open_{false};
};

} // namespace printlink::core::queue
