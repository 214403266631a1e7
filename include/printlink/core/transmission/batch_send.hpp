#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

#include "printlink/core/clock.hpp"
#include "printlink/core/error.hpp"
#include "printlink/core/transmission/chunked_send.hpp"
#include "lcr/optional.hpp"

namespace printlink::core::transmission {

struct BatchOptions {
    bool use_chunks{true};                      // false: one write per command
    lcr::optional<std::size_t> chunk_size{};    // default: flow snapshot
    lcr::optional<Millis> chunk_delay{};        // default: flow snapshot
    lcr::optional<Millis> command_delay{};      // default: flow snapshot
    bool parallel{false};
    std::size_t max_parallel{2};
    std::size_t batch_size{5};
    bool auto_adjust{true};                     // feed the flow controller
};

struct BatchResult {
    bool success{false};
    std::uint32_t failed_count{0};
    stats::TransmissionStats stats{};
};

/*
===============================================================================
 BatchSend
===============================================================================

Poll-driven delivery of an ordered list of payloads.

  Sequential        each command is sent fully before the next one starts,
                    command_delay apart.

  Bounded-parallel  commands are split into consecutive groups of
                    batch_size; at most max_parallel groups are active and
                    each pump() advances every active group as far as its
                    deadlines allow. Inside a group commands keep their order. A finished group frees
                    its slot for the next pending group.

A failing command is counted and the batch moves on. The batch succeeds
iff no command failed.
===============================================================================
*/

class BatchSend {
public:
    struct Plan {
        std::size_t chunk_size;
        Millis chunk_delay;
        Millis command_delay;
    };

    BatchSend() = default;

    [[nodiscard]]
    inline Error start(std::vector<std::vector<std::uint8_t>> commands, const BatchOptions& opts, const Plan& plan, TimePoint now) {
        if (commands.empty()) {
            return Error::InvalidArgument;
        }
        for (const auto& c : commands) {
            if (c.empty()) {
                return Error::InvalidArgument;
            }
        }
        if (plan.chunk_size == 0) {
            return Error::InvalidArgument;
        }
        commands_ = std::move(commands);
        plan_ = plan;
        use_chunks_ = opts.use_chunks;

        const std::size_t group_size = opts.parallel ? std::max<std::size_t>(opts.batch_size, 1) : commands_.size();
        const std::size_t width = opts.parallel ? std::max<std::size_t>(opts.max_parallel, 1) : 1;

        groups_.clear();
        for (std::size_t first = 0; first < commands_.size(); first += group_size) {
            groups_.push_back(Group{first, std::min(first + group_size, commands_.size()), first, now, {}, false});
        }
        max_active_ = width;
        next_group_ = 0;
        active_.clear();
        fill_slots_(now);

        result_ = BatchResult{};
        result_.stats.start_time = now;
        result_.stats.end_time = now;
        running_ = true;
        return Error::None;
    }

    template<SinkConcept Sink>
    inline bool pump(TimePoint now, memory::BufferPool& pool, Sink&& sink) {
        if (!running_) {
            return false;
        }
        for (std::size_t slot = 0; slot < active_.size(); ++slot) {
            step_group_(groups_[active_[slot]], now, pool, sink);
        }
        // Retire finished groups and admit pending ones
        std::erase_if(active_, [this](std::size_t g) { return groups_[g].finished; });
        fill_slots_(now);

        if (active_.empty()) {
            running_ = false;
            result_.stats.end_time = now;
            result_.success = result_.failed_count == 0;
            return false;
        }
        return true;
    }

    // Abandon the batch: in-flight and pending commands count as failed
    inline void abort(TimePoint now) noexcept {
        if (!running_) {
            return;
        }
        for (auto& g : groups_) {
            if (g.finished) continue;
            if (g.job.running()) {
                g.job.abort(now);
                result_.stats.merge(g.job.stats());
            }
            result_.failed_count += static_cast<std::uint32_t>(g.end - g.cursor);
            result_.stats.total_commands += g.end - g.cursor;
            g.finished = true;
        }
        active_.clear();
        running_ = false;
        result_.stats.end_time = now;
        result_.success = false;
    }

    [[nodiscard]] inline bool running() const noexcept { return running_; }
    [[nodiscard]] inline const BatchResult& result() const noexcept { return result_; }
    [[nodiscard]] inline std::size_t group_count() const noexcept { return groups_.size(); }
    [[nodiscard]] inline std::size_t active_groups() const noexcept { return active_.size(); }

private:
    struct Group {
        std::size_t first;
        std::size_t end;
        std::size_t cursor;
        TimePoint next_due;
        ChunkedSend job;
        bool finished;
    };

    inline void fill_slots_(TimePoint now) {
        while (active_.size() < max_active_ && next_group_ < groups_.size()) {
            groups_[next_group_].next_due = now;
            active_.push_back(next_group_++);
        }
    }

    template<class Sink>
    inline void step_group_(Group& g, TimePoint now, memory::BufferPool& pool, Sink& sink) {
        while (!g.finished) {
            if (!g.job.running()) {
                if (now < g.next_due) {
                    return;
                }
                const auto& payload = commands_[g.cursor];
                const std::size_t chunk = use_chunks_ ? plan_.chunk_size : payload.size();
                if (g.job.start(payload, chunk, plan_.chunk_delay, now) != Error::None) {
                    complete_command_(g, now, false);
                    continue;
                }
            }
            const Status s = g.job.pump(now, pool, sink);
            if (s != Status::Succeeded && s != Status::Failed) {
                return; // waiting for the next chunk deadline
            }
            result_.stats.merge(g.job.stats());
            complete_command_(g, now, s == Status::Succeeded);
        }
    }

    inline void complete_command_(Group& g, TimePoint now, bool ok) {
        ++result_.stats.total_commands;
        if (ok) {
            ++result_.stats.successful_commands;
        }
        else {
            ++result_.failed_count;
        }
        g.job.reset();
        ++g.cursor;
        if (g.cursor >= g.end) {
            g.finished = true;
        }
        else {
            g.next_due = now + plan_.command_delay;
        }
    }

private:
    std::vector<std::vector<std::uint8_t>> commands_{};
    std::vector<Group> groups_{};
    std::vector<std::size_t> active_{};
    std::size_t max_active_{1};
    std::size_t next_group_{0};
    Plan plan_{0, Millis{0}, Millis{0}};
    bool use_chunks_{true};
    bool running_{false};
    BatchResult result_{};
};

} // namespace printlink::core::transmission
