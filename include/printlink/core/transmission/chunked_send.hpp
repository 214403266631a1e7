#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "printlink/core/clock.hpp"
#include "printlink/core/error.hpp"
#include "printlink/core/memory/buffer_pool.hpp"
#include "printlink/core/stats/transmission.hpp"
#include "lcr/log/logger.hpp"

namespace printlink::core::transmission {

// A write sink performs one chunk write as a unit and reports its outcome
template<class S>
concept SinkConcept =
    requires(S s, std::span<const std::uint8_t> bytes) {
        { s(bytes) } -> std::same_as<bool>;
    };

enum class Status : std::uint8_t {
    Idle,
    Running,
    Succeeded,
    Failed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Idle:      return "Idle";
        case Status::Running:   return "Running";
        case Status::Succeeded: return "Succeeded";
        case Status::Failed:    return "Failed";
        default:                return "Unknown";
    }
}

/*
===============================================================================
 ChunkedSend
===============================================================================

Poll-driven delivery of one payload as ceil(len / chunk_size) chunk writes.

  Pass 1   every chunk in order, chunk_delay apart
  Pass 2   chunks that failed in pass 1, in order, 2 * chunk_delay apart
           (starting 2 * chunk_delay after the last pass-1 write)

The job succeeds iff every chunk eventually succeeds. Each chunk is copied
into a buffer borrowed from the pool (heap for sizes above the pool
ceiling) and the buffer goes back to the pool right after its write, so no
buffer is held across a deadline.

pump(now) performs every write that is due at `now`: with a zero delay the
whole job completes inside a single pump.

Accounting: every attempt adds its bytes to total_bytes (retries
included); successful attempts add to successful_bytes; each pass-2 write
counts one retry.
===============================================================================
*/

class ChunkedSend {
public:
    ChunkedSend() = default;

    [[nodiscard]]
    inline Error start(std::span<const std::uint8_t> payload, std::size_t chunk_size, Millis chunk_delay, TimePoint now) {
        if (payload.empty() || chunk_size == 0) {
            return Error::InvalidArgument;
        }
        payload_.assign(payload.begin(), payload.end());
        chunk_size_ = chunk_size;
        delay_ = chunk_delay.count() < 0 ? Millis{0} : chunk_delay;
        chunk_count_ = (payload_.size() + chunk_size_ - 1) / chunk_size_;
        failed_.clear();
        retry_cursor_ = 0;
        unrecovered_ = 0;
        cursor_ = 0;
        pass_ = 1;
        writes_ = 0;
        write_failures_ = 0;
        stats_ = stats::TransmissionStats{};
        stats_.start_time = now;
        stats_.end_time = now;
        next_due_ = now;
        status_ = Status::Running;
        return Error::None;
    }

    template<SinkConcept Sink>
    inline Status pump(TimePoint now, memory::BufferPool& pool, Sink&& sink) {
        while (status_ == Status::Running && now >= next_due_) {
            if (pass_ == 1) {
                const std::size_t index = cursor_++;
                if (!write_chunk_(index, pool, sink)) {
                    failed_.push_back(index);
                }
                if (cursor_ < chunk_count_) {
                    next_due_ = now + delay_;
                }
                else if (!failed_.empty()) {
                    pass_ = 2;
                    next_due_ = now + 2 * delay_;
                    PL_DEBUG("[PIPE] " << failed_.size() << "/" << chunk_count_ << " chunks failed, retrying");
                }
                else {
                    finish_(now, Status::Succeeded);
                }
            }
            else {
                const std::size_t index = failed_[retry_cursor_++];
                stats_.retry_count++;
                if (!write_chunk_(index, pool, sink)) {
                    ++unrecovered_;
                }
                if (retry_cursor_ < failed_.size()) {
                    next_due_ = now + 2 * delay_;
                }
                else {
                    finish_(now, unrecovered_ == 0 ? Status::Succeeded : Status::Failed);
                }
            }
        }
        return status_;
    }

    // Abandon the job (link lost): remaining chunks are not attempted
    inline void abort(TimePoint now) noexcept {
        if (status_ == Status::Running) {
            finish_(now, Status::Failed);
        }
    }

    inline void reset() noexcept {
        status_ = Status::Idle;
        payload_.clear();
        failed_.clear();
    }

    [[nodiscard]] inline Status status() const noexcept { return status_; }
    [[nodiscard]] inline bool running() const noexcept { return status_ == Status::Running; }
    [[nodiscard]] inline bool done() const noexcept { return status_ == Status::Succeeded || status_ == Status::Failed; }
    [[nodiscard]] inline std::size_t chunk_count() const noexcept { return chunk_count_; }
    [[nodiscard]] inline std::size_t writes() const noexcept { return writes_; }
    [[nodiscard]] inline std::size_t write_failures() const noexcept { return write_failures_; }
    [[nodiscard]] inline TimePoint next_due() const noexcept { return next_due_; }
    [[nodiscard]] inline const stats::TransmissionStats& stats() const noexcept { return stats_; }

private:
    template<class Sink>
    inline bool write_chunk_(std::size_t index, memory::BufferPool& pool, Sink& sink) {
        const std::size_t offset = index * chunk_size_;
        const std::size_t len = std::min(chunk_size_, payload_.size() - offset);

        memory::Buffer buffer = pool.acquire(len);
        buffer.assign(std::span<const std::uint8_t>(payload_.data() + offset, len));
        const bool ok = sink(buffer.view());
        pool.release(std::move(buffer));

        ++writes_;
        stats_.total_bytes += len;
        if (ok) {
            stats_.successful_bytes += len;
        }
        else {
            ++write_failures_;
            PL_TRACE("[PIPE] Chunk " << index << " (" << len << " bytes) failed in pass " << pass_);
        }
        return ok;
    }

    inline void finish_(TimePoint now, Status status) noexcept {
        stats_.end_time = now;
        status_ = status;
        if (status == Status::Failed) {
            PL_DEBUG("[PIPE] Chunked send failed after " << writes_ << " writes");
        }
    }

private:
    std::vector<std::uint8_t> payload_{};
    std::vector<std::size_t> failed_{};
    std::size_t chunk_size_{0};
    std::size_t chunk_count_{0};
    std::size_t cursor_{0};
    std::size_t retry_cursor_{0};
    std::size_t unrecovered_{0};
    std::size_t writes_{0};
    std::size_t write_failures_{0};
    int pass_{1};
    Millis delay_{0};
    TimePoint next_due_{};
    stats::TransmissionStats stats_{};
    Status status_{Status::Idle};
};

} // namespace printlink::core::transmission
