#pragma once

#include <cstdint>
#include <ostream>

#include "printlink/core/clock.hpp"
#include "lcr/format.hpp"

namespace printlink::core::stats {

// -----------------------------------------------------------------------------
// TransmissionStats
// -----------------------------------------------------------------------------
// Counters of one transmission unit (single write, chunked write, batch or
// queue-drain cycle). total_bytes counts every attempted byte, retries
// included, so success_rate() is the link quality of the unit.
// -----------------------------------------------------------------------------
struct TransmissionStats {
    std::uint64_t total_bytes{0};
    std::uint64_t successful_bytes{0};
    std::uint64_t total_commands{0};
    std::uint64_t successful_commands{0};
    std::uint64_t retry_count{0};
    TimePoint start_time{};
    TimePoint end_time{};

    // Ratio of successful to attempted bytes (0 when nothing was attempted)
    [[nodiscard]]
    inline double success_rate() const noexcept {
        return total_bytes == 0 ? 0.0 : static_cast<double>(successful_bytes) / static_cast<double>(total_bytes);
    }

    [[nodiscard]]
    inline std::uint64_t duration_ms() const noexcept {
        return elapsed_ms(start_time, end_time);
    }

    [[nodiscard]]
    inline double bytes_per_second() const noexcept {
        const auto ms = duration_ms();
        if (ms == 0) {
            return 0.0;
        }
        return static_cast<double>(successful_bytes) * 1000.0 / static_cast<double>(ms);
    }

    // Accumulate the counters of a finished sub-unit (timing untouched)
    inline void merge(const TransmissionStats& other) noexcept {
        total_bytes += other.total_bytes;
        successful_bytes += other.successful_bytes;
        total_commands += other.total_commands;
        successful_commands += other.successful_commands;
        retry_count += other.retry_count;
    }
};

inline std::ostream& operator<<(std::ostream& os, const TransmissionStats& s) {
    return os << "{bytes=" << s.successful_bytes << "/" << s.total_bytes
              << ", commands=" << s.successful_commands << "/" << s.total_commands
              << ", retries=" << s.retry_count
              << ", success=" << lcr::format_percent(s.success_rate())
              << ", duration=" << lcr::format_duration_ms(s.duration_ms())
              << ", rate=" << lcr::format_rate(s.bytes_per_second()) << "}";
}

// -----------------------------------------------------------------------------
// Aggregator
// -----------------------------------------------------------------------------
// Running counters of the current cycle. A cycle is opened by begin_cycle()
// (counters reset) and stamped by end_cycle(), which also records the
// throughput of the cycle as last_transmission_speed.
// -----------------------------------------------------------------------------
class Aggregator {
public:
    inline void begin_cycle(TimePoint now) noexcept {
        current_ = TransmissionStats{};
        current_.start_time = now;
        current_.end_time = now;
        in_cycle_ = true;
    }

    inline void end_cycle(TimePoint now) noexcept {
        current_.end_time = now;
        in_cycle_ = false;
        last_speed_ = current_.bytes_per_second();
    }

    inline void record_chunk(std::uint64_t bytes, bool ok) noexcept {
        current_.total_bytes += bytes;
        if (ok) {
            current_.successful_bytes += bytes;
        }
    }

    inline void record_retry() noexcept {
        ++current_.retry_count;
    }

    inline void record_command(bool ok) noexcept {
        ++current_.total_commands;
        if (ok) {
            ++current_.successful_commands;
        }
    }

    inline void merge(const TransmissionStats& unit) noexcept {
        current_.merge(unit);
    }

    [[nodiscard]] inline const TransmissionStats& current() const noexcept { return current_; }
    [[nodiscard]] inline bool in_cycle() const noexcept { return in_cycle_; }
    [[nodiscard]] inline double last_transmission_speed() const noexcept { return last_speed_; }

private:
    TransmissionStats current_{};
    double last_speed_{0.0};
    bool in_cycle_{false};
};

} // namespace printlink::core::stats
