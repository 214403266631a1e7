#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "printlink/core/clock.hpp"
#include "printlink/core/notice.hpp"
#include "lcr/optional.hpp"

namespace printlink::core::queue {

// Per-command submission options
struct CommandOptions {
    int priority{0};                               // higher drains first
    lcr::optional<std::uint32_t> max_retries{};    // default: QueueConfig
    bool use_chunking{true};                       // false: single write
    lcr::optional<std::string> description{};
};

// -----------------------------------------------------------------------------
// QueuedCommand
// -----------------------------------------------------------------------------
// Held exclusively by the queue (or the scheduler while in flight) until its
// terminal outcome. `seq` orders commands of equal priority; a retried
// command takes a fresh seq, which moves it to the tail of its class.
// -----------------------------------------------------------------------------
struct QueuedCommand {
    Ticket id{NO_TICKET};
    std::vector<std::uint8_t> payload{};
    int priority{0};
    TimePoint enqueued_at{};
    std::uint64_t seq{0};
    std::uint32_t attempts{0};
    std::uint32_t max_retries{0};
    bool use_chunking{true};
    lcr::optional<std::string> description{};
    TimePoint not_before{};       // retry delay
};

// Drain order: priority desc, then seq asc
[[nodiscard]]
inline bool drains_before(const QueuedCommand& a, const QueuedCommand& b) noexcept {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    return a.seq < b.seq;
}

} // namespace printlink::core::queue
