#pragma once

#include <cstdint>


namespace lcr {

// Monotonic sequence number generator (single-threaded)
class sequence {
    uint64_t next_seq_;

public:
    explicit constexpr sequence(uint64_t start = 1) noexcept : next_seq_(start) {}
    // Disable copy semantics
    sequence(const sequence&) = delete;
    sequence& operator=(const sequence&) = delete;

    // Return next sequence number and increment
    inline uint64_t next() noexcept {
        return next_seq_++;
    }

    // Peek at the next sequence number without incrementing
    inline uint64_t current() const noexcept {
        return next_seq_;
    }
};

} // namespace lcr
