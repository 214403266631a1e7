#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded bounded ring buffer.
//
// A fixed-capacity circular buffer used for edge-triggered notifications and
// completion delivery from a poll loop to its owner.
//
// Characteristics:
//   • O(1) push/pop operations (no dynamic allocations of its own)
//   • Power-of-two capacity for modulo-free wraparound
//   • One slot is kept free: usable capacity is Capacity - 1
//
// Overflow policies:
//   push()            rejects the new element when full (returns false)
//   push_overwrite()  drops the oldest element to make room (returns false
//                     if something was dropped)
//
// Thread-safety:
//   NOT thread-safe. Must only be used from a single thread.
//------------------------------------------------------------------------------
template <typename T, size_t Capacity>
class ring_buffer {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    ring_buffer() = default;

    // Non-copyable / non-movable
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    inline bool push(const T& item) {
        const size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false; // full
        buffer_[head_] = item;
        head_ = next;
        return true;
    }

    inline bool push(T&& item) {
        const size_t next = (head_ + 1) & MASK;
        if (next == tail_) [[unlikely]]
            return false; // full
        buffer_[head_] = std::move(item);
        head_ = next;
        return true;
    }

    inline bool push_overwrite(T item) {
        bool kept_all = true;
        if (full()) [[unlikely]] {
            tail_ = (tail_ + 1) & MASK;
            kept_all = false;
        }
        buffer_[head_] = std::move(item);
        head_ = (head_ + 1) & MASK;
        return kept_all;
    }

    inline bool pop(T& out) {
        if (tail_ == head_) [[unlikely]]
            return false; // empty
        out = std::move(buffer_[tail_]);
        buffer_[tail_] = T{};
        tail_ = (tail_ + 1) & MASK;
        return true;
    }

    inline bool empty() const noexcept { return head_ == tail_; }

    inline bool full() const noexcept {
        return ((head_ + 1) & MASK) == tail_;
    }

    inline constexpr size_t capacity() const noexcept { return Capacity - 1; }

    inline size_t size() const noexcept {
        return (head_ - tail_) & MASK;
    }

    inline void clear() noexcept {
        head_ = tail_ = 0;
    }

private:
    static constexpr size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    size_t head_{0};
    size_t tail_{0};
};

} // namespace local
} // namespace lcr
