// ============================================================================
// BufferPool
// ----------------------------------------------------------------------------
// Size-bucketed pool of reusable byte buffers for chunked writes.
//
// Each bucket holds buffers of one fixed capacity (default 20, 64, 128, 182,
// 256 and 512 bytes) and is pre-filled with `buffers_per_bucket` buffers.
//
//   acquire(n)   smallest bucket capacity >= n, popped from the bucket or
//                freshly allocated for it. Requests above the largest bucket
//                get an unpooled heap buffer.
//   release(b)   returns a pooled buffer to its bucket, unless the bucket
//                already holds `max_per_bucket` buffers (the buffer is freed).
//                Unpooled buffers are always freed.
//
// Governor hooks: trim() shrinks oversized buckets back to the prefill size,
// release_all() frees every idle buffer and prewarm() refills them.
//
// Single-threaded: owned by the Manager and touched from poll() only.
// ============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "printlink/core/config/config.hpp"
#include "lcr/memory/footprint.hpp"

namespace printlink::core::memory {

class BufferPool;

// Owning byte buffer with explicit size over a fixed capacity
class Buffer {
public:
    Buffer() noexcept = default;

    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] inline std::uint8_t* data() noexcept { return bytes_.get(); }
    [[nodiscard]] inline const std::uint8_t* data() const noexcept { return bytes_.get(); }

    [[nodiscard]] inline std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] inline std::size_t size() const noexcept { return size_; }
    [[nodiscard]] inline bool pooled() const noexcept { return bucket_ != UNPOOLED; }
    [[nodiscard]] inline bool valid() const noexcept { return bytes_ != nullptr; }

    // Copy src into the buffer (truncated to capacity); returns bytes copied
    std::size_t assign(std::span<const std::uint8_t> src) noexcept;

    [[nodiscard]]
    inline std::span<const std::uint8_t> view() const noexcept {
        return {bytes_.get(), size_};
    }

private:
    friend class BufferPool;

    static constexpr std::size_t UNPOOLED = static_cast<std::size_t>(-1);

    Buffer(std::size_t capacity, std::size_t bucket);

    std::unique_ptr<std::uint8_t[]> bytes_{};
    std::size_t capacity_{0};
    std::size_t size_{0};
    std::size_t bucket_{UNPOOLED};
};


class BufferPool {
public:
    // Counters of pool behaviour since construction
    struct Counters {
        std::uint64_t hits{0};
        std::uint64_t misses{0};
        std::uint64_t unpooled{0};
        std::uint64_t drops{0};
    };

    explicit BufferPool(const PoolConfig& config);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    [[nodiscard]]
    Buffer acquire(std::size_t size);

    void release(Buffer&& buffer) noexcept;

    // Shrink buckets above the prefill size; returns buffers freed
    std::size_t trim() noexcept;

    // Free every idle buffer (idle mode)
    void release_all() noexcept;

    // Refill each bucket up to the prefill size
    void prewarm();

    // Largest pooled capacity; larger requests are served unpooled
    [[nodiscard]]
    inline std::size_t ceiling() const noexcept {
        return buckets_.empty() ? 0 : buckets_.back().capacity;
    }

    // Idle buffers currently held by the bucket of exactly `capacity`
    [[nodiscard]]
    std::size_t available(std::size_t capacity) const noexcept;

    [[nodiscard]]
    std::size_t total_available() const noexcept;

    [[nodiscard]]
    inline std::size_t bucket_count() const noexcept { return buckets_.size(); }

    [[nodiscard]]
    inline const Counters& counters() const noexcept { return counters_; }

    [[nodiscard]]
    lcr::memory::footprint memory_usage() const noexcept;

private:
    struct Bucket {
        std::size_t capacity;
        std::vector<Buffer> idle;
    };

    [[nodiscard]]
    std::size_t bucket_for_(std::size_t size) const noexcept;

    std::vector<Bucket> buckets_;
    std::size_t prefill_;
    std::size_t max_per_bucket_;
    Counters counters_{};
};

} // namespace printlink::core::memory
