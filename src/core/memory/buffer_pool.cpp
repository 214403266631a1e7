#include "printlink/core/memory/buffer_pool.hpp"

#include <algorithm>
#include <cstring>

#include "lcr/log/logger.hpp"

namespace printlink::core::memory {

// ----------------------------------------------------------------------------
// Buffer
// ----------------------------------------------------------------------------

Buffer::Buffer(std::size_t capacity, std::size_t bucket)
    : bytes_(std::make_unique<std::uint8_t[]>(capacity))
    , capacity_(capacity)
    , size_(0)
    , bucket_(bucket)
{}

std::size_t Buffer::assign(std::span<const std::uint8_t> src) noexcept {
    const std::size_t n = std::min(src.size(), capacity_);
    if (n > 0) {
        std::memcpy(bytes_.get(), src.data(), n);
    }
    size_ = n;
    return n;
}

// ----------------------------------------------------------------------------
// BufferPool
// ----------------------------------------------------------------------------

BufferPool::BufferPool(const PoolConfig& config)
    : prefill_(config.buffers_per_bucket)
    , max_per_bucket_(std::max(config.max_per_bucket, config.buffers_per_bucket))
{
    std::vector<std::size_t> sizes = config.bucket_sizes;
    std::sort(sizes.begin(), sizes.end());
    sizes.erase(std::unique(sizes.begin(), sizes.end()), sizes.end());
    sizes.erase(std::remove(sizes.begin(), sizes.end(), std::size_t{0}), sizes.end());

    buckets_.reserve(sizes.size());
    for (std::size_t capacity : sizes) {
        buckets_.push_back(Bucket{capacity, {}});
    }
    prewarm();
    PL_DEBUG("[POOL] " << buckets_.size() << " buckets, " << prefill_ << " buffers each (ceiling " << ceiling() << " bytes)");
}

std::size_t BufferPool::bucket_for_(std::size_t size) const noexcept {
    for (std::size_t i = 0; i < buckets_.size(); ++i) {
        if (buckets_[i].capacity >= size) {
            return i;
        }
    }
    return Buffer::UNPOOLED;
}

Buffer BufferPool::acquire(std::size_t size) {
    const std::size_t index = bucket_for_(size);
    if (index == Buffer::UNPOOLED) {
        ++counters_.unpooled;
        return Buffer(size == 0 ? 1 : size, Buffer::UNPOOLED);
    }
    auto& bucket = buckets_[index];
    if (!bucket.idle.empty()) {
        Buffer b = std::move(bucket.idle.back());
        bucket.idle.pop_back();
        b.size_ = 0;
        ++counters_.hits;
        return b;
    }
    ++counters_.misses;
    return Buffer(bucket.capacity, index);
}

void BufferPool::release(Buffer&& buffer) noexcept {
    if (!buffer.valid()) {
        return;
    }
    Buffer local = std::move(buffer);
    if (!local.pooled() || local.bucket_ >= buckets_.size()
        || buckets_[local.bucket_].capacity != local.capacity_) {
        return; // freed on scope exit
    }
    auto& bucket = buckets_[local.bucket_];
    if (bucket.idle.size() >= max_per_bucket_) {
        ++counters_.drops;
        return;
    }
    local.size_ = 0;
    bucket.idle.push_back(std::move(local));
}

std::size_t BufferPool::trim() noexcept {
    std::size_t freed = 0;
    for (auto& bucket : buckets_) {
        while (bucket.idle.size() > prefill_) {
            bucket.idle.pop_back();
            ++freed;
        }
    }
    if (freed > 0) {
        PL_DEBUG("[POOL] Trimmed " << freed << " idle buffers");
    }
    return freed;
}

void BufferPool::release_all() noexcept {
    std::size_t freed = 0;
    for (auto& bucket : buckets_) {
        freed += bucket.idle.size();
        bucket.idle.clear();
        bucket.idle.shrink_to_fit();
    }
    PL_DEBUG("[POOL] Released " << freed << " idle buffers");
}

void BufferPool::prewarm() {
    for (std::size_t i = 0; i < buckets_.size(); ++i) {
        auto& bucket = buckets_[i];
        bucket.idle.reserve(max_per_bucket_);
        while (bucket.idle.size() < prefill_) {
            bucket.idle.push_back(Buffer(bucket.capacity, i));
        }
    }
}

std::size_t BufferPool::available(std::size_t capacity) const noexcept {
    for (const auto& bucket : buckets_) {
        if (bucket.capacity == capacity) {
            return bucket.idle.size();
        }
    }
    return 0;
}

std::size_t BufferPool::total_available() const noexcept {
    std::size_t n = 0;
    for (const auto& bucket : buckets_) {
        n += bucket.idle.size();
    }
    return n;
}

lcr::memory::footprint BufferPool::memory_usage() const noexcept {
    lcr::memory::footprint fp{};
    fp.add_static(sizeof(*this));
    for (const auto& bucket : buckets_) {
        fp.add_dynamic(bucket.idle.capacity() * sizeof(Buffer));
        fp.add_dynamic(bucket.idle.size() * bucket.capacity);
    }
    return fp;
}

} // namespace printlink::core::memory
