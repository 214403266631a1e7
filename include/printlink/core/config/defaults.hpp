/*
================================================================================
Compile-time defaults
================================================================================

Default values for every runtime tunable of the core. They seed core::Config
and are the values restored by repair routines ("reapply default-ish flow
parameters").

Units: sizes in bytes, delays and intervals in milliseconds, ratios in [0,1],
signal strength in dBm, battery in percent.
================================================================================
*/
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>


namespace printlink::core::config {

// -----------------------------------------------------------------------------
// Flow control
// -----------------------------------------------------------------------------
inline constexpr std::size_t   DEFAULT_CHUNK_SIZE        = 20;
inline constexpr std::uint32_t DEFAULT_CHUNK_DELAY_MS    = 20;
inline constexpr std::uint32_t DEFAULT_COMMAND_DELAY_MS  = 50;
inline constexpr std::size_t   MIN_CHUNK_SIZE            = 10;
inline constexpr std::size_t   MAX_CHUNK_SIZE            = 200;
inline constexpr std::uint32_t MIN_CHUNK_DELAY_MS        = 5;
inline constexpr std::uint32_t MAX_CHUNK_DELAY_MS        = 100;
inline constexpr double        QUALITY_THRESHOLD         = 0.80;
inline constexpr double        QUALITY_EXCELLENT         = 0.98;

// Tuning steps
inline constexpr std::size_t   CHUNK_SHRINK_STEP         = 5;
inline constexpr std::size_t   CHUNK_GROW_STEP           = 10;
inline constexpr std::uint32_t DELAY_STEP_MS             = 5;

// -----------------------------------------------------------------------------
// Command queue & scheduler
// -----------------------------------------------------------------------------
inline constexpr std::size_t   QUEUE_BOUND               = 100;
inline constexpr std::uint32_t COMMAND_MAX_RETRIES       = 3;
inline constexpr std::uint32_t COMMAND_RETRY_DELAY_MS    = 500;

// Completion and notice rings (power of two, usable capacity is N - 1)
inline constexpr std::size_t   COMPLETION_RING_SIZE      = 256;
inline constexpr std::size_t   NOTICE_RING_SIZE          = 128;
static_assert(COMPLETION_RING_SIZE - 1 >= QUEUE_BOUND, "Completion ring must hold a full queue of outcomes");

// -----------------------------------------------------------------------------
// Connection & reconnection
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t CONNECT_TIMEOUT_MS        = 10'000;
inline constexpr std::uint32_t MAX_RECONNECT_ATTEMPTS    = 5;
inline constexpr std::uint32_t RECONNECT_BASE_DELAY_MS   = 1'000;
inline constexpr std::uint32_t RECONNECT_MAX_DELAY_MS    = 30'000;

// -----------------------------------------------------------------------------
// Health & diagnostics
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t QUALITY_CHECK_INTERVAL_MS = 15'000;
inline constexpr std::uint32_t BATTERY_CHECK_INTERVAL_MS = 60'000;
inline constexpr int           SIGNAL_WARN_DBM           = -80;
inline constexpr double        QUALITY_WARN_RATIO        = 0.70;
inline constexpr int           BATTERY_LOW_PERCENT       = 20;
inline constexpr int           BATTERY_CRITICAL_PERCENT  = 10;

// Probe written to validate a link: ESC @ (printer initialise), harmless
inline constexpr std::array<std::uint8_t, 2> PROBE_COMMAND{0x1B, 0x40};

// -----------------------------------------------------------------------------
// Buffer pool
// -----------------------------------------------------------------------------
inline constexpr std::array<std::size_t, 6> POOL_BUCKET_SIZES{20, 64, 128, 182, 256, 512};
inline constexpr std::size_t   POOL_BUFFERS_PER_BUCKET   = 5;
inline constexpr std::size_t   POOL_MAX_PER_BUCKET       = 10;

// -----------------------------------------------------------------------------
// Resource governor
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t SWEEP_INTERVAL_MS         = 60'000;
inline constexpr std::uint32_t INACTIVITY_TIMEOUT_MS     = 300'000;
inline constexpr std::uint32_t DEVICE_CACHE_TTL_MS       = 300'000;

// -----------------------------------------------------------------------------
// Connection history
// -----------------------------------------------------------------------------
inline constexpr std::size_t   HISTORY_MAX_ENTRIES       = 10;

} // namespace printlink::core::config
