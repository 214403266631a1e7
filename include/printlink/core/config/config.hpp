#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include <cstdint>

#include "printlink/core/error.hpp"
#include "printlink/core/clock.hpp"
#include "printlink/core/device.hpp"
#include "printlink/core/config/defaults.hpp"
#include "printlink/core/flow/params.hpp"
#include "printlink/core/power/mode.hpp"
#include "printlink/core/transport/backoff.hpp"

namespace printlink::core {

/*
===============================================================================
 core::Config
===============================================================================

Runtime configuration handed by value to the Manager at construction.
Grouped per component; every field is seeded from config/defaults.hpp.

There is no process-wide configuration object: two managers in the same
process may run with different configurations.
===============================================================================
*/

struct FlowConfig {
    flow::Params initial{};
    flow::Steps steps{};
    double excellent_quality{config::QUALITY_EXCELLENT};
};

struct QueueConfig {
    std::size_t bound{config::QUEUE_BOUND};
    std::uint32_t default_max_retries{config::COMMAND_MAX_RETRIES};
    Millis retry_delay{config::COMMAND_RETRY_DELAY_MS};
};

struct ReconnectConfig {
    bool enabled{true};
    std::uint32_t max_attempts{config::MAX_RECONNECT_ATTEMPTS};
    Millis base_delay{config::RECONNECT_BASE_DELAY_MS};
    Millis max_delay{config::RECONNECT_MAX_DELAY_MS};
    Millis connect_timeout{config::CONNECT_TIMEOUT_MS};
};

struct HealthConfig {
    bool monitor_quality{true};
    bool monitor_battery{true};
    Millis quality_interval{config::QUALITY_CHECK_INTERVAL_MS};
    Millis battery_interval{config::BATTERY_CHECK_INTERVAL_MS};
    int signal_warn_dbm{config::SIGNAL_WARN_DBM};
    double quality_warn_ratio{config::QUALITY_WARN_RATIO};
    int battery_low_percent{config::BATTERY_LOW_PERCENT};
    int battery_critical_percent{config::BATTERY_CRITICAL_PERCENT};
};

struct PowerConfig {
    bool enabled{false};
    power::Mode mode{power::Mode::Balanced};
    Millis inactivity_timeout{config::INACTIVITY_TIMEOUT_MS};
    Millis sweep_interval{config::SWEEP_INTERVAL_MS};
    Millis device_cache_ttl{config::DEVICE_CACHE_TTL_MS};
};

struct PoolConfig {
    std::vector<std::size_t> bucket_sizes{config::POOL_BUCKET_SIZES.begin(), config::POOL_BUCKET_SIZES.end()};
    std::size_t buffers_per_bucket{config::POOL_BUFFERS_PER_BUCKET};
    std::size_t max_per_bucket{config::POOL_MAX_PER_BUCKET};
};

// Standard receipt-printer GATT layout (vendor write service, battery service)
struct GattConfig {
    GattEndpoint write{"000018f0-0000-1000-8000-00805f9b34fb", "00002af1-0000-1000-8000-00805f9b34fb"};
    GattEndpoint notify{"000018f0-0000-1000-8000-00805f9b34fb", "00002af0-0000-1000-8000-00805f9b34fb"};
    GattEndpoint battery{"0000180f-0000-1000-8000-00805f9b34fb", "00002a19-0000-1000-8000-00805f9b34fb"};
};

struct Config {
    FlowConfig flow{};
    QueueConfig queue{};
    ReconnectConfig reconnect{};
    HealthConfig health{};
    PowerConfig power{};
    PoolConfig pool{};
    GattConfig gatt{};
    std::size_t history_max_entries{config::HISTORY_MAX_ENTRIES};
};

namespace config {

// Overlay a JSON document onto cfg. Unknown keys are ignored.
// On any type mismatch or malformed document cfg is left untouched and
// Error::InvalidArgument is returned.
[[nodiscard]]
Error load_json(std::string_view text, Config& cfg);

// Read a file and overlay it (see load_json). Missing file → InvalidArgument.
[[nodiscard]]
Error load_file(const std::string& path, Config& cfg);

} // namespace config

} // namespace printlink::core
