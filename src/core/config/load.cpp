#include "printlink/core/config/config.hpp"
#include "printlink/core/json/helpers.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace printlink::core::config {

namespace {

using simdjson::dom::element;

// ------------------------------------------------------------
// Field overlays (missing key = keep current value)
// ------------------------------------------------------------

template<class T>
[[nodiscard]]
Error overlay_unsigned(const element& obj, const char* key, T& target) noexcept {
    lcr::optional<std::uint64_t> v;
    if (json::parse_uint64_optional(obj, key, v) != Error::None) {
        return Error::InvalidArgument;
    }
    if (v.has()) {
        if (v.value() > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            return Error::InvalidArgument;
        }
        target = static_cast<T>(v.value());
    }
    return Error::None;
}

[[nodiscard]]
Error overlay_int(const element& obj, const char* key, int& target) noexcept {
    lcr::optional<std::int64_t> v;
    if (json::parse_int64_optional(obj, key, v) != Error::None) {
        return Error::InvalidArgument;
    }
    if (v.has()) {
        if (v.value() < std::numeric_limits<int>::min() || v.value() > std::numeric_limits<int>::max()) {
            return Error::InvalidArgument;
        }
        target = static_cast<int>(v.value());
    }
    return Error::None;
}

[[nodiscard]]
Error overlay_millis(const element& obj, const char* key, Millis& target) noexcept {
    lcr::optional<std::uint64_t> v;
    if (json::parse_uint64_optional(obj, key, v) != Error::None) {
        return Error::InvalidArgument;
    }
    if (v.has()) {
        if (v.value() > static_cast<std::uint64_t>(std::numeric_limits<Millis::rep>::max())) {
            return Error::InvalidArgument;
        }
        target = Millis{static_cast<Millis::rep>(v.value())};
    }
    return Error::None;
}

[[nodiscard]]
Error overlay_double(const element& obj, const char* key, double& target) noexcept {
    lcr::optional<double> v;
    if (json::parse_double_optional(obj, key, v) != Error::None) {
        return Error::InvalidArgument;
    }
    if (v.has()) {
        target = v.value();
    }
    return Error::None;
}

[[nodiscard]]
Error overlay_bool(const element& obj, const char* key, bool& target) noexcept {
    lcr::optional<bool> v;
    if (json::parse_bool_optional(obj, key, v) != Error::None) {
        return Error::InvalidArgument;
    }
    if (v.has()) {
        target = v.value();
    }
    return Error::None;
}

[[nodiscard]]
Error overlay_string(const element& obj, const char* key, std::string& target) {
    lcr::optional<std::string> v;
    if (json::parse_string_optional(obj, key, v) != Error::None) {
        return Error::InvalidArgument;
    }
    if (v.has()) {
        target = v.value();
    }
    return Error::None;
}

// Stops at the first failing overlay
#define PL_OVERLAY(expr)                        \
    do {                                        \
        if ((expr) != Error::None) {            \
            return Error::InvalidArgument;      \
        }                                       \
    } while (0)

// ------------------------------------------------------------
// Sections
// ------------------------------------------------------------

[[nodiscard]]
Error overlay_flow(const element& obj, FlowConfig& flow) {
    auto& p = flow.initial;
    PL_OVERLAY(overlay_unsigned(obj, "chunk_size", p.chunk_size));
    PL_OVERLAY(overlay_millis(obj, "chunk_delay_ms", p.chunk_delay));
    PL_OVERLAY(overlay_millis(obj, "command_delay_ms", p.command_delay));
    PL_OVERLAY(overlay_bool(obj, "auto_adjust", p.auto_adjust));
    PL_OVERLAY(overlay_unsigned(obj, "min_chunk_size", p.min_chunk_size));
    PL_OVERLAY(overlay_unsigned(obj, "max_chunk_size", p.max_chunk_size));
    PL_OVERLAY(overlay_millis(obj, "min_chunk_delay_ms", p.min_chunk_delay));
    PL_OVERLAY(overlay_millis(obj, "max_chunk_delay_ms", p.max_chunk_delay));
    PL_OVERLAY(overlay_double(obj, "quality_threshold", p.quality_threshold));
    PL_OVERLAY(overlay_unsigned(obj, "shrink_step", flow.steps.shrink));
    PL_OVERLAY(overlay_unsigned(obj, "grow_step", flow.steps.grow));
    PL_OVERLAY(overlay_millis(obj, "delay_step_ms", flow.steps.delay));
    PL_OVERLAY(overlay_double(obj, "excellent_quality", flow.excellent_quality));
    if (p.chunk_size == 0) {
        return Error::InvalidArgument;
    }
    p = p.clamped();
    return Error::None;
}

[[nodiscard]]
Error overlay_queue(const element& obj, QueueConfig& queue) {
    PL_OVERLAY(overlay_unsigned(obj, "bound", queue.bound));
    PL_OVERLAY(overlay_unsigned(obj, "max_retries", queue.default_max_retries));
    PL_OVERLAY(overlay_millis(obj, "retry_delay_ms", queue.retry_delay));
    if (queue.bound == 0 || queue.bound > COMPLETION_RING_SIZE - 1) {
        return Error::InvalidArgument;
    }
    return Error::None;
}

[[nodiscard]]
Error overlay_reconnect(const element& obj, ReconnectConfig& rc) {
    PL_OVERLAY(overlay_bool(obj, "enabled", rc.enabled));
    PL_OVERLAY(overlay_unsigned(obj, "max_attempts", rc.max_attempts));
    PL_OVERLAY(overlay_millis(obj, "base_delay_ms", rc.base_delay));
    PL_OVERLAY(overlay_millis(obj, "max_delay_ms", rc.max_delay));
    PL_OVERLAY(overlay_millis(obj, "connect_timeout_ms", rc.connect_timeout));
    return Error::None;
}

[[nodiscard]]
Error overlay_health(const element& obj, HealthConfig& h) {
    PL_OVERLAY(overlay_bool(obj, "monitor_quality", h.monitor_quality));
    PL_OVERLAY(overlay_bool(obj, "monitor_battery", h.monitor_battery));
    PL_OVERLAY(overlay_millis(obj, "quality_interval_ms", h.quality_interval));
    PL_OVERLAY(overlay_millis(obj, "battery_interval_ms", h.battery_interval));
    PL_OVERLAY(overlay_int(obj, "signal_warn_dbm", h.signal_warn_dbm));
    PL_OVERLAY(overlay_double(obj, "quality_warn_ratio", h.quality_warn_ratio));
    PL_OVERLAY(overlay_int(obj, "battery_low_percent", h.battery_low_percent));
    PL_OVERLAY(overlay_int(obj, "battery_critical_percent", h.battery_critical_percent));
    return Error::None;
}

[[nodiscard]]
Error overlay_power(const element& obj, PowerConfig& pw) {
    PL_OVERLAY(overlay_bool(obj, "enabled", pw.enabled));
    std::string mode_name;
    PL_OVERLAY(overlay_string(obj, "mode", mode_name));
    if (!mode_name.empty() && !power::parse_mode(mode_name, pw.mode)) {
        return Error::InvalidArgument;
    }
    PL_OVERLAY(overlay_millis(obj, "inactivity_timeout_ms", pw.inactivity_timeout));
    PL_OVERLAY(overlay_millis(obj, "sweep_interval_ms", pw.sweep_interval));
    PL_OVERLAY(overlay_millis(obj, "device_cache_ttl_ms", pw.device_cache_ttl));
    return Error::None;
}

[[nodiscard]]
Error overlay_pool(const element& obj, PoolConfig& pool) {
    simdjson::dom::array sizes;
    bool present = false;
    PL_OVERLAY(json::parse_array_optional(obj, "bucket_sizes", sizes, present));
    if (present) {
        std::vector<std::size_t> parsed;
        for (auto v : sizes) {
            std::uint64_t n{};
            if (v.get(n) || n == 0) {
                return Error::InvalidArgument;
            }
            parsed.push_back(static_cast<std::size_t>(n));
        }
        if (parsed.empty()) {
            return Error::InvalidArgument;
        }
        pool.bucket_sizes = std::move(parsed);
    }
    PL_OVERLAY(overlay_unsigned(obj, "buffers_per_bucket", pool.buffers_per_bucket));
    PL_OVERLAY(overlay_unsigned(obj, "max_per_bucket", pool.max_per_bucket));
    return Error::None;
}

[[nodiscard]]
Error overlay_endpoint(const element& parent, const char* key, GattEndpoint& ep) {
    element obj;
    bool present = false;
    PL_OVERLAY(json::parse_object_optional(parent, key, obj, present));
    if (present) {
        PL_OVERLAY(overlay_string(obj, "service", ep.service));
        PL_OVERLAY(overlay_string(obj, "characteristic", ep.characteristic));
    }
    return Error::None;
}

[[nodiscard]]
Error overlay_gatt(const element& obj, GattConfig& gatt) {
    PL_OVERLAY(overlay_endpoint(obj, "write", gatt.write));
    PL_OVERLAY(overlay_endpoint(obj, "notify", gatt.notify));
    PL_OVERLAY(overlay_endpoint(obj, "battery", gatt.battery));
    return Error::None;
}

template<class Section, class Fn>
[[nodiscard]]
Error overlay_section(const element& root, const char* key, Section& section, Fn&& fn) {
    element obj;
    bool present = false;
    PL_OVERLAY(json::parse_object_optional(root, key, obj, present));
    if (!present) {
        return Error::None;
    }
    return fn(obj, section);
}

#undef PL_OVERLAY

} // namespace


Error load_json(std::string_view text, Config& cfg) {
    simdjson::dom::parser parser;
    element root;
    auto error = parser.parse(text.data(), text.size()).get(root);
    if (error) {
        PL_WARN("[CONFIG] Malformed configuration document: " << simdjson::error_message(error));
        return Error::InvalidArgument;
    }
    if (json::require_object(root) != Error::None) {
        PL_WARN("[CONFIG] Configuration root must be an object");
        return Error::InvalidArgument;
    }

    // Work on a copy so a failure leaves cfg untouched
    Config next = cfg;
    Error err = Error::None;
    if (err == Error::None) err = overlay_section(root, "flow", next.flow, overlay_flow);
    if (err == Error::None) err = overlay_section(root, "queue", next.queue, overlay_queue);
    if (err == Error::None) err = overlay_section(root, "reconnect", next.reconnect, overlay_reconnect);
    if (err == Error::None) err = overlay_section(root, "health", next.health, overlay_health);
    if (err == Error::None) err = overlay_section(root, "power", next.power, overlay_power);
    if (err == Error::None) err = overlay_section(root, "pool", next.pool, overlay_pool);
    if (err == Error::None) err = overlay_section(root, "gatt", next.gatt, overlay_gatt);
    if (err == Error::None) err = overlay_unsigned(root, "history_max_entries", next.history_max_entries);
    if (err != Error::None) {
        PL_WARN("[CONFIG] Configuration rejected (type mismatch or out of range value)");
        return err;
    }

    cfg = std::move(next);
    return Error::None;
}

Error load_file(const std::string& path, Config& cfg) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        PL_WARN("[CONFIG] Cannot open configuration file: " << path);
        return Error::InvalidArgument;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    PL_DEBUG("[CONFIG] Loading configuration from " << path);
    return load_json(ss.str(), cfg);
}

} // namespace printlink::core::config
