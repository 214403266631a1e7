#pragma once

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

#include "printlink/core/flow/params.hpp"
#include "printlink/core/health/snapshot.hpp"
#include "printlink/core/memory/buffer_pool.hpp"
#include "printlink/core/power/mode.hpp"
#include "printlink/core/stats/transmission.hpp"
#include "printlink/core/transport/state.hpp"
#include "lcr/format.hpp"
#include "lcr/memory/footprint.hpp"
#include "lcr/optional.hpp"

namespace printlink::core {

// -----------------------------------------------------------------------------
// PerformanceReport
// -----------------------------------------------------------------------------
// Point-in-time view assembled by Manager::performance_report().
// -----------------------------------------------------------------------------
struct PerformanceReport {
    transport::State state{transport::State::Disconnected};
    stats::TransmissionStats stats{};
    double last_transmission_speed{0.0};      // bytes/s of the last closed cycle
    flow::Params flow{};

    std::size_t queue_length{0};
    bool queue_paused{false};
    bool command_in_flight{false};

    std::size_t pool_available{0};
    memory::BufferPool::Counters pool{};
    lcr::memory::footprint pool_memory{};

    bool power_enabled{false};
    power::Mode power_mode{power::Mode::Balanced};   // effective mode
    bool idle{false};

    lcr::optional<health::Status> last_health{};
};

[[nodiscard]]
inline std::string to_string(const PerformanceReport& r) {
    std::ostringstream os;
    os << "=== Performance Report ===\n";
    os << "State                 : " << transport::to_string(r.state) << '\n';
    os << "Transmission          : " << r.stats << '\n';
    os << "Last speed            : " << lcr::format_rate(r.last_transmission_speed) << '\n';
    os << "Flow                  : " << r.flow << '\n';
    os << "Queue                 : " << r.queue_length << " pending"
       << (r.queue_paused ? " (paused)" : "")
       << (r.command_in_flight ? ", 1 in flight" : "") << '\n';
    os << "Pool                  : " << r.pool_available << " idle buffers, "
       << lcr::format_bytes_scaled(r.pool_memory.dynamic_bytes) << " held"
       << " (hits " << lcr::format_number_exact(r.pool.hits)
       << ", misses " << lcr::format_number_exact(r.pool.misses)
       << ", unpooled " << lcr::format_number_exact(r.pool.unpooled)
       << ", drops " << lcr::format_number_exact(r.pool.drops) << ")\n";
    os << "Power                 : ";
    if (r.power_enabled) {
        os << power::to_string(r.power_mode) << (r.idle ? " (idle)" : "");
    }
    else {
        os << "off";
    }
    os << '\n';
    os << "Last health           : "
       << (r.last_health.has() ? health::to_string(r.last_health.value()) : std::string_view{"n/a"}) << '\n';
    os << "==========================";
    return os.str();
}

} // namespace printlink::core
