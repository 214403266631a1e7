#pragma once

#include <ostream>

#include "lcr/metrics/counter.hpp"
#include "lcr/format.hpp"

namespace printlink::core::telemetry {

// ============================================================================
// Manager Telemetry
//
// Mechanical facts observed by the Manager and the components it owns.
// Counters only: no timings, no derived ratios (see performance_report()).
// Written from the polling thread only.
// ============================================================================

struct Manager final {
    // ---------------------------------------------------------------------
    // Link lifecycle
    // ---------------------------------------------------------------------
    lcr::metrics::counter32 connect_attempts_total;
    lcr::metrics::counter32 connect_success_total;
    lcr::metrics::counter32 connect_failure_total;
    lcr::metrics::counter32 disconnect_calls_total;

    // Link lost while connected without a local close()
    lcr::metrics::counter32 unexpected_disconnects_total;

    // ---------------------------------------------------------------------
    // Reconnect mechanics
    // ---------------------------------------------------------------------
    lcr::metrics::counter32 reconnect_cycles_total;
    lcr::metrics::counter32 reconnect_attempts_total;
    lcr::metrics::counter32 reconnect_success_total;
    lcr::metrics::counter32 reconnect_exhausted_total;

    // ---------------------------------------------------------------------
    // Transmission pipeline
    // ---------------------------------------------------------------------
    lcr::metrics::counter64 chunk_writes_total;
    lcr::metrics::counter64 chunk_failures_total;
    lcr::metrics::counter64 chunk_retries_total;
    lcr::metrics::counter64 bytes_written_total;

    // ---------------------------------------------------------------------
    // Command queue
    // ---------------------------------------------------------------------
    lcr::metrics::counter64 commands_enqueued_total;
    lcr::metrics::counter64 commands_rejected_total;    // QueueFull
    lcr::metrics::counter64 commands_completed_total;
    lcr::metrics::counter64 commands_failed_total;      // CommandFailed
    lcr::metrics::counter64 commands_cleared_total;     // QueueCleared
    lcr::metrics::counter64 commands_retried_total;

    // ---------------------------------------------------------------------
    // Health & governor
    // ---------------------------------------------------------------------
    lcr::metrics::counter32 health_samples_total;
    lcr::metrics::counter32 health_warnings_total;
    lcr::metrics::counter32 optimizations_total;
    lcr::metrics::counter32 troubleshoot_runs_total;
    lcr::metrics::counter32 idle_entries_total;


    inline void copy_to(Manager& other) const noexcept {
        connect_attempts_total.copy_to(other.connect_attempts_total);
        connect_success_total.copy_to(other.connect_success_total);
        connect_failure_total.copy_to(other.connect_failure_total);
        disconnect_calls_total.copy_to(other.disconnect_calls_total);
        unexpected_disconnects_total.copy_to(other.unexpected_disconnects_total);

        reconnect_cycles_total.copy_to(other.reconnect_cycles_total);
        reconnect_attempts_total.copy_to(other.reconnect_attempts_total);
        reconnect_success_total.copy_to(other.reconnect_success_total);
        reconnect_exhausted_total.copy_to(other.reconnect_exhausted_total);

        chunk_writes_total.copy_to(other.chunk_writes_total);
        chunk_failures_total.copy_to(other.chunk_failures_total);
        chunk_retries_total.copy_to(other.chunk_retries_total);
        bytes_written_total.copy_to(other.bytes_written_total);

        commands_enqueued_total.copy_to(other.commands_enqueued_total);
        commands_rejected_total.copy_to(other.commands_rejected_total);
        commands_completed_total.copy_to(other.commands_completed_total);
        commands_failed_total.copy_to(other.commands_failed_total);
        commands_cleared_total.copy_to(other.commands_cleared_total);
        commands_retried_total.copy_to(other.commands_retried_total);

        health_samples_total.copy_to(other.health_samples_total);
        health_warnings_total.copy_to(other.health_warnings_total);
        optimizations_total.copy_to(other.optimizations_total);
        troubleshoot_runs_total.copy_to(other.troubleshoot_runs_total);
        idle_entries_total.copy_to(other.idle_entries_total);

    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Manager Telemetry ===\n";

        os << "Link\n";
        os << "  Connect attempts      : " << lcr::format_number_exact(connect_attempts_total.load()) << '\n';
        os << "  Connect success       : " << lcr::format_number_exact(connect_success_total.load()) << '\n';
        os << "  Connect failure       : " << lcr::format_number_exact(connect_failure_total.load()) << '\n';
        os << "  Disconnect calls      : " << lcr::format_number_exact(disconnect_calls_total.load()) << '\n';
        os << "  Unexpected drops      : " << lcr::format_number_exact(unexpected_disconnects_total.load()) << '\n';

        os << "\nReconnect\n";
        os << "  Cycles started        : " << lcr::format_number_exact(reconnect_cycles_total.load()) << '\n';
        os << "  Attempts              : " << lcr::format_number_exact(reconnect_attempts_total.load()) << '\n';
        os << "  Success               : " << lcr::format_number_exact(reconnect_success_total.load()) << '\n';
        os << "  Exhausted             : " << lcr::format_number_exact(reconnect_exhausted_total.load()) << '\n';

        os << "\nPipeline\n";
        os << "  Chunk writes          : " << lcr::format_number_exact(chunk_writes_total.load()) << '\n';
        os << "  Chunk failures        : " << lcr::format_number_exact(chunk_failures_total.load()) << '\n';
        os << "  Chunk retries         : " << lcr::format_number_exact(chunk_retries_total.load()) << '\n';
        os << "  Bytes written         : " << lcr::format_bytes_scaled(bytes_written_total.load()) << '\n';

        os << "\nQueue\n";
        os << "  Enqueued              : " << lcr::format_number_exact(commands_enqueued_total.load()) << '\n';
        os << "  Rejected (full)       : " << lcr::format_number_exact(commands_rejected_total.load()) << '\n';
        os << "  Completed             : " << lcr::format_number_exact(commands_completed_total.load()) << '\n';
        os << "  Failed                : " << lcr::format_number_exact(commands_failed_total.load()) << '\n';
        os << "  Cleared               : " << lcr::format_number_exact(commands_cleared_total.load()) << '\n';
        os << "  Retried               : " << lcr::format_number_exact(commands_retried_total.load()) << '\n';

        os << "\nHealth\n";
        os << "  Samples               : " << lcr::format_number_exact(health_samples_total.load()) << '\n';
        os << "  Warnings              : " << lcr::format_number_exact(health_warnings_total.load()) << '\n';
        os << "  Optimizations         : " << lcr::format_number_exact(optimizations_total.load()) << '\n';
        os << "  Troubleshoot runs     : " << lcr::format_number_exact(troubleshoot_runs_total.load()) << '\n';
        os << "  Idle entries          : " << lcr::format_number_exact(idle_entries_total.load()) << '\n';

        os << "=========================\n";
    }
};

} // namespace printlink::core::telemetry
