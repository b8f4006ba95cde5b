#pragma once

#include <ostream>

#include "bandlink/core/transport/telemetry/connection.hpp"
#include "lcr/metrics/counter.hpp"
#include "lcr/format.hpp"

namespace bandlink::core::telemetry {

// ============================================================================
// Supervisor Telemetry
//
// Protocol and supervision facts, observed on the reactor thread. Connection
// and websocket counters live in the nested transport telemetry.
// ============================================================================

struct Supervisor final {
    // Inbound traffic
    lcr::metrics::counter64 frames_total;              // sensor frames delivered
    lcr::metrics::counter64 frames_ignored_total;      // processed_data (not counted for rates)
    lcr::metrics::counter64 samples_total;             // sample timestamps fed to the estimator (L2)
    lcr::metrics::counter64 events_total;
    lcr::metrics::counter64 protocol_errors_total;     // invalid json / schema / value, dropped

    // Liveness
    lcr::metrics::counter64 health_requests_total;
    lcr::metrics::counter64 health_acks_total;
    lcr::metrics::counter32 probe_misses_total;
    lcr::metrics::counter32 health_timeouts_total;

    // Supervision
    lcr::metrics::counter32 resyncs_total;             // check_device_connection after (re)connect
    lcr::metrics::counter64 ticks_total;
    lcr::metrics::counter32 alerts_total;
    lcr::metrics::counter32 gate_changes_total;
    lcr::metrics::counter32 commands_rejected_total;   // bridge command while not connected

    // Sub-telemetry
    transport::telemetry::Connection connection;

    inline void copy_to(Supervisor& other) const noexcept {
        frames_total.copy_to(other.frames_total);
        frames_ignored_total.copy_to(other.frames_ignored_total);
        samples_total.copy_to(other.samples_total);
        events_total.copy_to(other.events_total);
        protocol_errors_total.copy_to(other.protocol_errors_total);
        health_requests_total.copy_to(other.health_requests_total);
        health_acks_total.copy_to(other.health_acks_total);
        probe_misses_total.copy_to(other.probe_misses_total);
        health_timeouts_total.copy_to(other.health_timeouts_total);
        resyncs_total.copy_to(other.resyncs_total);
        ticks_total.copy_to(other.ticks_total);
        alerts_total.copy_to(other.alerts_total);
        gate_changes_total.copy_to(other.gate_changes_total);
        commands_rejected_total.copy_to(other.commands_rejected_total);
        connection.copy_to(other.connection);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Supervisor Telemetry ===\n"
           << "Inbound\n"
           << "  Sensor frames         : " << lcr::format_number_exact(frames_total.load())
                                           << " (ignored " << lcr::format_number_exact(frames_ignored_total.load()) << ")\n"
           << "  Samples               : " << lcr::format_number_exact(samples_total.load()) << '\n'
           << "  Events                : " << lcr::format_number_exact(events_total.load()) << '\n'
           << "  Protocol errors       : " << lcr::format_number_exact(protocol_errors_total.load()) << '\n'
           << "Liveness\n"
           << "  Health requests/acks  : " << lcr::format_number_exact(health_requests_total.load()) << " / "
                                           << lcr::format_number_exact(health_acks_total.load()) << '\n'
           << "  Probe misses          : " << lcr::format_number_exact(probe_misses_total.load()) << '\n'
           << "  Health timeouts       : " << lcr::format_number_exact(health_timeouts_total.load()) << '\n'
           << "Supervision\n"
           << "  Resyncs               : " << lcr::format_number_exact(resyncs_total.load()) << '\n'
           << "  Ticks                 : " << lcr::format_number_exact(ticks_total.load()) << '\n'
           << "  Alerts                : " << lcr::format_number_exact(alerts_total.load()) << '\n'
           << "  Gate changes          : " << lcr::format_number_exact(gate_changes_total.load()) << '\n'
           << "  Commands rejected     : " << lcr::format_number_exact(commands_rejected_total.load()) << '\n';
        connection.debug_dump(os);
    }
};

} // namespace bandlink::core::telemetry
