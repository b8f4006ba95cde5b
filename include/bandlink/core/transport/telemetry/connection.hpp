#pragma once

#include <ostream>

#include "bandlink/core/transport/telemetry/websocket.hpp"

#include "lcr/metrics/counter.hpp"
#include "lcr/format.hpp"

namespace bandlink::core::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Connection-level decisions and state transitions, observed on the reactor
// thread. Does NOT duplicate WebSocket telemetry.
// ============================================================================

struct Connection final {
    // Lifecycle & state transitions
    lcr::metrics::counter32 open_calls_total;          // open() invoked by the owner
    lcr::metrics::counter32 open_ignored_total;        // open() while already connecting/connected
    lcr::metrics::counter32 connect_success_total;     // reached State::Connected
    lcr::metrics::counter32 connect_failure_total;     // an attempt failed before Connected
    lcr::metrics::counter32 close_calls_total;         // explicit close()
    lcr::metrics::counter32 disconnect_events_total;   // established connection lost (any cause)

    // Liveness decisions
    lcr::metrics::counter32 health_timeouts_total;     // forced reconnect after missed acks

    // Retry mechanics
    lcr::metrics::counter32 retry_scheduled_total;     // backoff timer armed
    lcr::metrics::counter32 retry_attempts_total;      // reconnect attempt started
    lcr::metrics::counter32 retry_success_total;       // reconnect reached Connected
    lcr::metrics::counter32 retry_exhausted_total;     // max attempts reached

    // Message hand-off (backend → owner)
    lcr::metrics::counter64 messages_forwarded_total;

    // Send gating
    lcr::metrics::counter64 send_calls_total;
    lcr::metrics::counter64 send_rejected_total;       // not connected or backend refused

    // Sub-telemetry (owned here, referenced by each backend instance)
    transport::telemetry::WebSocket websocket;

    inline void copy_to(Connection& other) const noexcept {
        open_calls_total.copy_to(other.open_calls_total);
        open_ignored_total.copy_to(other.open_ignored_total);
        connect_success_total.copy_to(other.connect_success_total);
        connect_failure_total.copy_to(other.connect_failure_total);
        close_calls_total.copy_to(other.close_calls_total);
        disconnect_events_total.copy_to(other.disconnect_events_total);
        health_timeouts_total.copy_to(other.health_timeouts_total);
        retry_scheduled_total.copy_to(other.retry_scheduled_total);
        retry_attempts_total.copy_to(other.retry_attempts_total);
        retry_success_total.copy_to(other.retry_success_total);
        retry_exhausted_total.copy_to(other.retry_exhausted_total);
        messages_forwarded_total.copy_to(other.messages_forwarded_total);
        send_calls_total.copy_to(other.send_calls_total);
        send_rejected_total.copy_to(other.send_rejected_total);
        websocket.copy_to(other.websocket);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n"
           << "Lifecycle\n"
           << "  Open calls (ignored)  : " << lcr::format_number_exact(open_calls_total.load())
                                           << " (" << lcr::format_number_exact(open_ignored_total.load()) << ")\n"
           << "  Connect success/fail  : " << lcr::format_number_exact(connect_success_total.load()) << " / "
                                           << lcr::format_number_exact(connect_failure_total.load()) << '\n'
           << "  Close calls           : " << lcr::format_number_exact(close_calls_total.load()) << '\n'
           << "  Disconnect events     : " << lcr::format_number_exact(disconnect_events_total.load()) << '\n'
           << "  Health timeouts       : " << lcr::format_number_exact(health_timeouts_total.load()) << '\n'
           << "Retry\n"
           << "  Scheduled             : " << lcr::format_number_exact(retry_scheduled_total.load()) << '\n'
           << "  Attempts              : " << lcr::format_number_exact(retry_attempts_total.load()) << '\n'
           << "  Success               : " << lcr::format_number_exact(retry_success_total.load()) << '\n'
           << "  Exhausted             : " << lcr::format_number_exact(retry_exhausted_total.load()) << '\n'
           << "Messages\n"
           << "  Forwarded             : " << lcr::format_number_exact(messages_forwarded_total.load()) << '\n'
           << "  Send calls (rejected) : " << lcr::format_number_exact(send_calls_total.load())
                                           << " (" << lcr::format_number_exact(send_rejected_total.load()) << ")\n";
        websocket.debug_dump(os);
    }
};

} // namespace bandlink::core::transport::telemetry
