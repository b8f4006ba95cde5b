#pragma once

#include <ostream>

#include "lcr/metrics/counter.hpp"
#include "lcr/format.hpp"

namespace bandlink::core::transport::telemetry {

// ============================================================================
// WebSocket Telemetry
//
// Mechanical socket facts shared by all backends. Updated from the backend
// I/O thread, read from the reactor: atomic counters only.
// ============================================================================

struct WebSocket final {
    // Throughput (cumulative, monotonic)
    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;

    lcr::metrics::atomic::counter64 messages_rx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;

    // Errors & lifecycle
    lcr::metrics::atomic::counter32 connect_attempts_total;
    lcr::metrics::atomic::counter32 receive_errors_total;
    lcr::metrics::atomic::counter32 send_errors_total;
    lcr::metrics::atomic::counter32 close_events_total;

    // Receive ring full: the reactor is not draining fast enough
    lcr::metrics::atomic::counter32 rx_overflow_total;

    inline void copy_to(WebSocket& other) const noexcept {
        bytes_rx_total.copy_to(other.bytes_rx_total);
        bytes_tx_total.copy_to(other.bytes_tx_total);
        messages_rx_total.copy_to(other.messages_rx_total);
        messages_tx_total.copy_to(other.messages_tx_total);
        connect_attempts_total.copy_to(other.connect_attempts_total);
        receive_errors_total.copy_to(other.receive_errors_total);
        send_errors_total.copy_to(other.send_errors_total);
        close_events_total.copy_to(other.close_events_total);
        rx_overflow_total.copy_to(other.rx_overflow_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== WebSocket Telemetry ===\n"
           << "  Connect attempts      : " << lcr::format_number_exact(connect_attempts_total.load()) << '\n'
           << "  Bytes RX / TX         : " << lcr::format_number_exact(bytes_rx_total.load()) << " / "
                                           << lcr::format_number_exact(bytes_tx_total.load()) << '\n'
           << "  Messages RX / TX      : " << lcr::format_number_exact(messages_rx_total.load()) << " / "
                                           << lcr::format_number_exact(messages_tx_total.load()) << '\n'
           << "  Receive errors        : " << lcr::format_number_exact(receive_errors_total.load()) << '\n'
           << "  Send errors           : " << lcr::format_number_exact(send_errors_total.load()) << '\n'
           << "  Close events          : " << lcr::format_number_exact(close_events_total.load()) << '\n'
           << "  RX ring overflows     : " << lcr::format_number_exact(rx_overflow_total.load()) << '\n';
    }
};

} // namespace bandlink::core::transport::telemetry
