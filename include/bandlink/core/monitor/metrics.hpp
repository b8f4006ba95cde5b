#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>

#include "bandlink/core/clock.hpp"
#include "lcr/format.hpp"


namespace bandlink::core::monitor {

// Snapshot of the monitor's derived metrics. Handed out by value only.
struct ConnectionMetrics {
    std::uint64_t uptime_ms{0};              // time spent in non-Offline checks
    std::uint64_t total_checks{0};
    std::uint64_t successful_checks{0};      // overall != Offline
    std::uint64_t failed_checks{0};          // overall == Offline
    std::uint64_t errors_total{0};           // transport / health errors reported
    double average_latency_ms{0.0};          // EMA, first sample seeds it
    double error_rate{0.0};                  // Offline share of the recent checks
    TimePoint last_successful_check{};       // epoch when never successful
};

inline std::ostream& operator<<(std::ostream& os, const ConnectionMetrics& m) {
    return os << "  Uptime                : " << lcr::format_duration(std::chrono::milliseconds(m.uptime_ms)) << '\n'
              << "  Checks (ok / failed)  : " << lcr::format_number_exact(m.total_checks) << " ("
                                              << lcr::format_number_exact(m.successful_checks) << " / "
                                              << lcr::format_number_exact(m.failed_checks) << ")\n"
              << "  Errors reported       : " << lcr::format_number_exact(m.errors_total) << '\n'
              << "  Average latency       : " << lcr::format_fixed(m.average_latency_ms, 1) << " ms\n"
              << "  Error rate            : " << lcr::format_percent(m.error_rate) << '\n';
}

} // namespace bandlink::core::monitor
