#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "bandlink/core/clock.hpp"


namespace bandlink::core::monitor {

enum class AlertLevel : std::uint8_t {
    Warning,
    Critical
};

enum class AlertKind : std::uint8_t {
    Offline,            // raw overall became Offline
    Instability,        // Degraded in most of the recent checks
    HighErrorRate,      // error rate above threshold
    ReconnectExhausted  // reconnect policy gave up
};

[[nodiscard]]
inline constexpr std::string_view to_string(AlertLevel l) noexcept {
    switch (l) {
        case AlertLevel::Warning:   return "WARNING";
        case AlertLevel::Critical:  return "CRITICAL";
        default:                    return "UNKNOWN";
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(AlertKind k) noexcept {
    switch (k) {
        case AlertKind::Offline:            return "offline";
        case AlertKind::Instability:        return "instability";
        case AlertKind::HighErrorRate:      return "high_error_rate";
        case AlertKind::ReconnectExhausted: return "reconnect_exhausted";
        default:                            return "unknown";
    }
}

struct Alert {
    std::uint64_t id{0};                     // monotonic, first alert is 1
    AlertLevel level{AlertLevel::Warning};
    AlertKind kind{AlertKind::Offline};
    std::string message{};
    TimePoint timestamp{};
};

} // namespace bandlink::core::monitor
