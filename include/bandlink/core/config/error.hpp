#pragma once

#include <cstdint>
#include <string_view>


namespace bandlink::core::config {

/*
===============================================================================
 config::Error
===============================================================================

Startup configuration failures. Any value other than Error::None means the
supervisor refuses to start: configuration problems are reported once, at
start(), and never degrade into runtime misbehavior.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Value validation ---------------------------------------------------
    InvalidUrl,         // Not a ws:// URL with host and numeric port
    InvalidInterval,    // Tick or health interval out of range
    InvalidTimeout,     // Health timeout out of range or below interval
    InvalidBackoff,     // Reconnect base/multiplier/cap/jitter inconsistent
    InvalidThreshold,   // Negative or non-finite rate threshold
    InvalidHysteresis,  // Activation/deactivation counts must be > 0
    NoRequiredSensors,  // Streaming detection needs at least one sensor
    InvalidMonitor,     // Vote/instability/error windows or ratios out of range

    // --- Loading ------------------------------------------------------------
    FileNotFound,       // Config file missing or unreadable
    InvalidJson,        // Config file is not valid JSON
    InvalidSchema       // Known key with a wrong type or an unknown enum value
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:              return "None";
        case Error::InvalidUrl:        return "InvalidUrl";
        case Error::InvalidInterval:   return "InvalidInterval";
        case Error::InvalidTimeout:    return "InvalidTimeout";
        case Error::InvalidBackoff:    return "InvalidBackoff";
        case Error::InvalidThreshold:  return "InvalidThreshold";
        case Error::InvalidHysteresis: return "InvalidHysteresis";
        case Error::NoRequiredSensors: return "NoRequiredSensors";
        case Error::InvalidMonitor:    return "InvalidMonitor";
        case Error::FileNotFound:      return "FileNotFound";
        case Error::InvalidJson:       return "InvalidJson";
        case Error::InvalidSchema:     return "InvalidSchema";
        default:                       return "Unknown";
    }
}

} // namespace bandlink::core::config
