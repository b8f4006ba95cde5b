#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include "bandlink/core/sensor.hpp"


namespace bandlink::core::stream {

// Samples per second, per sensor
using Rates = PerSensor<double>;

struct SensorRate {
    SensorType sensor{SensorType::Eeg};
    double rate{0.0};
    double threshold{0.0};
};

/*
===============================================================================
 StreamingState
===============================================================================

Observed (data-driven) streaming state. Never a plain bool:

  Idle        required sensors are not flowing
  Active      every required sensor is at or above its threshold
  Degrading   was Active, the latest evaluation(s) fell below threshold, but
              not for long enough to flip to Idle (hysteresis hold-over)

The commanded state (start_streaming / stop_streaming sent by the user) is
tracked separately and never produces a StreamingState.
===============================================================================
*/

struct Idle {
    bool operator==(const Idle&) const = default;
};

struct Active {
    Rates rates{};
    bool operator==(const Active&) const = default;
};

struct Degrading {
    Rates rates{};
    std::uint32_t below_count{0};     // consecutive below-threshold evaluations
    bool operator==(const Degrading&) const = default;
};

using StreamingState = std::variant<Idle, Active, Degrading>;


enum class Phase : std::uint8_t {
    Idle,
    Active,
    Degrading
};

[[nodiscard]]
inline constexpr std::string_view to_string(Phase p) noexcept {
    switch (p) {
        case Phase::Idle:       return "Idle";
        case Phase::Active:     return "Active";
        case Phase::Degrading:  return "Degrading";
        default:                return "Unknown";
    }
}

[[nodiscard]]
inline Phase phase_of(const StreamingState& s) noexcept {
    if (std::holds_alternative<Active>(s)) return Phase::Active;
    if (std::holds_alternative<Degrading>(s)) return Phase::Degrading;
    return Phase::Idle;
}

[[nodiscard]]
inline std::string_view to_string(const StreamingState& s) noexcept {
    return to_string(phase_of(s));
}

// Debounced "data is flowing" signal: the hold-over still counts
[[nodiscard]]
inline bool is_streaming(const StreamingState& s) noexcept {
    return !std::holds_alternative<Idle>(s);
}

// Strict: only a fully healthy stream
[[nodiscard]]
inline bool is_active(const StreamingState& s) noexcept {
    return std::holds_alternative<Active>(s);
}

} // namespace bandlink::core::stream
