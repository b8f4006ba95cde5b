#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>


namespace bandlink::core {

// ===============================================================
// SENSOR TYPE ENUM
// ===============================================================
enum class SensorType : std::uint8_t {
    Eeg = 0,
    Ppg,
    Acc,
    Battery
};

inline constexpr std::size_t SENSOR_TYPE_COUNT = 4;

inline constexpr std::array<SensorType, SENSOR_TYPE_COUNT> ALL_SENSOR_TYPES = {
    SensorType::Eeg, SensorType::Ppg, SensorType::Acc, SensorType::Battery
};

// Dense per-sensor storage indexed by SensorType
template<class T>
using PerSensor = std::array<T, SENSOR_TYPE_COUNT>;

[[nodiscard]]
inline constexpr std::size_t index_of(SensorType s) noexcept {
    return static_cast<std::size_t>(s);
}

// ------------------------------------------------------------
// SensorType → wire name
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(SensorType s) noexcept {
    switch (s) {
        case SensorType::Eeg:      return "eeg";
        case SensorType::Ppg:      return "ppg";
        case SensorType::Acc:      return "acc";
        case SensorType::Battery:  return "bat";
        default:                   return "unknown";
    }
}

// ------------------------------------------------------------
// wire name → SensorType ("battery" accepted as an alias of "bat")
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr bool sensor_from_string(std::string_view name, SensorType& out) noexcept {
    if (name == "eeg")                        { out = SensorType::Eeg;     return true; }
    if (name == "ppg")                        { out = SensorType::Ppg;     return true; }
    if (name == "acc")                        { out = SensorType::Acc;     return true; }
    if (name == "bat" || name == "battery")   { out = SensorType::Battery; return true; }
    return false;
}

} // namespace bandlink::core
