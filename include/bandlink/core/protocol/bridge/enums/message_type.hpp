#pragma once

#include <cstdint>
#include <string_view>


namespace bandlink::core::protocol::bridge {

// ===============================================================
// MESSAGE TYPE ENUM ("type" field of every bridge message)
// ===============================================================
enum class MessageType : uint8_t {
    Command,
    Event,
    RawData,
    ProcessedData,
    SensorData,
    HealthCheckResponse,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::Command:             return "command";
        case MessageType::Event:               return "event";
        case MessageType::RawData:             return "raw_data";
        case MessageType::ProcessedData:       return "processed_data";
        case MessageType::SensorData:          return "sensor_data";
        case MessageType::HealthCheckResponse: return "health_check_response";
        default:                               return "unknown";
    }
}

[[nodiscard]] inline constexpr MessageType to_message_type_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 5: // event
            if (s == "event") return MessageType::Event;
            break;
        case 7: // command
            if (s == "command") return MessageType::Command;
            break;
        case 8: // raw_data
            if (s == "raw_data") return MessageType::RawData;
            break;
        case 11: // sensor_data
            if (s == "sensor_data") return MessageType::SensorData;
            break;
        case 14: // processed_data
            if (s == "processed_data") return MessageType::ProcessedData;
            break;
        case 21: // health_check_response
            if (s == "health_check_response") return MessageType::HealthCheckResponse;
            break;
    }
    return MessageType::Unknown;
}

// Frames whose samples are counted by the rate estimator
[[nodiscard]] inline constexpr bool is_counted_frame(MessageType t) noexcept {
    return t == MessageType::RawData || t == MessageType::SensorData;
}

} // namespace bandlink::core::protocol::bridge
