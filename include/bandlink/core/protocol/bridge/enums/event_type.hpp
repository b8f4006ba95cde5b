#pragma once

#include <cstdint>
#include <string_view>


namespace bandlink::core::protocol::bridge {

// ===============================================================
// EVENT TYPE ENUM ("event_type" of bridge → client events)
// ===============================================================
enum class EventType : uint8_t {
    DeviceInfo,
    DeviceConnected,
    DeviceDisconnected,
    DeviceConnectionFailed,
    StreamStarted,
    StreamStopped,
    BatteryStatus,
    SignalQuality,
    ScanResult,
    BluetoothStatus,
    Error,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(EventType e) noexcept {
    switch (e) {
        case EventType::DeviceInfo:             return "device_info";
        case EventType::DeviceConnected:        return "device_connected";
        case EventType::DeviceDisconnected:     return "device_disconnected";
        case EventType::DeviceConnectionFailed: return "device_connection_failed";
        case EventType::StreamStarted:          return "stream_started";
        case EventType::StreamStopped:          return "stream_stopped";
        case EventType::BatteryStatus:          return "battery_status";
        case EventType::SignalQuality:          return "signal_quality";
        case EventType::ScanResult:             return "scan_result";
        case EventType::BluetoothStatus:        return "bluetooth_status";
        case EventType::Error:                  return "error";
        default:                                return "unknown";
    }
}

[[nodiscard]] inline constexpr EventType to_event_type_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 5:
            if (s == "error") return EventType::Error;
            break;
        case 11:
            if (s == "device_info") return EventType::DeviceInfo;
            if (s == "scan_result") return EventType::ScanResult;
            break;
        case 14:
            if (s == "stream_started") return EventType::StreamStarted;
            if (s == "stream_stopped") return EventType::StreamStopped;
            if (s == "battery_status") return EventType::BatteryStatus;
            if (s == "signal_quality") return EventType::SignalQuality;
            break;
        case 16:
            if (s == "device_connected") return EventType::DeviceConnected;
            if (s == "bluetooth_status") return EventType::BluetoothStatus;
            break;
        case 19:
            if (s == "device_disconnected") return EventType::DeviceDisconnected;
            break;
        case 24:
            if (s == "device_connection_failed") return EventType::DeviceConnectionFailed;
            break;
    }
    return EventType::Unknown;
}

} // namespace bandlink::core::protocol::bridge
