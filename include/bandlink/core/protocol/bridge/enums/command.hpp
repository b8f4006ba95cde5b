#pragma once

#include <cstdint>
#include <string_view>


namespace bandlink::core::protocol::bridge {

// ===============================================================
// COMMAND ENUM (client → bridge)
// ===============================================================
enum class Command : uint8_t {
    CheckDeviceConnection,
    CheckBluetoothStatus,
    ScanDevices,
    ConnectDevice,
    DisconnectDevice,
    StartStreaming,
    StopStreaming,
    HealthCheck
};

[[nodiscard]] inline constexpr std::string_view to_string(Command c) noexcept {
    switch (c) {
        case Command::CheckDeviceConnection: return "check_device_connection";
        case Command::CheckBluetoothStatus:  return "check_bluetooth_status";
        case Command::ScanDevices:           return "scan_devices";
        case Command::ConnectDevice:         return "connect_device";
        case Command::DisconnectDevice:      return "disconnect_device";
        case Command::StartStreaming:        return "start_streaming";
        case Command::StopStreaming:         return "stop_streaming";
        case Command::HealthCheck:           return "health_check";
        default:                             return "unknown";
    }
}

} // namespace bandlink::core::protocol::bridge
