#pragma once

#include <string>
#include <vector>

#include "bandlink/core/protocol/bridge/enums/message_type.hpp"
#include "bandlink/core/sensor.hpp"
#include "lcr/optional.hpp"


namespace bandlink::core::protocol::bridge::schema {

// {"type":"raw_data","sensor_type":"eeg","device_id":"...","timestamp":1712.5,
//  "data":[{"timestamp":1712.496,"ch1":...},...]}
//
// Only timing is retained: one entry per sample (its own "timestamp", or the
// frame timestamp when the sample has none).
struct SensorFrame {
    MessageType type{MessageType::RawData};
    SensorType sensor{SensorType::Eeg};
    std::string device_id{};
    double timestamp{0.0};
    std::vector<double> sample_timestamps{};

    // bat frames: "level" of the newest sample
    lcr::optional<double> battery_level{};

    inline void clear() noexcept {
        device_id.clear();
        timestamp = 0.0;
        sample_timestamps.clear();
        battery_level.reset();
    }
};

} // namespace bandlink::core::protocol::bridge::schema
