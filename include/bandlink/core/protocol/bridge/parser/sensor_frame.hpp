#pragma once

#include <string_view>

#include "bandlink/core/protocol/bridge/schema/sensor_frame.hpp"
#include "bandlink/core/protocol/bridge/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace bandlink::core::protocol::bridge::parser {

struct sensor_frame {

    // PRECONDITION: out.type already set by the router from the "type" field
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SensorFrame& out) noexcept {
        out.clear();

        // sensor_type (required)
        std::string_view sensor;
        auto r = helper::parse_string_required(root, "sensor_type", sensor);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'sensor_type' missing or invalid in " << to_string(out.type) << " frame -> ignore message.");
            return r;
        }
        if (!sensor_from_string(sensor, out.sensor)) {
            BL_WARN("[PARSER] Unknown sensor_type '" << sensor << "' -> ignore message.");
            return Result::InvalidValue;
        }

        // device_id (optional)
        std::string_view device_id;
        bool present = false;
        r = helper::parse_string_optional(root, "device_id", device_id, present);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'device_id' invalid in " << to_string(out.type) << " frame -> ignore message.");
            return r;
        }
        if (present) {
            out.device_id = std::string(device_id);
        }

        // timestamp (required, seconds)
        r = helper::parse_double_required(root, "timestamp", out.timestamp);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'timestamp' missing or invalid in " << to_string(out.type) << " frame -> ignore message.");
            return r;
        }

        // data (required array of samples)
        simdjson::dom::array samples;
        r = helper::parse_array_required(root, "data", samples);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'data' missing or invalid in " << to_string(out.type) << " frame -> ignore message.");
            return r;
        }

        out.sample_timestamps.reserve(samples.size());
        for (simdjson::dom::element sample : samples) {
            if (!sample.is_object()) {
                out.sample_timestamps.push_back(out.timestamp);
                continue;
            }
            lcr::optional<double> ts;
            r = helper::parse_double_optional(sample, "timestamp", ts);
            if (r != Result::Parsed) {
                BL_WARN("[PARSER] Sample 'timestamp' invalid in " << to_string(out.sensor) << " frame -> ignore message.");
                return r;
            }
            out.sample_timestamps.push_back(ts.value_or(out.timestamp));

            if (out.sensor == SensorType::Battery) {
                lcr::optional<double> level;
                if (helper::parse_double_optional(sample, "level", level) == Result::Parsed && level.has()) {
                    out.battery_level = level.value();
                }
            }
        }

        return Result::Parsed;
    }
};

} // namespace bandlink::core::protocol::bridge::parser
