#pragma once

#include <string_view>

#include "bandlink/core/protocol/bridge/schema/event.hpp"
#include "bandlink/core/protocol/bridge/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace bandlink::core::protocol::bridge::parser {

struct event {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Event& out) noexcept {
        out.connected.reset();
        out.battery_level.reset();

        // event_type (required)
        std::string_view name;
        auto r = helper::parse_string_required(root, "event_type", name);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'event_type' missing or invalid in event -> ignore message.");
            return r;
        }
        out.type = to_event_type_enum(name);
        if (out.type == EventType::Unknown) {
            BL_DEBUG("[PARSER] Unknown event_type '" << name << "' -> ignore message.");
            return Result::Ignored;
        }

        // data (optional, may be null)
        auto field = root["data"];
        if (field.error()) {
            out.data = "null";
            return Result::Parsed;
        }
        simdjson::dom::element data = field.value_unsafe();
        out.data = simdjson::minify(data);
        if (!data.is_object()) {
            return Result::Parsed;
        }

        switch (out.type) {
        case EventType::DeviceInfo:
            r = helper::parse_bool_optional(data, "connected", out.connected);
            if (r != Result::Parsed) {
                BL_WARN("[PARSER] Field 'connected' invalid in device_info event -> ignore message.");
                return r;
            }
            break;

        case EventType::BatteryStatus:
            r = helper::parse_double_optional(data, "level", out.battery_level);
            if (r != Result::Parsed) {
                BL_WARN("[PARSER] Field 'level' invalid in battery_status event -> ignore message.");
                return r;
            }
            break;

        default:
            break;
        }

        return Result::Parsed;
    }
};

} // namespace bandlink::core::protocol::bridge::parser
