#pragma once

#include <string_view>
#include <concepts>

#include <simdjson.h>

#include "bandlink/core/protocol/bridge/enums.hpp"
#include "bandlink/core/protocol/bridge/parser/result.hpp"
#include "bandlink/core/protocol/bridge/parser/helpers.hpp"
#include "bandlink/core/protocol/bridge/parser/health_check_response.hpp"
#include "bandlink/core/protocol/bridge/parser/event.hpp"
#include "bandlink/core/protocol/bridge/parser/sensor_frame.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core::protocol::bridge::parser {

/*
================================================================================
Bridge Message Parsing
================================================================================

Three layers, strictest at the bottom:

  Router    inspects the "type" field of a raw text frame and selects the
            message parser; no field-level parsing, no domain logic.

  Parsers   (health_check_response, event, sensor_frame) validate one message
            schema, log actionable diagnostics and fill a schema struct.

  Helpers   extract primitive fields from simdjson DOM elements; never log,
            never throw.

A parsed message is handed to the Handler synchronously, on the caller's
thread, in arrival order. An exception thrown by the Handler propagates out
of parse_and_route(). Malformed input (InvalidJson / InvalidSchema /
InvalidValue) is logged at warn level and dropped; the caller counts it and
the connection stays up.

Schema structs are members of the Router and reused across messages.
================================================================================
*/

template<class H>
concept HandlerConcept = requires(
    H& h,
    const schema::HealthCheckResponse& ack,
    const schema::Event& ev,
    const schema::SensorFrame& frame
) {
    { h.on_health_check_response(ack) } -> std::same_as<void>;
    { h.on_event(ev) } -> std::same_as<void>;
    { h.on_sensor_frame(frame) } -> std::same_as<void>;
};


template<HandlerConcept Handler>
class Router {
public:
    explicit Router(Handler& handler)
        : handler_(handler)
    {
    }

    // Main entry point
    [[nodiscard]]
    inline Result parse_and_route(std::string_view raw_msg) {
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            BL_WARN("[PARSER] JSON parse error: " << simdjson::error_message(error) << " in message: " << truncate_(raw_msg));
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Parsed) {
            BL_WARN("[PARSER] Root is not an object -> ignore message.");
            return Result::InvalidSchema;
        }

        std::string_view type_name;
        if (helper::parse_string_required(root, "type", type_name) != Result::Parsed) {
            BL_WARN("[PARSER] Field 'type' missing or invalid -> ignore message.");
            return Result::InvalidSchema;
        }

        const MessageType type = to_message_type_enum(type_name);
        switch (type) {
        case MessageType::HealthCheckResponse:
            return route_health_check_response_(root);

        case MessageType::Event:
            return route_event_(root);

        case MessageType::RawData:
        case MessageType::ProcessedData:
        case MessageType::SensorData:
            return route_sensor_frame_(type, root);

        default:
            BL_TRACE("[PARSER] Message type '" << type_name << "' not handled -> ignore message.");
            return Result::Ignored;
        }
    }

private:
    Handler& handler_;                      // not owned

    simdjson::dom::parser parser_;

    schema::HealthCheckResponse health_;
    schema::Event event_;
    schema::SensorFrame frame_;

private:
    [[nodiscard]]
    inline Result route_health_check_response_(const simdjson::dom::element& root) {
        const Result r = health_check_response::parse(root, health_);
        if (r != Result::Parsed) {
            return r;
        }
        handler_.on_health_check_response(health_);
        return Result::Delivered;
    }

    [[nodiscard]]
    inline Result route_event_(const simdjson::dom::element& root) {
        const Result r = event::parse(root, event_);
        if (r != Result::Parsed) {
            return r;
        }
        handler_.on_event(event_);
        return Result::Delivered;
    }

    [[nodiscard]]
    inline Result route_sensor_frame_(MessageType type, const simdjson::dom::element& root) {
        frame_.type = type;
        const Result r = sensor_frame::parse(root, frame_);
        if (r != Result::Parsed) {
            return r;
        }
        handler_.on_sensor_frame(frame_);
        return Result::Delivered;
    }

    // Keeps warn lines readable when a large frame is malformed
    [[nodiscard]]
    static inline std::string_view truncate_(std::string_view s) noexcept {
        constexpr std::size_t MAX_LOGGED = 256;
        return s.size() > MAX_LOGGED ? s.substr(0, MAX_LOGGED) : s;
    }
};

} // namespace bandlink::core::protocol::bridge::parser
