#pragma once

#include <cstdint>
#include <string_view>


namespace bandlink::core::protocol::bridge::parser {

// Outcome of parsing one inbound bridge message.
//
// The three Invalid* values are protocol errors: the message is dropped and
// counted, the connection stays up. Ignored covers well-formed messages this
// client has no use for (unknown message or event types).
enum class Result : std::uint8_t {
    Ignored,
    InvalidJson,        // not JSON, or not a JSON object
    InvalidSchema,      // required field missing or wrongly typed
    InvalidValue,       // well-typed but outside the accepted values
    Parsed,
    Delivered           // parsed and dispatched to its handler
};

[[nodiscard]]
inline constexpr bool is_protocol_error(Result r) noexcept {
    switch (r) {
        case Result::InvalidJson:
        case Result::InvalidSchema:
        case Result::InvalidValue:
            return true;
        default:
            return false;
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:       return "ignored";
        case Result::InvalidJson:   return "invalid json";
        case Result::InvalidSchema: return "invalid schema";
        case Result::InvalidValue:  return "invalid value";
        case Result::Parsed:        return "parsed";
        case Result::Delivered:     return "delivered";
    }
    return "unknown";
}

} // namespace bandlink::core::protocol::bridge::parser
