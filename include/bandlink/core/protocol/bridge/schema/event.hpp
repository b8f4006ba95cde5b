#pragma once

#include <string>

#include "bandlink/core/protocol/bridge/enums/event_type.hpp"
#include "lcr/optional.hpp"


namespace bandlink::core::protocol::bridge::schema {

// {"type":"event","event_type":"device_connected","data":{...}}
//
// `data` is kept as minified JSON for observers; the few fields the
// supervisor itself consumes are extracted by the parser.
struct Event {
    EventType type{EventType::Unknown};
    std::string data{};                      // "null" when absent

    // device_info: "connected"
    lcr::optional<bool> connected{};
    // battery_status: "level"
    lcr::optional<double> battery_level{};
};

} // namespace bandlink::core::protocol::bridge::schema
