#pragma once

#include <string>
#include <string_view>

#include "bandlink/core/protocol/bridge/enums/command.hpp"
#include "lcr/json.hpp"


namespace bandlink::core::protocol::bridge::schema {

// Client → bridge command
//
//   {"type":"command","command":"scan_devices"}
//   {"type":"command","command":"connect_device","payload":{"address":"AA:BB:..."}}
//
// Only connect_device carries a payload.
struct Command {
    bridge::Command command{bridge::Command::HealthCheck};
    std::string address{};

public:
    [[nodiscard]]
    static inline Command make(bridge::Command c) {
        return Command{c, {}};
    }

    [[nodiscard]]
    static inline Command connect_device(std::string_view address) {
        return Command{bridge::Command::ConnectDevice, std::string(address)};
    }

    // Appends the JSON encoding to `out`
    inline void write_json(std::string& out) const {
        static constexpr std::string_view prefix = "{\"type\":\"command\",\"command\":\"";
        out.append(prefix);
        out.append(to_string(command));
        out += '\"';
        if (command == bridge::Command::ConnectDevice) {
            out.append(",\"payload\":{");
            lcr::json::append_string_field(out, "address", address);
            out += '}';
        }
        out += '}';
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(96 + address.size());
        write_json(out);
        return out;
    }
};

} // namespace bandlink::core::protocol::bridge::schema
