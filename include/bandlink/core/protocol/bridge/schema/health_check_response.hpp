#pragma once

#include <cstdint>
#include <string>


namespace bandlink::core::protocol::bridge::schema {

// {"type":"health_check_response","status":"ok","clients_connected":1,
//  "is_streaming":true,"device_connected":true}
struct HealthCheckResponse {
    std::string status{};
    std::uint64_t clients_connected{0};
    bool is_streaming{false};
    bool device_connected{false};
};

} // namespace bandlink::core::protocol::bridge::schema
