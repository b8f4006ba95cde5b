#pragma once

#include <string_view>

#include "bandlink/core/protocol/bridge/schema/health_check_response.hpp"
#include "bandlink/core/protocol/bridge/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace bandlink::core::protocol::bridge::parser {

struct health_check_response {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::HealthCheckResponse& out) noexcept {
        // status (required)
        std::string_view status;
        auto r = helper::parse_string_required(root, "status", status);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'status' missing or invalid in health_check_response -> ignore message.");
            return r;
        }
        out.status = std::string(status);

        // clients_connected (optional, older bridges omit it)
        lcr::optional<std::uint64_t> clients;
        r = helper::parse_uint64_optional(root, "clients_connected", clients);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'clients_connected' invalid in health_check_response -> ignore message.");
            return r;
        }
        out.clients_connected = clients.value_or(0);

        // is_streaming (required)
        r = helper::parse_bool_required(root, "is_streaming", out.is_streaming);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'is_streaming' missing or invalid in health_check_response -> ignore message.");
            return r;
        }

        // device_connected (required)
        r = helper::parse_bool_required(root, "device_connected", out.device_connected);
        if (r != Result::Parsed) {
            BL_WARN("[PARSER] Field 'device_connected' missing or invalid in health_check_response -> ignore message.");
            return r;
        }

        return Result::Parsed;
    }
};

} // namespace bandlink::core::protocol::bridge::parser
