#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace bandlink::examples::cli {

// -------------------------------------------------------------
// Bridge URL validator (the bridge only speaks plain ws://)
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0) {
            return {};
        }
        return "URL must start with ws://";
    },
    "Bridge URL validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level level;
        if (lcr::log::parse_level(value, level)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);

} // namespace bandlink::examples::cli
