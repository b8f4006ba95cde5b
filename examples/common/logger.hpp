#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace bandlink::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Level level = Level::Info;
        (void)parse_level(log_level, level);   // unknown names keep Info
        Logger::instance().set_level(level);
    }

} // namespace bandlink::examples
