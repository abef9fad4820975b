#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace umadb::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Level level = Level::Info;
        if (!parse_level(log_level, level)) {
            level = Level::Info;
        }
        Logger::instance().set_level(level);
    }

} // namespace umadb::examples
