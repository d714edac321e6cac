#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace wirelink::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Level lvl = Level::Info;
        if (!parse_level(log_level, lvl)) {
            lvl = Level::Info;
        }
        Logger::instance().set_level(lvl);
        Logger::instance().enable_color(true);
    }

} // namespace wirelink::examples
