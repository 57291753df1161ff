/**
 * @file log.cpp
 * @brief spdlog-backed logger bootstrap.
 */
#include "sdwan/obs/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sdwan::obs {

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
        auto lg = spdlog::stdout_color_mt(LOGGER_NAME);
        lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
        lg->set_level(spdlog::level::info);
        return lg;
    }();
    return instance;
}

bool set_level(std::string_view level) {
    spdlog::level::level_enum lvl{};
    if      (level == "trace")                      lvl = spdlog::level::trace;
    else if (level == "debug")                      lvl = spdlog::level::debug;
    else if (level == "info")                       lvl = spdlog::level::info;
    else if (level == "warn" || level == "warning") lvl = spdlog::level::warn;
    else if (level == "error")                      lvl = spdlog::level::err;
    else if (level == "critical")                   lvl = spdlog::level::critical;
    else if (level == "off")                        lvl = spdlog::level::off;
    else return false;

    logger()->set_level(lvl);
    return true;
}

} // namespace sdwan::obs
