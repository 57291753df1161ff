#pragma once
/**
 * @file log.hpp
 * @brief Process-wide spdlog logger ("sdwan") used by every plane.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sdwan::obs {

/// Name of the shared logger registered with spdlog.
inline constexpr char LOGGER_NAME[] = "sdwan";

/**
 * @brief Return the shared logger, creating a colored stdout sink on first use.
 * @details Safe to call from any thread. If the embedding application has
 *          already registered a logger under LOGGER_NAME, that one is reused.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from a textual name.
 * @param level One of trace, debug, info, warn, error, critical, off.
 * @return false if @p level is not recognised (level unchanged).
 */
bool set_level(std::string_view level);

} // namespace sdwan::obs
