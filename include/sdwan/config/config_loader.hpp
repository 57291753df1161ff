#pragma once
/**
 * @file config_loader.hpp
 * @brief Agent configuration: named defaults overridden by a JSON file.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "sdwan/compat/expected.hpp"
#include "sdwan/dataplane/data_plane.hpp"
#include "sdwan/health/health_monitor.hpp"
#include "sdwan/health/prober.hpp"

namespace sdwan::config {

/// Loader failures.
enum class ConfigError : std::uint8_t {
    Unreadable,  ///< File missing or unreadable
    Malformed,   ///< Not a JSON object, or a section that is not an object
    UnknownKey,  ///< Section or key not recognised
    BadValue     ///< Value does not parse or is out of range
};

constexpr std::string_view to_string(ConfigError e) noexcept {
    switch (e) {
        case ConfigError::Unreadable: return "unreadable";
        case ConfigError::Malformed:  return "malformed";
        case ConfigError::UnknownKey: return "unknown_key";
        case ConfigError::BadValue:   return "bad_value";
    }
    return "malformed";
}

/** @struct AgentConfig
 *  @brief Aggregate of sub-configs required by the agent.
 */
struct AgentConfig {
    health::ProbeConfig        probe;      ///< Probe count/timeout/interval/strategy
    health::HealthConfig       health;     ///< Check interval and persistence
    dataplane::DataPlaneConfig dataplane;  ///< Socket, MTU, rx poll, compression
    std::string                log_level{"info"};
};

/** @class Loader
 *  @brief Source of agent configuration (defaults or parsed files).
 */
class Loader {
public:
    /// Pure defaults.
    static AgentConfig defaults();

    /**
     * @brief Load overrides from @p path on top of defaults.
     * @param path JSON file, e.g. `{"probe": {"count": 3}, "log": {"level": "debug"}}`.
     *             Sections: probe, health, dataplane, compression, log. Comments are
     *             accepted. Empty => defaults.
     */
    static sdwan_detail::expected<AgentConfig, ConfigError> load_from_file(const std::string& path);

    /// Parse configuration text (same format as load_from_file).
    static sdwan_detail::expected<AgentConfig, ConfigError> parse(std::string_view text);
};

} // namespace sdwan::config
