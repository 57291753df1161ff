/**
 * @file config_loader.cpp
 * @brief JSON config (nlohmann::json) applied over named defaults.
 */
#include "sdwan/config/config_loader.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "sdwan/obs/log.hpp"

namespace sdwan::config {

namespace {

using json   = nlohmann::json;
using Result = sdwan_detail::expected<void, ConfigError>;

Result bad_value() {
    return sdwan_detail::unexpected<ConfigError>(ConfigError::BadValue);
}

/// Non-negative JSON integer within [min_value, max_value].
template <class Int>
Result read_int(const json& v, Int& out, std::uint64_t min_value,
                std::uint64_t max_value = std::numeric_limits<Int>::max()) {
    if (!v.is_number_unsigned()) return bad_value();
    const auto n = v.get<std::uint64_t>();
    if (n < min_value || n > max_value) return bad_value();
    out = static_cast<Int>(n);
    return {};
}

Result read_ms(const json& v, std::chrono::milliseconds& out, std::uint64_t min_value) {
    std::uint32_t ms = 0;
    if (auto r = read_int(v, ms, min_value); !r) return r;
    out = std::chrono::milliseconds(ms);
    return {};
}

Result read_bool(const json& v, bool& out) {
    if (!v.is_boolean()) return bad_value();
    out = v.get<bool>();
    return {};
}

bool known_log_level(std::string_view v) noexcept {
    for (std::string_view lvl : {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"}) {
        if (v == lvl) return true;
    }
    return false;
}

Result unknown_key() {
    return sdwan_detail::unexpected<ConfigError>(ConfigError::UnknownKey);
}

// ----------------------------- Sections --------------------------------------

Result apply_probe(AgentConfig& c, std::string_view key, const json& v) {
    if (key == "count")       return read_int(v, c.probe.count, 1);
    if (key == "timeout_ms")  return read_ms(v, c.probe.timeout, 1);
    if (key == "interval_ms") return read_ms(v, c.probe.interval, 0);
    if (key == "udp_port")    return read_int(v, c.probe.udp_port, 1);
    if (key == "strategy") {
        if (!v.is_string()) return bad_value();
        const auto s = health::probe_strategy_from_string(v.get_ref<const std::string&>());
        if (!s) return bad_value();
        c.probe.strategy = *s;
        return {};
    }
    return unknown_key();
}

Result apply_health(AgentConfig& c, std::string_view key, const json& v) {
    if (key == "check_interval_ms") return read_ms(v, c.health.check_interval, 1);
    if (key == "persist")           return read_bool(v, c.health.persist);
    if (key == "persist_interval")  return read_int(v, c.health.persist_interval, 1);
    if (key == "history_rows")      return read_int(v, c.health.history_rows, 0);
    return unknown_key();
}

Result apply_dataplane(AgentConfig& c, std::string_view key, const json& v) {
    if (key == "bind_address") {
        if (!v.is_string()) return bad_value();
        const auto ip = net::IpAddress::parse(v.get_ref<const std::string&>());
        if (!ip || !ip->is_v4()) return bad_value();
        c.dataplane.bind.ip = *ip;
        return {};
    }
    if (key == "bind_port")  return read_int(v, c.dataplane.bind.port, 0);
    if (key == "mtu")        return read_int(v, c.dataplane.mtu, 1);
    if (key == "rx_poll_ms") return read_ms(v, c.dataplane.rx_poll, 1);
    return unknown_key();
}

Result apply_compression(AgentConfig& c, std::string_view key, const json& v) {
    if (key == "enabled")  return read_bool(v, c.dataplane.compression.enabled);
    if (key == "min_size") return read_int(v, c.dataplane.compression.min_size, 0);
    if (key == "level")    return read_int(v, c.dataplane.compression.level, 1, 9);
    return unknown_key();
}

Result apply_log(AgentConfig& c, std::string_view key, const json& v) {
    if (key == "level") {
        if (!v.is_string() || !known_log_level(v.get_ref<const std::string&>())) return bad_value();
        c.log_level = v.get<std::string>();
        return {};
    }
    return unknown_key();
}

using SectionFn = Result (*)(AgentConfig&, std::string_view, const json&);

struct Section {
    std::string_view name;
    SectionFn        apply;
};

constexpr Section SECTIONS[] = {
    {"probe",       apply_probe},
    {"health",      apply_health},
    {"dataplane",   apply_dataplane},
    {"compression", apply_compression},
    {"log",         apply_log},
};

SectionFn find_section(std::string_view name) noexcept {
    for (const auto& s : SECTIONS) {
        if (s.name == name) return s.apply;
    }
    return nullptr;
}

} // namespace

AgentConfig Loader::defaults() {
    return AgentConfig{};
}

sdwan_detail::expected<AgentConfig, ConfigError> Loader::parse(std::string_view text) {
    // allow_exceptions = false: a syntax error yields a discarded value.
    const json doc = json::parse(text.begin(), text.end(), nullptr, false, true);
    if (doc.is_discarded() || !doc.is_object()) {
        obs::logger()->error("config: not a JSON object");
        return sdwan_detail::unexpected<ConfigError>(ConfigError::Malformed);
    }

    AgentConfig cfg = defaults();
    for (const auto& section : doc.items()) {
        const auto apply = find_section(section.key());
        if (!apply) {
            obs::logger()->error("config: unknown section '{}'", section.key());
            return sdwan_detail::unexpected<ConfigError>(ConfigError::UnknownKey);
        }
        if (!section.value().is_object()) {
            obs::logger()->error("config: section '{}' is not an object", section.key());
            return sdwan_detail::unexpected<ConfigError>(ConfigError::Malformed);
        }
        for (const auto& entry : section.value().items()) {
            if (auto r = apply(cfg, entry.key(), entry.value()); !r) {
                obs::logger()->error("config: {}.{} = {} ({})", section.key(), entry.key(),
                                     entry.value().dump(), to_string(r.error()));
                return sdwan_detail::unexpected<ConfigError>(r.error());
            }
        }
    }
    return cfg;
}

sdwan_detail::expected<AgentConfig, ConfigError> Loader::load_from_file(const std::string& path) {
    if (path.empty()) return defaults();

    std::ifstream in(path);
    if (!in) {
        obs::logger()->error("config: cannot open '{}'", path);
        return sdwan_detail::unexpected<ConfigError>(ConfigError::Unreadable);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

} // namespace sdwan::config
