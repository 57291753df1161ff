#pragma once
/**
 * @file types.hpp
 * @brief Core identifiers shared by every plane: PathId, SiteId, PathStatus.
 */

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sdwan::net {

/// Site identifier, stable across restarts (e.g. "hq-nyc").
using SiteId = std::string;

/**
 * @struct PathId
 * @brief Opaque identifier for one network path (tunnel endpoint pair).
 */
struct PathId {
    std::uint64_t value{0};

    constexpr PathId() noexcept = default;
    constexpr explicit PathId(std::uint64_t v) noexcept : value(v) {}

    [[nodiscard]] std::string to_string() const { return "path-" + std::to_string(value); }

    bool operator==(const PathId&) const = default;
    auto operator<=>(const PathId&) const = default;
};

/**
 * @enum PathStatus
 * @brief Coarse health taxonomy derived from the health score.
 */
enum class PathStatus : std::uint8_t {
    Up,        ///< score >= 80
    Degraded,  ///< 20 <= score < 80
    Down       ///< score < 20, or no data yet
};

/// Stable lower-case label ("up", "degraded", "down").
constexpr std::string_view to_string(PathStatus s) noexcept {
    switch (s) {
        case PathStatus::Up:       return "up";
        case PathStatus::Degraded: return "degraded";
        case PathStatus::Down:     return "down";
    }
    return "down";
}

/// Inverse of to_string(PathStatus). Case-sensitive.
constexpr std::optional<PathStatus> path_status_from_string(std::string_view s) noexcept {
    if (s == "up")       return PathStatus::Up;
    if (s == "degraded") return PathStatus::Degraded;
    if (s == "down")     return PathStatus::Down;
    return std::nullopt;
}

} // namespace sdwan::net

template <>
struct std::hash<sdwan::net::PathId> {
    std::size_t operator()(const sdwan::net::PathId& p) const noexcept {
        return std::hash<std::uint64_t>{}(p.value);
    }
};
