#pragma once
/**
 * @file path_health.hpp
 * @brief Current assessment of one path as published by the Health Monitor.
 */

#include <chrono>

#include "sdwan/net/types.hpp"

namespace sdwan::health {

using SystemClock = std::chrono::system_clock;
using Timestamp   = SystemClock::time_point;

/**
 * @struct PathHealth
 * @brief Snapshot of a path's quality. Overwritten wholesale on every check.
 */
struct PathHealth {
    net::PathId     path_id{};
    double          latency_ms{0.0};
    double          packet_loss_pct{0.0};
    double          jitter_ms{0.0};
    double          health_score{0.0};          ///< [0, 100]
    net::PathStatus status{net::PathStatus::Down};
    Timestamp       last_checked{};             ///< Time of the last probe or session update
    bool            measured{false};            ///< Latency/loss/jitter come from a probe round

    /// Initial record for a freshly registered path (no data yet).
    static PathHealth unknown(net::PathId id) noexcept {
        PathHealth h;
        h.path_id = id;
        return h;
    }

    /// True once a probe round has filled in latency/loss/jitter. Session updates alone do not count.
    [[nodiscard]] bool has_metrics() const noexcept { return measured; }

    bool operator==(const PathHealth&) const = default;
};

} // namespace sdwan::health
