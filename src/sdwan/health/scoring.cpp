/**
 * @file scoring.cpp
 * @brief HealthScorer implementation.
 */
#include "sdwan/health/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace sdwan::health {

using namespace sdwan::config::constants;

double HealthScorer::sub_score(double metric) noexcept {
    if (std::isnan(metric)) return 0.0;
    return std::clamp(100.0 - metric, 0.0, 100.0);
}

double HealthScorer::score(const ScoreInputs& in) noexcept {
    const double s = HEALTH_WEIGHT_LATENCY     * sub_score(in.latency_ms) +
                     HEALTH_WEIGHT_JITTER      * sub_score(in.jitter_ms) +
                     HEALTH_WEIGHT_LOSS        * sub_score(in.packet_loss_pct) +
                     HEALTH_WEIGHT_UTILIZATION * sub_score(in.utilization_pct);
    return std::clamp(s, 0.0, 100.0);
}

net::PathStatus HealthScorer::status_for(double score) noexcept {
    if (score >= HEALTH_UP_THRESHOLD)       return net::PathStatus::Up;
    if (score >= HEALTH_DEGRADED_THRESHOLD) return net::PathStatus::Degraded;
    return net::PathStatus::Down;
}

PathHealth HealthScorer::from_probe(net::PathId id, const ProbeResult& r,
                                    Timestamp at, double utilization_pct) noexcept {
    PathHealth h;
    h.path_id         = id;
    h.latency_ms      = r.latency_ms;
    h.packet_loss_pct = r.packet_loss_pct;
    h.jitter_ms       = r.jitter_ms;
    h.last_checked    = at;
    h.measured        = true;

    // Unreachable path: the blend would still credit jitter/utilization.
    h.health_score = r.all_lost() ? 0.0
                                  : score({r.latency_ms, r.jitter_ms, r.packet_loss_pct, utilization_pct});
    h.status = status_for(h.health_score);
    return h;
}

} // namespace sdwan::health
