/**
 * @file path_scorer.cpp
 * @brief PathScorer implementation.
 */
#include "sdwan/routing/path_scorer.hpp"

#include <algorithm>
#include <cmath>

#include "sdwan/config/constants.hpp"
#include "sdwan/health/scoring.hpp"

namespace sdwan::routing {

using namespace sdwan::config::constants;

double PathScorer::latency_score(double latency_ms) noexcept {
    if (std::isnan(latency_ms)) return 0.0;
    const double l = std::clamp(latency_ms, 0.0, PREF_LATENCY_CEILING_MS);
    return (PREF_LATENCY_CEILING_MS - l) / PREF_LATENCY_CEILING_MS * 100.0;
}

double PathScorer::jitter_score(double jitter_ms) noexcept {
    if (std::isnan(jitter_ms)) return 0.0;
    const double j = std::clamp(jitter_ms, 0.0, PREF_JITTER_CEILING_MS);
    return (PREF_JITTER_CEILING_MS - j) / PREF_JITTER_CEILING_MS * 100.0;
}

double PathScorer::loss_score(double loss_pct) noexcept {
    if (std::isnan(loss_pct)) return 0.0;
    return std::clamp(100.0 - loss_pct, 0.0, 100.0);
}

double PathScorer::bandwidth_score(double bandwidth_mbps) noexcept {
    if (!(bandwidth_mbps > 0.0)) return 0.0;
    return std::min(bandwidth_mbps / PREF_BANDWIDTH_FULL_MBPS * 100.0, 100.0);
}

double PathScorer::cost_score(std::optional<double> cost_per_gb) noexcept {
    if (!cost_per_gb) return PREF_COST_UNKNOWN_SCORE;
    return std::clamp(100.0 - *cost_per_gb * PREF_COST_SLOPE, 0.0, 100.0);
}

double PathScorer::score(const PathCandidate& c, const PathPreference& pref) noexcept {
    const auto& h = c.health;
    if (!h.has_metrics()) return 0.0;

    switch (pref.kind) {
        case PreferenceKind::LowestLatency:    return latency_score(h.latency_ms);
        case PreferenceKind::HighestBandwidth: return bandwidth_score(c.attrs.bandwidth_mbps);
        case PreferenceKind::LowestPacketLoss: return loss_score(h.packet_loss_pct);
        case PreferenceKind::LowestCost:       return cost_score(c.attrs.cost_per_gb);
        case PreferenceKind::Balanced:
            return health::HealthScorer::score({h.latency_ms, h.jitter_ms, h.packet_loss_pct,
                                                c.attrs.utilization_pct});
        case PreferenceKind::Custom: {
            const auto& w = pref.weights;
            return w.latency   * latency_score(h.latency_ms) +
                   w.jitter    * jitter_score(h.jitter_ms) +
                   w.loss      * loss_score(h.packet_loss_pct) +
                   w.bandwidth * bandwidth_score(c.attrs.bandwidth_mbps) +
                   w.cost      * cost_score(c.attrs.cost_per_gb);
        }
    }
    return 0.0;
}

std::optional<PathScore> PathScorer::choose_best(std::span<const PathCandidate> candidates,
                                                 const PathPreference& pref,
                                                 std::vector<PathScore>* scored) {
    std::optional<PathScore> best;
    for (const auto& c : candidates) {
        const PathScore s{c.health.path_id, score(c, pref)};
        if (scored) scored->push_back(s);
        if (!best || s.score > best->score) best = s;
    }
    return best;
}

} // namespace sdwan::routing
