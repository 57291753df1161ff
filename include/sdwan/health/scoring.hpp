#pragma once
/**
 * @file scoring.hpp
 * @brief Health score formula and status derivation.
 * @details score = 0.3*lat + 0.2*jit + 0.3*loss + 0.2*util, each sub-score
 *          max(0, 100 - metric) clamped to [0,100]. Reused by the Routing
 *          Engine for the Balanced path preference.
 */

#include "sdwan/config/constants.hpp"
#include "sdwan/health/path_health.hpp"
#include "sdwan/health/prober.hpp"

namespace sdwan::health {

/**
 * @struct ScoreInputs
 * @brief Raw metrics fed into the formula.
 */
struct ScoreInputs {
    double latency_ms{0.0};
    double jitter_ms{0.0};
    double packet_loss_pct{0.0};
    double utilization_pct{0.0};
};

/**
 * @class HealthScorer
 * @brief Stateless scoring helpers.
 */
class HealthScorer {
public:
    /// Weighted 0..100 score. Monotonically non-increasing in every input.
    static double score(const ScoreInputs& in) noexcept;

    /// Up (>= 80), Degraded (>= 20), Down otherwise.
    static net::PathStatus status_for(double score) noexcept;

    /**
     * @brief Convert a probe round into a PathHealth.
     * @details A round with no replies yields score 0 / Down.
     */
    static PathHealth from_probe(net::PathId id, const ProbeResult& r,
                                 Timestamp at, double utilization_pct = 0.0) noexcept;

private:
    static double sub_score(double metric) noexcept;
};

} // namespace sdwan::health
