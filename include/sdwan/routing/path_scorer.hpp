#pragma once
/**
 * @file path_scorer.hpp
 * @brief Candidate path scoring against a policy's PathPreference.
 * @details Deterministic and stateless. Every component score is 0..100,
 *          higher is better. Ties go to the earliest candidate.
 */

#include <optional>
#include <span>
#include <vector>

#include "sdwan/health/path_health.hpp"
#include "sdwan/routing/policy.hpp"

namespace sdwan::routing {

/**
 * @struct PathAttributes
 * @brief Static/slow-moving path properties supplied by the topology owner.
 */
struct PathAttributes {
    double                bandwidth_mbps{0.0};   ///< Provisioned capacity; 0 = unknown
    double                utilization_pct{0.0};  ///< Current load [0,100]
    std::optional<double> cost_per_gb;           ///< USD per GB; nullopt = unknown

    bool operator==(const PathAttributes&) const = default;
};

/**
 * @struct PathCandidate
 * @brief Health snapshot plus attributes for one eligible path.
 */
struct PathCandidate {
    health::PathHealth health;
    PathAttributes     attrs;
};

/**
 * @struct PathScore
 * @brief Scoring result for a path.
 */
struct PathScore {
    net::PathId path_id{};
    double      score{0.0};

    bool operator==(const PathScore&) const = default;
};

/**
 * @class PathScorer
 * @brief Preference-driven scoring.
 */
class PathScorer {
public:
    /**
     * @brief Score one candidate.
     * @return 0 when the path has never been measured (still eligible).
     */
    static double score(const PathCandidate& c, const PathPreference& pref) noexcept;

    /**
     * @brief Highest-scoring candidate; strict '>' keeps the first on ties.
     * @param scored Optional sink receiving every candidate's score, in order.
     */
    static std::optional<PathScore> choose_best(std::span<const PathCandidate> candidates,
                                                const PathPreference& pref,
                                                std::vector<PathScore>* scored = nullptr);

    // Component scores (exposed for tests and the admin surface)
    static double latency_score(double latency_ms) noexcept;     ///< 100 at 0 ms, 0 at >= 200 ms
    static double jitter_score(double jitter_ms) noexcept;       ///< 100 at 0 ms, 0 at >= 50 ms
    static double loss_score(double loss_pct) noexcept;          ///< 100 - loss
    static double bandwidth_score(double bandwidth_mbps) noexcept; ///< 100 at >= 1 Gbps
    static double cost_score(std::optional<double> cost_per_gb) noexcept; ///< 100 at $0, 0 at >= $0.20; 50 unknown
};

} // namespace sdwan::routing
