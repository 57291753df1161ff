#pragma once
/**
 * @file policy.hpp
 * @brief Routing policies: match rules, application classes and path preferences.
 * @details Policies are plain values; the Routing Engine owns the table and
 *          keeps it sorted by ascending priority.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sdwan/net/flow_key.hpp"
#include "sdwan/net/ip_address.hpp"

namespace sdwan::routing {

/**
 * @enum ApplicationClass
 * @brief Coarse traffic class derived from protocol + destination port.
 */
enum class ApplicationClass : std::uint8_t {
    VoIP,
    VideoConference,
    FileTransfer,
    Backup,
    Web,
    Email,
    Database,
    Other
};

std::string_view to_string(ApplicationClass c) noexcept;

/// Well-known port table (SIP/RTP, STUN/TURN, Zoom, Meet, HTTP(S), mail, FTP/SSH/SMB, DBs, rsync).
ApplicationClass classify_flow(std::uint8_t protocol, std::uint16_t dst_port) noexcept;

/**
 * @struct ScoringWeights
 * @brief Blend of the five 0..100 component scores; weights should sum to 1.
 */
struct ScoringWeights {
    double latency{0.0};
    double jitter{0.0};
    double loss{0.0};
    double bandwidth{0.0};
    double cost{0.0};

    static constexpr ScoringWeights latency_sensitive()  noexcept { return {0.5, 0.3, 0.2, 0.0, 0.0}; }
    static constexpr ScoringWeights throughput_focused() noexcept { return {0.1, 0.0, 0.2, 0.7, 0.0}; }
    static constexpr ScoringWeights cost_optimized()     noexcept { return {0.2, 0.1, 0.2, 0.0, 0.5}; }
    static constexpr ScoringWeights balanced()           noexcept { return {0.3, 0.2, 0.3, 0.2, 0.0}; }

    bool operator==(const ScoringWeights&) const = default;
};

/**
 * @enum PreferenceKind
 * @brief Named selection strategy of a policy.
 */
enum class PreferenceKind : std::uint8_t {
    LowestLatency,
    HighestBandwidth,
    LowestPacketLoss,
    LowestCost,
    Balanced,   ///< Health-score formula over current metrics and utilization
    Custom      ///< Weighted blend with explicit ScoringWeights
};

std::string_view to_string(PreferenceKind k) noexcept;

/**
 * @struct PathPreference
 * @brief Strategy plus weights (weights only used by Custom).
 */
struct PathPreference {
    PreferenceKind kind{PreferenceKind::Balanced};
    ScoringWeights weights{ScoringWeights::balanced()};

    static constexpr PathPreference of(PreferenceKind k) noexcept { return {k, ScoringWeights::balanced()}; }
    static constexpr PathPreference custom(ScoringWeights w) noexcept { return {PreferenceKind::Custom, w}; }

    bool operator==(const PathPreference&) const = default;
};

/**
 * @struct MatchRules
 * @brief Conjunction of optional filters; an empty rule set matches every flow.
 */
struct MatchRules {
    std::optional<net::CidrNetwork>                          src;
    std::optional<net::CidrNetwork>                          dst;
    std::optional<std::uint16_t>                             src_port;
    std::optional<std::pair<std::uint16_t, std::uint16_t>>   dst_port_range;  ///< Inclusive
    std::optional<std::uint8_t>                              protocol;
    std::vector<ApplicationClass>                            app_classes;     ///< Any-of; empty = any

    /// True when no filter is set (catch-all).
    [[nodiscard]] bool empty() const noexcept {
        return !src && !dst && !src_port && !dst_port_range && !protocol && app_classes.empty();
    }

    bool operator==(const MatchRules&) const = default;
};

/**
 * @struct RoutingPolicy
 * @brief One entry of the policy table.
 */
struct RoutingPolicy {
    std::uint64_t  id{0};
    std::string    name;
    std::uint32_t  priority{0};     ///< Lower is matched first
    MatchRules     match;
    PathPreference preference{};
    bool           enabled{true};

    /// Matches every flow (enabled-ness not considered).
    [[nodiscard]] bool is_catch_all() const noexcept { return match.empty(); }

    bool operator==(const RoutingPolicy&) const = default;
};

/**
 * @class PolicyMatcher
 * @brief Stateless flow-vs-rules evaluation.
 */
class PolicyMatcher {
public:
    static bool matches(const net::FlowKey& flow, const MatchRules& rules) noexcept;
};

/// Startup policy set: "VoIP/Video" (10), "Gaming" (20), "Bulk Transfers" (50), "Default" (1000).
std::vector<RoutingPolicy> default_policies();

} // namespace sdwan::routing
