#pragma once
/**
 * @file routing_engine.hpp
 * @brief Policy-driven, sticky flow-to-path selection with failover.
 *
 * **Algorithm (select_path)**
 * 1. Existing binding whose path is not Down => return it (sticky hit).
 * 2. FlowGate (if attached) denies => FlowDenied, nothing bound.
 * 3. First enabled policy (ascending priority) whose rules match the flow.
 * 4. Candidates = every Up/Degraded path, in registration order.
 * 5. Score by the policy's preference; highest wins, first-registered on ties.
 * 6. Bind, overwriting any stale binding.
 *
 * **Locking**
 * - Each flow hashes to one of FLOW_LOCK_STRIPES mutexes held for the whole
 *   read-modify-write, so calls on the same flow are atomic while different
 *   flows rarely contend.
 * - The policy table, the binding table and the attribute table each have one
 *   reader/writer lock. They are leaf locks: never held while another table
 *   (including the HealthCache) is locked.
 */

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sdwan/compat/expected.hpp"
#include "sdwan/config/constants.hpp"
#include "sdwan/health/health_cache.hpp"
#include "sdwan/net/flow_key.hpp"
#include "sdwan/obs/observability.hpp"
#include "sdwan/routing/flow_gate.hpp"
#include "sdwan/routing/path_scorer.hpp"
#include "sdwan/routing/policy.hpp"

namespace sdwan::routing {

/// Typed select_path failures.
enum class SelectError : std::uint8_t {
    NoPathAvailable,  ///< No path registered, or every path is Down
    FlowDenied        ///< Refused by the FlowGate
};

constexpr std::string_view to_string(SelectError e) noexcept {
    return e == SelectError::FlowDenied ? "flow_denied" : "no_path_available";
}

/// Policy-table mutation failures.
enum class PolicyError : std::uint8_t {
    Exists,       ///< add_policy with an id already in the table
    NotFound,     ///< Unknown policy id
    LastCatchAll  ///< Would leave no enabled catch-all policy
};

constexpr std::string_view to_string(PolicyError e) noexcept {
    switch (e) {
        case PolicyError::Exists:       return "exists";
        case PolicyError::NotFound:     return "not_found";
        case PolicyError::LastCatchAll: return "last_catch_all";
    }
    return "not_found";
}

/**
 * @struct FlowBinding
 * @brief Read-only view of one sticky binding.
 */
struct FlowBinding {
    net::FlowKey                          flow{};
    net::PathId                           path{};
    std::string                           policy;     ///< Policy that produced the binding
    std::chrono::system_clock::time_point bound_at{};
    std::chrono::steady_clock::time_point last_used{};
};

/// Outcome of reevaluate_all_flows().
struct ReevaluationReport {
    std::size_t reselected{0};  ///< Flows bound again
    std::size_t unbound{0};     ///< Flows left without a binding (no path / denied)
};

/**
 * @class RoutingEngine
 * @brief Returns the path a flow should use; thread-safe.
 */
class RoutingEngine {
public:
    /**
     * @param health Shared health table written by the Health Monitor.
     * @param policies Initial table; a "Default" catch-all is appended if the
     *        set has no enabled one.
     */
    explicit RoutingEngine(std::shared_ptr<const health::HealthCache> health,
                           std::vector<RoutingPolicy> policies = default_policies());

    RoutingEngine(const RoutingEngine&) = delete;
    RoutingEngine& operator=(const RoutingEngine&) = delete;

    /// Select (or reuse) the path for @p flow.
    sdwan_detail::expected<net::PathId, SelectError> select_path(const net::FlowKey& flow);

    /// Drop the binding of @p flow. Idempotent; returns whether one existed.
    bool remove_flow(const net::FlowKey& flow);

    /**
     * @brief Clear every binding and re-run selection for each previously bound flow.
     * @details Flows that cannot be re-selected stay unbound until their next packet.
     */
    ReevaluationReport reevaluate_all_flows();

    // ------------------------------ Policies ------------------------------
    sdwan_detail::expected<void, PolicyError> add_policy(RoutingPolicy policy);
    sdwan_detail::expected<void, PolicyError> remove_policy(std::uint64_t id);
    sdwan_detail::expected<void, PolicyError> set_policy_enabled(std::uint64_t id, bool enabled);
    [[nodiscard]] std::vector<RoutingPolicy>   list_policies() const;
    [[nodiscard]] std::optional<RoutingPolicy> get_policy(std::uint64_t id) const;

    // --------------------------- Path attributes ---------------------------
    void set_path_attributes(net::PathId id, PathAttributes attrs);
    bool remove_path_attributes(net::PathId id);
    [[nodiscard]] PathAttributes path_attributes(net::PathId id) const;

    // ------------------------------ Bindings ------------------------------
    [[nodiscard]] std::optional<net::PathId> binding(const net::FlowKey& flow) const;
    [[nodiscard]] std::vector<FlowBinding>   bindings() const;
    [[nodiscard]] std::size_t                binding_count() const;

    /// Administrative reset; returns the number of bindings dropped.
    std::size_t clear_bindings();

    /// Drop bindings not used for at least @p max_idle; returns how many.
    std::size_t evict_idle_flows(std::chrono::steady_clock::duration max_idle);

    // ---------------------------- Collaborators ----------------------------
    void attach_gate(std::shared_ptr<const FlowGate> gate);
    void attach_observer(std::shared_ptr<obs::Observer> observer);

private:
    struct BindingEntry {
        net::PathId                                   path{};
        std::string                                   policy;
        std::chrono::system_clock::time_point         bound_at{};
        std::atomic<std::chrono::steady_clock::rep>   last_used{0};  ///< Touched under shared lock
    };

    struct MatchedPolicy {
        std::string    name;
        PathPreference preference;
    };

    std::mutex& stripe_for(const net::FlowKey& flow) noexcept;
    MatchedPolicy match_policy(const net::FlowKey& flow) const;
    std::vector<PathCandidate> eligible_candidates() const;
    void bind(const net::FlowKey& flow, net::PathId path, const std::string& policy);
    void emit(obs::DecisionEvent&& e) const;

    /// True if removing/disabling @p id would leave no enabled catch-all. Caller holds policies_mu_.
    bool is_last_catch_all(std::uint64_t id) const;
    void sort_policies();

private:
    std::shared_ptr<const health::HealthCache> health_;

    mutable std::shared_mutex  policies_mu_;
    std::vector<RoutingPolicy> policies_;   ///< Sorted by ascending priority (stable)

    mutable std::shared_mutex                           bindings_mu_;
    std::unordered_map<net::FlowKey, BindingEntry>      bindings_;

    mutable std::shared_mutex                           attrs_mu_;
    std::unordered_map<net::PathId, PathAttributes>     attrs_;

    std::array<std::mutex, config::constants::FLOW_LOCK_STRIPES> stripes_;

    mutable std::shared_mutex          hooks_mu_;
    std::shared_ptr<const FlowGate>    gate_;
    std::shared_ptr<obs::Observer>     observer_;
};

} // namespace sdwan::routing
