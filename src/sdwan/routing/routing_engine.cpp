/**
 * @file routing_engine.cpp
 * @brief RoutingEngine: sticky selection, failover, policy and binding tables.
 */
#include "sdwan/routing/routing_engine.hpp"

#include <algorithm>
#include <utility>

#include "sdwan/obs/log.hpp"

namespace sdwan::routing {

using namespace sdwan::config::constants;
using steady = std::chrono::steady_clock;

static_assert((FLOW_LOCK_STRIPES & (FLOW_LOCK_STRIPES - 1)) == 0, "stripe count must be a power of two");

RoutingEngine::RoutingEngine(std::shared_ptr<const health::HealthCache> health,
                             std::vector<RoutingPolicy> policies)
    : health_(std::move(health)), policies_(std::move(policies)) {
    const bool has_catch_all = std::any_of(policies_.begin(), policies_.end(),
        [](const RoutingPolicy& p) { return p.enabled && p.is_catch_all(); });
    if (!has_catch_all) {
        std::uint64_t next_id = 1;
        for (const auto& p : policies_) next_id = std::max(next_id, p.id + 1);
        RoutingPolicy fallback;
        fallback.id = next_id;
        fallback.name = "Default";
        fallback.priority = POLICY_PRIO_CATCH_ALL;
        fallback.preference = PathPreference::of(PreferenceKind::Balanced);
        policies_.push_back(std::move(fallback));
    }
    sort_policies();
}

std::mutex& RoutingEngine::stripe_for(const net::FlowKey& flow) noexcept {
    return stripes_[static_cast<std::size_t>(net::flow_hash(flow)) & (FLOW_LOCK_STRIPES - 1)];
}

void RoutingEngine::sort_policies() {
    std::stable_sort(policies_.begin(), policies_.end(),
                     [](const RoutingPolicy& a, const RoutingPolicy& b) { return a.priority < b.priority; });
}

RoutingEngine::MatchedPolicy RoutingEngine::match_policy(const net::FlowKey& flow) const {
    std::shared_lock lk(policies_mu_);
    for (const auto& p : policies_) {
        if (p.enabled && PolicyMatcher::matches(flow, p.match)) return {p.name, p.preference};
    }
    // Unreachable while the catch-all invariant holds.
    return {"Default", PathPreference::of(PreferenceKind::Balanced)};
}

std::vector<PathCandidate> RoutingEngine::eligible_candidates() const {
    std::vector<PathCandidate> out;
    for (auto& h : health_->snapshot()) {
        if (h.status == net::PathStatus::Down) continue;
        out.push_back(PathCandidate{std::move(h), {}});
    }
    if (out.empty()) return out;

    std::shared_lock lk(attrs_mu_);
    for (auto& c : out) {
        if (const auto it = attrs_.find(c.health.path_id); it != attrs_.end()) c.attrs = it->second;
    }
    return out;
}

void RoutingEngine::bind(const net::FlowKey& flow, net::PathId path, const std::string& policy) {
    std::unique_lock lk(bindings_mu_);
    auto& e = bindings_[flow];
    e.path = path;
    e.policy = policy;
    e.bound_at = std::chrono::system_clock::now();
    e.last_used.store(steady::now().time_since_epoch().count(), std::memory_order_relaxed);
}

void RoutingEngine::emit(obs::DecisionEvent&& e) const {
    std::shared_ptr<obs::Observer> sink;
    {
        std::shared_lock lk(hooks_mu_);
        sink = observer_;
    }
    if (sink) sink->record(e);
}

sdwan_detail::expected<net::PathId, SelectError> RoutingEngine::select_path(const net::FlowKey& flow) {
    std::lock_guard<std::mutex> flow_guard(stripe_for(flow));

    // 1. Sticky binding
    std::optional<net::PathId> prior;
    {
        std::shared_lock lk(bindings_mu_);
        if (const auto it = bindings_.find(flow); it != bindings_.end()) prior = it->second.path;
    }
    if (prior) {
        const auto h = health_->get(*prior);
        if (h && h->status != net::PathStatus::Down) {
            {
                std::shared_lock lk(bindings_mu_);
                if (const auto it = bindings_.find(flow); it != bindings_.end()) {
                    it->second.last_used.store(steady::now().time_since_epoch().count(), std::memory_order_relaxed);
                }
            }
            emit({.flow = flow.to_string(), .kind = obs::DecisionKind::Sticky, .selected = prior,
                  .best_score = h->health_score});
            return *prior;
        }
    }

    // 2. Policy enforcement
    std::shared_ptr<const FlowGate> gate;
    {
        std::shared_lock lk(hooks_mu_);
        gate = gate_;
    }
    if (gate && gate->check(flow) == FlowVerdict::Deny) {
        obs::logger()->debug("routing: flow {} denied", flow.to_string());
        emit({.flow = flow.to_string(), .kind = obs::DecisionKind::Denied});
        return sdwan_detail::unexpected<SelectError>(SelectError::FlowDenied);
    }

    // 3. Policy
    const MatchedPolicy policy = match_policy(flow);

    // 4. Candidates
    const auto candidates = eligible_candidates();
    if (candidates.empty()) {
        obs::logger()->debug("routing: no path for {} (policy {})", flow.to_string(), policy.name);
        emit({.flow = flow.to_string(), .kind = obs::DecisionKind::NoPath, .previous = prior, .policy = policy.name});
        return sdwan_detail::unexpected<SelectError>(SelectError::NoPathAvailable);
    }

    // 5. Score
    std::vector<PathScore> scored;
    scored.reserve(candidates.size());
    const auto best = PathScorer::choose_best(candidates, policy.preference, &scored);
    if (!best) return sdwan_detail::unexpected<SelectError>(SelectError::NoPathAvailable);

    // 6. Bind
    bind(flow, best->path_id, policy.name);

    const auto kind = prior ? obs::DecisionKind::Failover : obs::DecisionKind::Selected;
    if (prior) {
        obs::logger()->info("routing: failover {} {} -> {} (policy {})", flow.to_string(),
                            prior->to_string(), best->path_id.to_string(), policy.name);
    }
    emit({.flow = flow.to_string(), .kind = kind, .selected = best->path_id, .previous = prior,
          .policy = policy.name, .best_score = best->score, .scored = std::move(scored)});
    return best->path_id;
}

bool RoutingEngine::remove_flow(const net::FlowKey& flow) {
    std::lock_guard<std::mutex> flow_guard(stripe_for(flow));
    std::unique_lock lk(bindings_mu_);
    return bindings_.erase(flow) > 0;
}

ReevaluationReport RoutingEngine::reevaluate_all_flows() {
    std::vector<net::FlowKey> flows;
    {
        std::unique_lock lk(bindings_mu_);
        flows.reserve(bindings_.size());
        for (const auto& [flow, entry] : bindings_) flows.push_back(flow);
        bindings_.clear();
    }

    ReevaluationReport report;
    for (const auto& flow : flows) {
        if (select_path(flow)) ++report.reselected;
        else ++report.unbound;
    }
    obs::logger()->info("routing: re-evaluated {} flow(s): {} rebound, {} unbound",
                        flows.size(), report.reselected, report.unbound);
    return report;
}

// ------------------------------ Policies ------------------------------

bool RoutingEngine::is_last_catch_all(std::uint64_t id) const {
    const auto it = std::find_if(policies_.begin(), policies_.end(),
                                 [id](const RoutingPolicy& p) { return p.id == id; });
    if (it == policies_.end() || !it->enabled || !it->is_catch_all()) return false;
    return std::none_of(policies_.begin(), policies_.end(), [id](const RoutingPolicy& p) {
        return p.id != id && p.enabled && p.is_catch_all();
    });
}

sdwan_detail::expected<void, PolicyError> RoutingEngine::add_policy(RoutingPolicy policy) {
    std::unique_lock lk(policies_mu_);
    const bool dup = std::any_of(policies_.begin(), policies_.end(),
                                 [&](const RoutingPolicy& p) { return p.id == policy.id; });
    if (dup) return sdwan_detail::unexpected<PolicyError>(PolicyError::Exists);

    obs::logger()->info("routing: add policy {} '{}' prio={}", policy.id, policy.name, policy.priority);
    policies_.push_back(std::move(policy));
    sort_policies();
    return {};
}

sdwan_detail::expected<void, PolicyError> RoutingEngine::remove_policy(std::uint64_t id) {
    std::unique_lock lk(policies_mu_);
    const auto it = std::find_if(policies_.begin(), policies_.end(),
                                 [id](const RoutingPolicy& p) { return p.id == id; });
    if (it == policies_.end()) return sdwan_detail::unexpected<PolicyError>(PolicyError::NotFound);
    if (is_last_catch_all(id)) return sdwan_detail::unexpected<PolicyError>(PolicyError::LastCatchAll);

    obs::logger()->info("routing: remove policy {} '{}'", id, it->name);
    policies_.erase(it);
    return {};
}

sdwan_detail::expected<void, PolicyError> RoutingEngine::set_policy_enabled(std::uint64_t id, bool enabled) {
    std::unique_lock lk(policies_mu_);
    const auto it = std::find_if(policies_.begin(), policies_.end(),
                                 [id](const RoutingPolicy& p) { return p.id == id; });
    if (it == policies_.end()) return sdwan_detail::unexpected<PolicyError>(PolicyError::NotFound);
    if (!enabled && is_last_catch_all(id)) return sdwan_detail::unexpected<PolicyError>(PolicyError::LastCatchAll);
    it->enabled = enabled;
    return {};
}

std::vector<RoutingPolicy> RoutingEngine::list_policies() const {
    std::shared_lock lk(policies_mu_);
    return policies_;
}

std::optional<RoutingPolicy> RoutingEngine::get_policy(std::uint64_t id) const {
    std::shared_lock lk(policies_mu_);
    for (const auto& p : policies_) {
        if (p.id == id) return p;
    }
    return std::nullopt;
}

// --------------------------- Path attributes ---------------------------

void RoutingEngine::set_path_attributes(net::PathId id, PathAttributes attrs) {
    std::unique_lock lk(attrs_mu_);
    attrs_[id] = attrs;
}

bool RoutingEngine::remove_path_attributes(net::PathId id) {
    std::unique_lock lk(attrs_mu_);
    return attrs_.erase(id) > 0;
}

PathAttributes RoutingEngine::path_attributes(net::PathId id) const {
    std::shared_lock lk(attrs_mu_);
    const auto it = attrs_.find(id);
    return it == attrs_.end() ? PathAttributes{} : it->second;
}

// ------------------------------ Bindings ------------------------------

std::optional<net::PathId> RoutingEngine::binding(const net::FlowKey& flow) const {
    std::shared_lock lk(bindings_mu_);
    const auto it = bindings_.find(flow);
    if (it == bindings_.end()) return std::nullopt;
    return it->second.path;
}

std::vector<FlowBinding> RoutingEngine::bindings() const {
    std::shared_lock lk(bindings_mu_);
    std::vector<FlowBinding> out;
    out.reserve(bindings_.size());
    for (const auto& [flow, e] : bindings_) {
        out.push_back(FlowBinding{
            .flow = flow,
            .path = e.path,
            .policy = e.policy,
            .bound_at = e.bound_at,
            .last_used = steady::time_point(steady::duration(e.last_used.load(std::memory_order_relaxed))),
        });
    }
    return out;
}

std::size_t RoutingEngine::binding_count() const {
    std::shared_lock lk(bindings_mu_);
    return bindings_.size();
}

std::size_t RoutingEngine::clear_bindings() {
    std::unique_lock lk(bindings_mu_);
    const std::size_t n = bindings_.size();
    bindings_.clear();
    return n;
}

std::size_t RoutingEngine::evict_idle_flows(steady::duration max_idle) {
    const auto cutoff = (steady::now() - max_idle).time_since_epoch().count();
    std::unique_lock lk(bindings_mu_);
    const std::size_t n = std::erase_if(bindings_, [cutoff](const auto& kv) {
        return kv.second.last_used.load(std::memory_order_relaxed) <= cutoff;
    });
    if (n > 0) obs::logger()->debug("routing: evicted {} idle binding(s)", n);
    return n;
}

// ---------------------------- Collaborators ----------------------------

void RoutingEngine::attach_gate(std::shared_ptr<const FlowGate> gate) {
    std::unique_lock lk(hooks_mu_);
    gate_ = std::move(gate);
}

void RoutingEngine::attach_observer(std::shared_ptr<obs::Observer> observer) {
    std::unique_lock lk(hooks_mu_);
    observer_ = std::move(observer);
}

} // namespace sdwan::routing
