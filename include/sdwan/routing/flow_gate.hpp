#pragma once
/**
 * @file flow_gate.hpp
 * @brief Pluggable policy-enforcement collaborator: may a flow be routed at all?
 * @details Consulted once per fresh path selection (not on sticky hits).
 */

#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

#include "sdwan/net/flow_key.hpp"
#include "sdwan/routing/policy.hpp"

namespace sdwan::routing {

/// Verdict of a FlowGate.
enum class FlowVerdict : std::uint8_t { Allow, Deny };

constexpr std::string_view to_string(FlowVerdict v) noexcept {
    return v == FlowVerdict::Allow ? "allow" : "deny";
}

class FlowGate {
public:
    virtual ~FlowGate() = default;

    /// Decide whether @p flow may be routed.
    virtual FlowVerdict check(const net::FlowKey& flow) const = 0;
};

/**
 * @struct GateRule
 * @brief Match rules plus the verdict applied when they match.
 */
struct GateRule {
    MatchRules  match;
    FlowVerdict verdict{FlowVerdict::Deny};
};

/**
 * @class StaticFlowGate
 * @brief Ordered rule list; first matching rule wins, default verdict otherwise.
 */
class StaticFlowGate final : public FlowGate {
public:
    explicit StaticFlowGate(FlowVerdict default_verdict = FlowVerdict::Allow) noexcept
        : default_(default_verdict) {}

    /// Replace the rule list.
    void load_rules(std::vector<GateRule> rules);

    /// Append one rule at the lowest precedence.
    void add_rule(GateRule rule);

    FlowVerdict check(const net::FlowKey& flow) const override;

private:
    mutable std::mutex    mu_;
    std::vector<GateRule> rules_;
    FlowVerdict           default_;
};

} // namespace sdwan::routing
