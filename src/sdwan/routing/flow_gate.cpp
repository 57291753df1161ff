/**
 * @file flow_gate.cpp
 * @brief StaticFlowGate implementation.
 */
#include "sdwan/routing/flow_gate.hpp"

#include <utility>

namespace sdwan::routing {

void StaticFlowGate::load_rules(std::vector<GateRule> rules) {
    std::lock_guard<std::mutex> lk(mu_);
    rules_ = std::move(rules);
}

void StaticFlowGate::add_rule(GateRule rule) {
    std::lock_guard<std::mutex> lk(mu_);
    rules_.push_back(std::move(rule));
}

FlowVerdict StaticFlowGate::check(const net::FlowKey& flow) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& r : rules_) {
        if (PolicyMatcher::matches(flow, r.match)) return r.verdict;
    }
    return default_;
}

} // namespace sdwan::routing
