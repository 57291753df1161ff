#pragma once
/**
 * @file observability.hpp
 * @brief Routing decision events + counters.
 * @details The default observer renders each event as one JSON-ish line on the
 *          shared spdlog logger at debug level.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sdwan/net/types.hpp"
#include "sdwan/routing/path_scorer.hpp"

namespace sdwan::obs {

/**
 * @enum DecisionKind
 * @brief Outcome class of a select_path call.
 */
enum class DecisionKind : std::uint8_t {
    Sticky,    ///< Existing binding reused
    Selected,  ///< Fresh selection, no prior binding
    Failover,  ///< Prior binding's path was Down or gone; rebound
    Denied,    ///< Flow gate refused the flow
    NoPath     ///< No Up/Degraded path exists
};

constexpr std::string_view to_string(DecisionKind k) noexcept {
    switch (k) {
        case DecisionKind::Sticky:   return "sticky";
        case DecisionKind::Selected: return "selected";
        case DecisionKind::Failover: return "failover";
        case DecisionKind::Denied:   return "denied";
        case DecisionKind::NoPath:   return "no_path";
    }
    return "selected";
}

/** @struct Counters
 *  @brief Process-level counters for routing decisions.
 */
struct Counters {
    uint64_t decisions{0};    ///< Total decisions recorded
    uint64_t sticky_hits{0};  ///< Decisions served from an existing binding
    uint64_t failovers{0};    ///< Bindings moved off a failed path
    uint64_t denials{0};      ///< Flows refused by the gate
    uint64_t no_path{0};      ///< Selections that found no eligible path
};

/** @struct DecisionEvent
 *  @brief Payload describing a single routing decision.
 */
struct DecisionEvent {
    std::string                       flow;          ///< FlowKey rendered for humans
    DecisionKind                      kind{DecisionKind::Selected};
    std::optional<net::PathId>        selected;      ///< Chosen path, if any
    std::optional<net::PathId>        previous;      ///< Binding replaced on failover
    std::string                       policy;        ///< Matched policy name (fresh selections)
    double                            best_score{0.0};
    std::vector<routing::PathScore>   scored;        ///< Scores for all candidates
};

/** @class Observer
 *  @brief Observability sink interface.
 */
class Observer {
public:
    virtual ~Observer() = default;
    /// Record a single decision event.
    virtual void record(const DecisionEvent& e) = 0;
    /// Return a snapshot of counters.
    virtual Counters snapshot() const = 0;
};

/// Counting observer that also logs each event at debug level.
std::shared_ptr<Observer> make_logging_observer();

} // namespace sdwan::obs
