/**
 * @file test_routing_engine.cpp
 * @brief Tests for PathScorer and RoutingEngine selection, stickiness and failover.
 *
 * Validates:
 *  - Component scores and tie-breaking in PathScorer
 *  - Session-only paths rank as unmeasured
 *  - Fresh selection picks the best Up/Degraded path under the matched policy
 *  - Bindings are sticky while their path is not Down
 *  - Failover to the next best path once the bound path goes Down
 *  - NoPathAvailable / FlowDenied error paths
 *  - Policy table mutations and the enabled catch-all guarantee
 *  - Re-evaluation, idle eviction, concurrent selection
 */

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "sdwan/health/health_monitor.hpp"
#include "sdwan/health/scoring.hpp"
#include "sdwan/routing/routing_engine.hpp"

using namespace std::chrono_literals;
using sdwan::health::HealthCache;
using sdwan::health::HealthScorer;
using sdwan::health::PathHealth;
using sdwan::health::SessionState;
using sdwan::health::SystemClock;
using sdwan::net::FlowKey;
using sdwan::net::IpAddress;
using sdwan::net::PathId;
using sdwan::net::PathStatus;
using sdwan::net::PROTO_TCP;
using sdwan::net::PROTO_UDP;
using sdwan::obs::DecisionEvent;
using sdwan::obs::DecisionKind;
using sdwan::routing::FlowVerdict;
using sdwan::routing::GateRule;
using sdwan::routing::MatchRules;
using sdwan::routing::PathAttributes;
using sdwan::routing::PathCandidate;
using sdwan::routing::PathPreference;
using sdwan::routing::PathScorer;
using sdwan::routing::PolicyError;
using sdwan::routing::PreferenceKind;
using sdwan::routing::RoutingEngine;
using sdwan::routing::RoutingPolicy;
using sdwan::routing::SelectError;
using sdwan::routing::StaticFlowGate;

namespace {

/// Measured record scored the same way the Health Monitor does it.
PathHealth measured(PathId id, double latency_ms, double loss_pct, double jitter_ms = 0.0) {
  PathHealth h;
  h.path_id         = id;
  h.latency_ms      = latency_ms;
  h.packet_loss_pct = loss_pct;
  h.jitter_ms       = jitter_ms;
  h.last_checked    = SystemClock::now();
  h.measured        = true;
  h.health_score    = HealthScorer::score({latency_ms, jitter_ms, loss_pct, 0.0});
  h.status          = HealthScorer::status_for(h.health_score);
  return h;
}

PathHealth down(PathId id) {
  PathHealth h = measured(id, 0.0, 100.0);
  h.health_score = 0.0;
  h.status = PathStatus::Down;
  return h;
}

FlowKey tcp_flow(std::uint16_t sport, std::uint16_t dport = 443) {
  return FlowKey{IpAddress::v4(0x0A000001), IpAddress::v4(0x0A010001), sport, dport, PROTO_TCP};
}

///
/// Observer that keeps every event for inspection.
///
class RecordingObserver final : public sdwan::obs::Observer {
public:
  void record(const DecisionEvent& e) override {
    std::lock_guard<std::mutex> lk(mu_);
    events_.push_back(e);
  }
  sdwan::obs::Counters snapshot() const override { return {}; }
  std::vector<DecisionEvent> events() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_;
  }
private:
  mutable std::mutex         mu_;
  std::vector<DecisionEvent> events_;
};

/// Two-path fixture: path 1 = 10 ms / 0.1 %, path 2 = 50 ms / 1 %.
struct TwoPaths {
  std::shared_ptr<HealthCache> cache = std::make_shared<HealthCache>();
  TwoPaths() {
    cache->register_path(PathId{1});
    cache->register_path(PathId{2});
    cache->publish(measured(PathId{1}, 10.0, 0.1));
    cache->publish(measured(PathId{2}, 50.0, 1.0));
  }
};

} // namespace

// --------------------------- PathScorer ------------------------------------

/**
 * @test Scorer_Component_Scores
 * @brief Linear component scales and their clamps.
 */
TEST(PathScorer, Scorer_Component_Scores) {
  EXPECT_DOUBLE_EQ(PathScorer::latency_score(0.0), 100.0);
  EXPECT_DOUBLE_EQ(PathScorer::latency_score(100.0), 50.0);
  EXPECT_DOUBLE_EQ(PathScorer::latency_score(500.0), 0.0);
  EXPECT_DOUBLE_EQ(PathScorer::jitter_score(25.0), 50.0);
  EXPECT_DOUBLE_EQ(PathScorer::loss_score(2.5), 97.5);
  EXPECT_DOUBLE_EQ(PathScorer::bandwidth_score(500.0), 50.0);
  EXPECT_DOUBLE_EQ(PathScorer::bandwidth_score(10000.0), 100.0);
  EXPECT_DOUBLE_EQ(PathScorer::cost_score(std::nullopt), 50.0);
  EXPECT_DOUBLE_EQ(PathScorer::cost_score(0.0), 100.0);
  EXPECT_DOUBLE_EQ(PathScorer::cost_score(1.0), 0.0);
}

/**
 * @test Scorer_Unmeasured_Path_Scores_Zero
 * @brief A path with no metrics yet scores 0 under every preference.
 */
TEST(PathScorer, Scorer_Unmeasured_Path_Scores_Zero) {
  PathCandidate c{PathHealth::unknown(PathId{1}), PathAttributes{1000.0, 0.0, 0.01}};
  for (auto k : {PreferenceKind::LowestLatency, PreferenceKind::HighestBandwidth,
                 PreferenceKind::LowestCost, PreferenceKind::Balanced}) {
    EXPECT_DOUBLE_EQ(PathScorer::score(c, PathPreference::of(k)), 0.0);
  }

  // Status and timestamp from a liveness session do not make it measured.
  c.health.status       = PathStatus::Up;
  c.health.health_score = 100.0;
  c.health.last_checked = SystemClock::now();
  EXPECT_DOUBLE_EQ(PathScorer::score(c, PathPreference::of(PreferenceKind::Balanced)), 0.0);
  EXPECT_DOUBLE_EQ(PathScorer::score(c, PathPreference::of(PreferenceKind::LowestLatency)), 0.0);
}

/**
 * @test Scorer_Tie_Keeps_First
 * @brief Equal scores => first candidate wins; all scores reported in order.
 */
TEST(PathScorer, Scorer_Tie_Keeps_First) {
  const std::vector<PathCandidate> cands{
      {measured(PathId{7}, 20.0, 0.0), {}},
      {measured(PathId{3}, 20.0, 0.0), {}},
  };
  std::vector<sdwan::routing::PathScore> scored;
  const auto best = PathScorer::choose_best(cands, PathPreference::of(PreferenceKind::Balanced), &scored);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->path_id, PathId{7});
  ASSERT_EQ(scored.size(), 2u);
  EXPECT_EQ(scored[1].path_id, PathId{3});
  EXPECT_DOUBLE_EQ(scored[0].score, scored[1].score);

  EXPECT_FALSE(PathScorer::choose_best({}, PathPreference{}).has_value());
}

// --------------------------- Selection -------------------------------------

/**
 * @test Engine_Selects_Best_Then_Fails_Over
 * @brief Best path first; once it is Down the flow moves to the other path.
 */
TEST(RoutingEngine, Engine_Selects_Best_Then_Fails_Over) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  auto rec = std::make_shared<RecordingObserver>();
  engine.attach_observer(rec);

  const auto flow = tcp_flow(40000);
  auto r = engine.select_path(flow);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, PathId{1});

  env.cache->publish(down(PathId{1}));
  r = engine.select_path(flow);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, PathId{2});
  EXPECT_EQ(engine.binding(flow), PathId{2});

  const auto ev = rec->events();
  ASSERT_EQ(ev.size(), 2u);
  EXPECT_EQ(ev[0].kind, DecisionKind::Selected);
  EXPECT_EQ(ev[0].policy, "Default");
  EXPECT_EQ(ev[0].scored.size(), 2u);
  EXPECT_EQ(ev[1].kind, DecisionKind::Failover);
  EXPECT_EQ(ev[1].previous, PathId{1});
  EXPECT_EQ(ev[1].selected, PathId{2});
}

/**
 * @test Engine_Session_Only_Path_Ranks_Below_Measured
 * @brief A path reported Up only by a liveness session scores 0, so a probed
 *        path wins; it still carries traffic once the probed path is Down.
 */
TEST(RoutingEngine, Engine_Session_Only_Path_Ranks_Below_Measured) {
  auto cache = std::make_shared<HealthCache>();
  sdwan::health::HealthMonitor monitor(nullptr, cache, nullptr);
  ASSERT_TRUE(monitor.register_path(PathId{1}));
  ASSERT_TRUE(monitor.register_path(PathId{2}));
  cache->publish(measured(PathId{1}, 10.0, 0.1));

  const auto session = monitor.apply_session_state(PathId{2}, SessionState::Up);
  ASSERT_EQ(session.status, PathStatus::Up);
  EXPECT_FALSE(session.has_metrics());

  RoutingEngine engine(cache);
  const auto r = engine.select_path(tcp_flow(45000));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, PathId{1});

  cache->publish(down(PathId{1}));
  const auto fallback = engine.select_path(tcp_flow(45001));
  ASSERT_TRUE(fallback.has_value());
  EXPECT_EQ(*fallback, PathId{2});
}

/**
 * @test Engine_Binding_Is_Sticky
 * @brief A bound flow keeps its path even when another path becomes better,
 *        and while the bound path is only Degraded.
 */
TEST(RoutingEngine, Engine_Binding_Is_Sticky) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  const auto flow = tcp_flow(40001);
  ASSERT_EQ(*engine.select_path(flow), PathId{1});

  env.cache->publish(measured(PathId{2}, 1.0, 0.0));    // now clearly better
  env.cache->publish(measured(PathId{1}, 120.0, 10.0)); // degraded, not down
  ASSERT_EQ(env.cache->get(PathId{1})->status, PathStatus::Degraded);

  for (int i = 0; i < 5; ++i) {
    const auto r = engine.select_path(flow);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, PathId{1});
  }

  // A new flow sees the new ranking.
  EXPECT_EQ(*engine.select_path(tcp_flow(40002)), PathId{2});
}

/**
 * @test Engine_Bound_Path_Removed_Rebinds
 * @brief Binding to a path that vanished from the cache triggers reselection.
 */
TEST(RoutingEngine, Engine_Bound_Path_Removed_Rebinds) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  const auto flow = tcp_flow(40003);
  ASSERT_EQ(*engine.select_path(flow), PathId{1});
  env.cache->deregister_path(PathId{1});
  EXPECT_EQ(*engine.select_path(flow), PathId{2});
}

/**
 * @test Engine_No_Path_Available
 * @brief Empty cache and all-Down cache both report NoPathAvailable.
 */
TEST(RoutingEngine, Engine_No_Path_Available) {
  auto cache = std::make_shared<HealthCache>();
  RoutingEngine engine(cache);
  const auto flow = tcp_flow(40004);

  auto r = engine.select_path(flow);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), SelectError::NoPathAvailable);

  cache->register_path(PathId{1});  // unknown => Down
  cache->register_path(PathId{2});
  cache->publish(down(PathId{2}));
  r = engine.select_path(flow);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), SelectError::NoPathAvailable);
  EXPECT_EQ(engine.binding_count(), 0u);
}

/**
 * @test Engine_Bound_Flow_All_Down_Fails
 * @brief A bound flow whose every path is Down gets NoPathAvailable.
 */
TEST(RoutingEngine, Engine_Bound_Flow_All_Down_Fails) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  const auto flow = tcp_flow(40005);
  ASSERT_TRUE(engine.select_path(flow).has_value());
  env.cache->publish(down(PathId{1}));
  env.cache->publish(down(PathId{2}));
  const auto r = engine.select_path(flow);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), SelectError::NoPathAvailable);
}

/**
 * @test Engine_Policy_Preference_Applies
 * @brief A bandwidth policy picks the fat pipe even though it is slower.
 */
TEST(RoutingEngine, Engine_Policy_Preference_Applies) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  engine.set_path_attributes(PathId{1}, PathAttributes{100.0, 0.0, std::nullopt});
  engine.set_path_attributes(PathId{2}, PathAttributes{1000.0, 0.0, std::nullopt});

  RoutingPolicy bulk;
  bulk.id = 100;
  bulk.name = "Replication";
  bulk.priority = 5;
  bulk.match.dst_port_range = std::pair<std::uint16_t, std::uint16_t>{9000, 9000};
  bulk.preference = PathPreference::of(PreferenceKind::HighestBandwidth);
  ASSERT_TRUE(engine.add_policy(bulk).has_value());

  EXPECT_EQ(*engine.select_path(tcp_flow(40006, 9000)), PathId{2});
  EXPECT_EQ(*engine.select_path(tcp_flow(40006, 443)), PathId{1});

  const auto b = engine.bindings();
  ASSERT_EQ(b.size(), 2u);
  for (const auto& fb : b) {
    EXPECT_EQ(fb.policy, fb.flow.dst_port == 9000 ? "Replication" : "Default");
  }
}

/**
 * @test Engine_Gate_Denies_Fresh_Flows
 * @brief Denied flows get FlowDenied and no binding; allowed flows route.
 */
TEST(RoutingEngine, Engine_Gate_Denies_Fresh_Flows) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  auto gate = std::make_shared<StaticFlowGate>(FlowVerdict::Allow);
  MatchRules udp;
  udp.protocol = PROTO_UDP;
  gate->add_rule(GateRule{udp, FlowVerdict::Deny});
  engine.attach_gate(gate);

  FlowKey f = tcp_flow(40007);
  f.protocol = PROTO_UDP;
  const auto r = engine.select_path(f);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), SelectError::FlowDenied);
  EXPECT_FALSE(engine.binding(f).has_value());

  EXPECT_TRUE(engine.select_path(tcp_flow(40008)).has_value());
}

/**
 * @test Engine_Gate_Not_Consulted_For_Bound_Flows
 * @brief Sticky reuse happens before gate evaluation.
 */
TEST(RoutingEngine, Engine_Gate_Not_Consulted_For_Bound_Flows) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  const auto flow = tcp_flow(40009);
  ASSERT_TRUE(engine.select_path(flow).has_value());

  engine.attach_gate(std::make_shared<StaticFlowGate>(FlowVerdict::Deny));
  EXPECT_TRUE(engine.select_path(flow).has_value());
  EXPECT_FALSE(engine.select_path(tcp_flow(40010)).has_value());
}

// --------------------------- Binding management ----------------------------

/**
 * @test Engine_Remove_Flow_Idempotent
 * @brief Second removal is a no-op.
 */
TEST(RoutingEngine, Engine_Remove_Flow_Idempotent) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  const auto flow = tcp_flow(40011);
  ASSERT_TRUE(engine.select_path(flow).has_value());
  EXPECT_TRUE(engine.remove_flow(flow));
  EXPECT_FALSE(engine.remove_flow(flow));
  EXPECT_FALSE(engine.remove_flow(tcp_flow(1)));
  EXPECT_EQ(engine.binding_count(), 0u);
}

/**
 * @test Engine_Reevaluate_Moves_Flows
 * @brief Re-evaluation rebinds every flow under the current ranking.
 */
TEST(RoutingEngine, Engine_Reevaluate_Moves_Flows) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  for (std::uint16_t p = 0; p < 10; ++p) ASSERT_EQ(*engine.select_path(tcp_flow(41000 + p)), PathId{1});

  env.cache->publish(measured(PathId{2}, 1.0, 0.0));
  auto rep = engine.reevaluate_all_flows();
  EXPECT_EQ(rep.reselected, 10u);
  EXPECT_EQ(rep.unbound, 0u);
  for (const auto& b : engine.bindings()) EXPECT_EQ(b.path, PathId{2});

  env.cache->publish(down(PathId{1}));
  env.cache->publish(down(PathId{2}));
  rep = engine.reevaluate_all_flows();
  EXPECT_EQ(rep.reselected, 0u);
  EXPECT_EQ(rep.unbound, 10u);
  EXPECT_EQ(engine.binding_count(), 0u);
}

/**
 * @test Engine_Evict_Idle_Flows
 * @brief Zero idle limit evicts everything; a long limit keeps everything.
 */
TEST(RoutingEngine, Engine_Evict_Idle_Flows) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  ASSERT_TRUE(engine.select_path(tcp_flow(42000)).has_value());
  ASSERT_TRUE(engine.select_path(tcp_flow(42001)).has_value());

  EXPECT_EQ(engine.evict_idle_flows(1h), 0u);
  EXPECT_EQ(engine.binding_count(), 2u);
  std::this_thread::sleep_for(2ms);
  EXPECT_EQ(engine.evict_idle_flows(0s), 2u);
  EXPECT_EQ(engine.binding_count(), 0u);

  ASSERT_TRUE(engine.select_path(tcp_flow(42002)).has_value());
  EXPECT_EQ(engine.clear_bindings(), 1u);
}

// --------------------------- Policy table ----------------------------------

/**
 * @test Engine_Catch_All_Protected
 * @brief The last enabled catch-all cannot be removed or disabled.
 */
TEST(RoutingEngine, Engine_Catch_All_Protected) {
  TwoPaths env;
  RoutingEngine engine(env.cache);

  auto r = engine.remove_policy(4);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), PolicyError::LastCatchAll);
  r = engine.set_policy_enabled(4, false);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), PolicyError::LastCatchAll);

  RoutingPolicy spare;
  spare.id = 50;
  spare.name = "Spare";
  spare.priority = 2000;
  ASSERT_TRUE(engine.add_policy(spare).has_value());
  EXPECT_TRUE(engine.set_policy_enabled(4, false).has_value());
  EXPECT_TRUE(engine.remove_policy(4).has_value());

  EXPECT_EQ(engine.remove_policy(4).error(), PolicyError::NotFound);
  EXPECT_EQ(engine.add_policy(spare).error(), PolicyError::Exists);

  const auto flow = tcp_flow(43000);
  ASSERT_TRUE(engine.select_path(flow).has_value());
  EXPECT_EQ(engine.bindings().front().policy, "Spare");
}

/**
 * @test Engine_Adds_Missing_Catch_All
 * @brief Construction with no catch-all appends an enabled "Default".
 */
TEST(RoutingEngine, Engine_Adds_Missing_Catch_All) {
  RoutingPolicy only;
  only.id = 9;
  only.name = "Web";
  only.priority = 1;
  only.match.dst_port_range = std::pair<std::uint16_t, std::uint16_t>{443, 443};

  RoutingEngine engine(std::make_shared<HealthCache>(), {only});
  const auto list = engine.list_policies();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].name, "Web");
  EXPECT_EQ(list[1].name, "Default");
  EXPECT_TRUE(list[1].is_catch_all());
  EXPECT_EQ(list[1].id, 10u);
  EXPECT_TRUE(engine.get_policy(10).has_value());
  EXPECT_FALSE(engine.get_policy(11).has_value());
}

/**
 * @test Engine_Policies_Sorted_By_Priority
 * @brief Added policies are matched in ascending priority.
 */
TEST(RoutingEngine, Engine_Policies_Sorted_By_Priority) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  RoutingPolicy p;
  p.id = 77;
  p.name = "Early";
  p.priority = 1;
  ASSERT_TRUE(engine.add_policy(p).has_value());
  const auto list = engine.list_policies();
  EXPECT_EQ(list.front().name, "Early");
  for (std::size_t i = 1; i < list.size(); ++i) EXPECT_LE(list[i - 1].priority, list[i].priority);
}

// --------------------------- Observability & concurrency -------------------

/**
 * @test Engine_Observer_Counters
 * @brief Logging observer counts sticky, failover, denial and no-path decisions.
 */
TEST(RoutingEngine, Engine_Observer_Counters) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  auto observer = sdwan::obs::make_logging_observer();
  engine.attach_observer(observer);

  const auto flow = tcp_flow(44000);
  (void)engine.select_path(flow);               // selected
  (void)engine.select_path(flow);               // sticky
  env.cache->publish(down(PathId{1}));
  (void)engine.select_path(flow);               // failover
  env.cache->publish(down(PathId{2}));
  (void)engine.select_path(tcp_flow(44001));    // no path
  engine.attach_gate(std::make_shared<StaticFlowGate>(FlowVerdict::Deny));
  (void)engine.select_path(tcp_flow(44002));    // denied

  const auto c = observer->snapshot();
  EXPECT_EQ(c.decisions, 5u);
  EXPECT_EQ(c.sticky_hits, 1u);
  EXPECT_EQ(c.failovers, 1u);
  EXPECT_EQ(c.no_path, 1u);
  EXPECT_EQ(c.denials, 1u);
}

/**
 * @test Engine_Concurrent_Same_Flow_Single_Binding
 * @brief Many threads selecting the same flows agree on one path per flow.
 */
TEST(RoutingEngine, Engine_Concurrent_Same_Flow_Single_Binding) {
  TwoPaths env;
  RoutingEngine engine(env.cache);
  constexpr int kThreads = 8;
  constexpr int kFlows = 64;
  std::atomic<int> failures{0};

  std::vector<std::thread> ts;
  for (int t = 0; t < kThreads; ++t) {
    ts.emplace_back([&] {
      for (int i = 0; i < kFlows; ++i) {
        const auto r = engine.select_path(tcp_flow(static_cast<std::uint16_t>(45000 + i)));
        if (!r || *r != PathId{1}) failures.fetch_add(1);
      }
    });
  }
  for (auto& t : ts) t.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(engine.binding_count(), static_cast<std::size_t>(kFlows));
}
