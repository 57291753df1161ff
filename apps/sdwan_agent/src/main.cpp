/**
 * @file main.cpp
 * @brief sdwan_agent: wires the measurement, routing and forwarding planes.
 *
 * **Bootstrap**
 * - Load config (JSON file); set log level.
 * - Construct Prober, HealthCache, HealthMonitor (in-memory store), RoutingEngine, DataPlane.
 *
 * **Topology**
 * - Paths are given on the command line as `--path ID,PROBE_IP,REMOTE_IP:PORT[,SITE]`.
 *   Each becomes a monitored path and a tunnel endpoint.
 *
 * **Failover**
 * - A path status transition re-evaluates every bound flow and republishes the
 *   destination routes into the DataPlane.
 *
 * **Lifecycle**
 * - Runs until SIGINT/SIGTERM, logging counters periodically, then stops the
 *   monitoring and receive loops cleanly.
 */

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "sdwan/config/config_loader.hpp"
#include "sdwan/dataplane/data_plane.hpp"
#include "sdwan/health/health_monitor.hpp"
#include "sdwan/health/health_store.hpp"
#include "sdwan/health/prober.hpp"
#include "sdwan/obs/log.hpp"
#include "sdwan/obs/observability.hpp"
#include "sdwan/routing/routing_engine.hpp"
#include "sdwan/version.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

constexpr auto STATS_PERIOD = std::chrono::seconds(30);
constexpr auto FLOW_IDLE_LIMIT = std::chrono::minutes(10);

struct PathSpec {
    sdwan::net::PathId        id;
    sdwan::net::IpAddress     probe_target;
    sdwan::net::SocketAddress remote;
    sdwan::net::SiteId        site;
};

/// ID,PROBE_IP,REMOTE_IP:PORT[,SITE]
std::optional<PathSpec> parse_path_spec(std::string_view s) {
    std::vector<std::string_view> parts;
    while (true) {
        const auto comma = s.find(',');
        parts.push_back(s.substr(0, comma));
        if (comma == std::string_view::npos) break;
        s.remove_prefix(comma + 1);
    }
    if (parts.size() < 3 || parts.size() > 4) return std::nullopt;

    std::uint64_t id = 0;
    const auto [ptr, ec] = std::from_chars(parts[0].data(), parts[0].data() + parts[0].size(), id);
    if (ec != std::errc{} || ptr != parts[0].data() + parts[0].size()) return std::nullopt;

    const auto probe = sdwan::net::IpAddress::parse(parts[1]);
    const auto remote = sdwan::net::SocketAddress::parse(parts[2]);
    if (!probe || !remote) return std::nullopt;

    PathSpec spec{sdwan::net::PathId{id}, *probe, *remote, parts.size() == 4 ? std::string(parts[3]) : "remote"};
    return spec;
}

int usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-c CONFIG] --path ID,PROBE_IP,REMOTE_IP:PORT[,SITE] ...\n";
    return 2;
}

/// Publish destination -> path for every bound flow.
void sync_routes(const sdwan::routing::RoutingEngine& engine, sdwan::dataplane::DataPlane& dp) {
    for (const auto& b : engine.bindings()) dp.add_route(b.flow.dst_ip, b.path);
}

} // namespace

int main(int argc, char** argv) {
    using namespace sdwan;

    std::string config_path;
    std::vector<PathSpec> paths;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--path" && i + 1 < argc) {
            auto spec = parse_path_spec(argv[++i]);
            if (!spec) {
                std::cerr << "invalid path spec: " << argv[i] << "\n";
                return usage(argv[0]);
            }
            paths.push_back(std::move(*spec));
        } else {
            return usage(argv[0]);
        }
    }

    auto cfg = config::Loader::load_from_file(config_path);
    if (!cfg) {
        std::cerr << "config error: " << config::to_string(cfg.error()) << "\n";
        return 1;
    }
    obs::set_level(cfg->log_level);
    auto log = obs::logger();
    log->info("sdwan_agent {} starting ({} path(s))", version_string, paths.size());

    // Measurement plane
    auto prober = std::make_shared<health::Prober>(cfg->probe);
    auto cache  = std::make_shared<health::HealthCache>();
    auto store  = std::make_shared<health::MemoryHealthStore>(cfg->health.history_rows);
    health::HealthMonitor monitor(prober, cache, store, cfg->health);

    // Routing plane
    routing::RoutingEngine engine(cache);
    auto observer = obs::make_logging_observer();
    engine.attach_observer(observer);

    // Forwarding plane
    auto dp = dataplane::DataPlane::create(cfg->dataplane);
    if (!dp) {
        log->error("dataplane: cannot bind {} ({})", cfg->dataplane.bind.to_string(),
                   dataplane::to_string(dp.error()));
        return 1;
    }
    auto& plane = **dp;
    plane.on_receive([log](std::span<const std::uint8_t> payload, const net::SocketAddress& from) {
        log->debug("dataplane: {} byte(s) decapsulated from {}", payload.size(), from.to_string());
    });

    health::MonitorTargets targets;
    for (const auto& p : paths) {
        monitor.register_path(p.id);
        targets.emplace(p.id, p.probe_target);
        plane.add_tunnel(dataplane::TunnelEndpoint{p.site, p.id, p.remote, cfg->dataplane.compression.enabled});
    }

    monitor.on_status_change([&engine, &plane, log](net::PathId id, net::PathStatus from, net::PathStatus to) {
        log->info("failover check: {} {} -> {}", id.to_string(), net::to_string(from), net::to_string(to));
        (void)engine.reevaluate_all_flows();
        sync_routes(engine, plane);
    });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    plane.start();
    monitor.start_monitoring(std::move(targets));

    auto next_report = std::chrono::steady_clock::now() + STATS_PERIOD;
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() < next_report) continue;
        next_report += STATS_PERIOD;

        (void)engine.evict_idle_flows(FLOW_IDLE_LIMIT);
        const auto hs = monitor.stats();
        const auto ds = plane.stats();
        const auto rc = observer->snapshot();
        log->info("paths: {} up / {} degraded / {} down; flows: {}; decisions: {} (failovers {})",
                  hs.up, hs.degraded, hs.down, engine.binding_count(), rc.decisions, rc.failovers);
        log->info("dataplane: fwd {} pkts / {} B, dropped {}, rx {} pkts / {} B, rx errors {}, compression {:.1f}% saved",
                  ds.packets_forwarded, ds.bytes_forwarded, ds.packets_dropped, ds.packets_received,
                  ds.bytes_received, ds.rx_errors, plane.compression_stats().saved_pct());
    }

    log->info("sdwan_agent stopping");
    monitor.stop_monitoring();
    plane.stop();
    return 0;
}
