#pragma once
/**
 * @file health_monitor.hpp
 * @brief Periodic path measurement, scoring, caching and persistence.
 *
 * **Ownership**
 * - Shares the Prober and the HealthCache by handle; the cache is read by the
 *   Routing Engine. The store is optional (null => no persistence).
 *
 * **Ordering**
 * - Within a tick every path is checked concurrently; consecutive checks of the
 *   same path are serialized by a per-path mutex.
 *
 * **Failure model**
 * - Probe failures fold into the result. Store failures are logged and skipped.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "sdwan/config/constants.hpp"
#include "sdwan/health/health_cache.hpp"
#include "sdwan/health/health_store.hpp"
#include "sdwan/health/prober.hpp"
#include "sdwan/net/ip_address.hpp"

namespace sdwan::health {

/**
 * @struct HealthConfig
 * @brief Scheduling and persistence knobs. Probe shape lives in ProbeConfig.
 */
struct HealthConfig {
    std::chrono::milliseconds check_interval{config::constants::HEALTH_CHECK_INTERVAL_MS_DEFAULT};
    bool                      persist{config::constants::HEALTH_PERSIST_DEFAULT};
    std::uint32_t             persist_interval{config::constants::HEALTH_PERSIST_INTERVAL_DEFAULT}; ///< Every Nth check per path
    std::uint32_t             history_rows{config::constants::HEALTH_HISTORY_ROWS_DEFAULT};         ///< MemoryHealthStore cap per path (0 = unbounded)

    bool operator==(const HealthConfig&) const = default;
};

/**
 * @enum SessionState
 * @brief Liveness-session states published by an external detector.
 */
enum class SessionState : std::uint8_t {
    AdminDown,
    Down,
    Init,   ///< Negotiating
    Up
};

constexpr std::string_view to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::AdminDown: return "admin_down";
        case SessionState::Down:      return "down";
        case SessionState::Init:      return "init";
        case SessionState::Up:        return "up";
    }
    return "down";
}

/// Aggregate status counts over all registered paths.
struct HealthStats {
    std::size_t total{0};
    std::size_t up{0};
    std::size_t degraded{0};
    std::size_t down{0};
};

/// path_id -> probe target.
using MonitorTargets = std::unordered_map<net::PathId, net::IpAddress>;

/// Invoked after a path's status changes (never with internal locks held).
using StatusChangeFn = std::function<void(net::PathId, net::PathStatus from, net::PathStatus to)>;

/**
 * @class HealthMonitor
 * @brief Owns the authoritative health of every monitored path.
 */
class HealthMonitor {
public:
    HealthMonitor(std::shared_ptr<Prober> prober,
                  std::shared_ptr<HealthCache> cache,
                  std::shared_ptr<HealthStore> store,
                  HealthConfig cfg = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Add a path in the Down/0 "no data" state. False if already known.
    bool register_path(net::PathId id);

    /// Forget a path (cache entry, monitoring target, persistence counter). False if unknown.
    bool deregister_path(net::PathId id);

    /**
     * @brief Probe @p target once, score, cache and (every Nth time) persist.
     * @return The freshly published record. An unregistered path is not probed
     *         and yields PathHealth::unknown(id); nothing is cached or persisted.
     */
    PathHealth check_path_health(net::PathId id, const net::IpAddress& target);

    /**
     * @brief Drive a path's health from a liveness session instead of probes.
     * @details Up => Up/100, Init => Degraded/50, Down/AdminDown => Down/0.
     *          Latency/loss/jitter of the previous record are kept. Ignored
     *          (returns PathHealth::unknown(id)) for unregistered paths.
     */
    PathHealth apply_session_state(net::PathId id, SessionState state);

    /// Persisted snapshots in ascending time order; empty on none or read error.
    [[nodiscard]] std::vector<PathHealth> get_health_history(net::PathId id, Timestamp since, Timestamp until) const;

    [[nodiscard]] std::optional<PathHealth> get_path_health(net::PathId id) const;
    [[nodiscard]] std::vector<PathHealth>   get_all_health() const;
    [[nodiscard]] HealthStats               stats() const;

    /// Install (or clear, with an empty function) the status-transition hook.
    void on_status_change(StatusChangeFn fn);

    /**
     * @brief Start the background loop checking every target once per interval.
     * @return false if already running.
     */
    bool start_monitoring(MonitorTargets targets);

    /// Replace the target table; takes effect at the next tick.
    void update_targets(MonitorTargets targets);

    /// Request stop and join; the in-flight tick completes first. Idempotent.
    void stop_monitoring();

    [[nodiscard]] bool monitoring() const noexcept;

    /// Number of completed monitoring ticks since construction.
    [[nodiscard]] std::uint64_t ticks() const noexcept;

    [[nodiscard]] const HealthConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] std::shared_ptr<const HealthCache> cache() const noexcept { return cache_; }

private:
    void run_loop();
    void run_tick(const MonitorTargets& targets);

    std::shared_ptr<std::mutex> path_lock(net::PathId id);
    bool should_persist(net::PathId id);
    void persist(const PathHealth& h);
    bool publish(const PathHealth& h);  ///< False if the path is not registered

private:
    std::shared_ptr<Prober>      prober_;
    std::shared_ptr<HealthCache> cache_;
    std::shared_ptr<HealthStore> store_;
    HealthConfig                 cfg_;

    // Per-path serialization + persistence counters
    std::mutex                                                   paths_mu_;
    std::unordered_map<net::PathId, std::shared_ptr<std::mutex>> check_locks_;
    std::unordered_map<net::PathId, std::uint32_t>               persist_counts_;

    std::mutex     hook_mu_;
    StatusChangeFn on_change_;

    // Monitoring loop
    mutable std::mutex      loop_mu_;
    std::condition_variable loop_cv_;
    MonitorTargets          targets_;
    bool                    stop_requested_{false};
    std::atomic<bool>          running_{false};
    std::atomic<std::uint64_t> ticks_{0};
    std::thread             worker_;
};

} // namespace sdwan::health
