/**
 * @file health_monitor.cpp
 * @brief HealthMonitor: checks, session mapping, persistence and the tick loop.
 */
#include "sdwan/health/health_monitor.hpp"

#include <future>
#include <utility>

#include "sdwan/health/scoring.hpp"
#include "sdwan/obs/log.hpp"

namespace sdwan::health {

using namespace sdwan::config::constants;

HealthMonitor::HealthMonitor(std::shared_ptr<Prober> prober,
                             std::shared_ptr<HealthCache> cache,
                             std::shared_ptr<HealthStore> store,
                             HealthConfig cfg)
    : prober_(std::move(prober)),
      cache_(cache ? std::move(cache) : std::make_shared<HealthCache>()),
      store_(std::move(store)),
      cfg_(cfg) {
    if (cfg_.persist_interval == 0) cfg_.persist_interval = 1;
}

HealthMonitor::~HealthMonitor() {
    stop_monitoring();
}

bool HealthMonitor::register_path(net::PathId id) {
    const bool added = cache_->register_path(id);
    if (added) obs::logger()->info("health: registered {}", id.to_string());
    return added;
}

bool HealthMonitor::deregister_path(net::PathId id) {
    {
        std::lock_guard<std::mutex> lk(loop_mu_);
        targets_.erase(id);
    }
    {
        std::lock_guard<std::mutex> lk(paths_mu_);
        persist_counts_.erase(id);
        check_locks_.erase(id);
    }
    const bool removed = cache_->deregister_path(id);
    if (removed) obs::logger()->info("health: deregistered {}", id.to_string());
    return removed;
}

std::shared_ptr<std::mutex> HealthMonitor::path_lock(net::PathId id) {
    std::lock_guard<std::mutex> lk(paths_mu_);
    auto& slot = check_locks_[id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

bool HealthMonitor::should_persist(net::PathId id) {
    if (!cfg_.persist || !store_) return false;
    std::lock_guard<std::mutex> lk(paths_mu_);
    auto& n = persist_counts_[id];
    if (++n < cfg_.persist_interval) return false;
    n = 0;
    return true;
}

void HealthMonitor::persist(const PathHealth& h) {
    if (auto r = store_->append(h); !r) {
        obs::logger()->warn("health: persisting {} failed ({}), skipped",
                            h.path_id.to_string(), to_string(r.error()));
    }
}

bool HealthMonitor::publish(const PathHealth& h) {
    const auto previous = cache_->publish(h);
    if (!previous) {
        obs::logger()->debug("health: {} is not registered, result dropped", h.path_id.to_string());
        return false;
    }
    if (*previous == h.status) return true;

    obs::logger()->info("health: {} {} -> {} (score {:.1f})", h.path_id.to_string(),
                        net::to_string(*previous), net::to_string(h.status), h.health_score);

    StatusChangeFn fn;
    {
        std::lock_guard<std::mutex> lk(hook_mu_);
        fn = on_change_;
    }
    if (fn) fn(h.path_id, *previous, h.status);
    return true;
}

PathHealth HealthMonitor::check_path_health(net::PathId id, const net::IpAddress& target) {
    if (!cache_->contains(id)) {
        obs::logger()->debug("health: check of unregistered {} skipped", id.to_string());
        return PathHealth::unknown(id);
    }
    const auto lock = path_lock(id);
    std::lock_guard<std::mutex> serial(*lock);

    const ProbeResult r = prober_->probe(target);
    const PathHealth h = HealthScorer::from_probe(id, r, SystemClock::now());

    obs::logger()->debug("health: {} latency={:.2f}ms loss={:.1f}% jitter={:.2f}ms score={:.1f} {}",
                         id.to_string(), h.latency_ms, h.packet_loss_pct, h.jitter_ms,
                         h.health_score, net::to_string(h.status));

    // Deregistered while the probe was in flight => nothing to publish or persist.
    if (publish(h) && should_persist(id)) persist(h);
    return h;
}

PathHealth HealthMonitor::apply_session_state(net::PathId id, SessionState state) {
    if (!cache_->contains(id)) {
        obs::logger()->debug("health: session {} for unregistered {} ignored", to_string(state), id.to_string());
        return PathHealth::unknown(id);
    }
    const auto lock = path_lock(id);
    std::lock_guard<std::mutex> serial(*lock);

    const auto current = cache_->get(id);
    if (!current) return PathHealth::unknown(id);
    // Probe metrics and the measured flag carry over; only score and status change.
    PathHealth h = *current;
    switch (state) {
        case SessionState::Up:
            h.health_score = SESSION_UP_SCORE;
            h.status = net::PathStatus::Up;
            break;
        case SessionState::Init:
            h.health_score = SESSION_INIT_SCORE;
            h.status = net::PathStatus::Degraded;
            break;
        case SessionState::Down:
        case SessionState::AdminDown:
            h.health_score = SESSION_DOWN_SCORE;
            h.status = net::PathStatus::Down;
            break;
    }
    h.last_checked = SystemClock::now();

    obs::logger()->debug("health: {} session {} => {}", id.to_string(), to_string(state), net::to_string(h.status));
    (void)publish(h);
    return h;
}

std::vector<PathHealth> HealthMonitor::get_health_history(net::PathId id, Timestamp since, Timestamp until) const {
    if (!store_) return {};
    auto rows = store_->history(id, since, until);
    if (!rows) {
        obs::logger()->warn("health: history read for {} failed ({})", id.to_string(), to_string(rows.error()));
        return {};
    }
    return std::move(*rows);
}

std::optional<PathHealth> HealthMonitor::get_path_health(net::PathId id) const {
    return cache_->get(id);
}

std::vector<PathHealth> HealthMonitor::get_all_health() const {
    return cache_->snapshot();
}

HealthStats HealthMonitor::stats() const {
    HealthStats s;
    for (const auto& h : cache_->snapshot()) {
        ++s.total;
        switch (h.status) {
            case net::PathStatus::Up:       ++s.up; break;
            case net::PathStatus::Degraded: ++s.degraded; break;
            case net::PathStatus::Down:     ++s.down; break;
        }
    }
    return s;
}

void HealthMonitor::on_status_change(StatusChangeFn fn) {
    std::lock_guard<std::mutex> lk(hook_mu_);
    on_change_ = std::move(fn);
}

// ------------------------------ Monitoring loop ------------------------------

bool HealthMonitor::start_monitoring(MonitorTargets targets) {
    std::lock_guard<std::mutex> lk(loop_mu_);
    if (running_.load()) return false;
    targets_ = std::move(targets);
    for (const auto& [id, ip] : targets_) cache_->register_path(id);
    stop_requested_ = false;
    running_.store(true);
    worker_ = std::thread(&HealthMonitor::run_loop, this);
    obs::logger()->info("health: monitoring {} path(s) every {}ms",
                        targets_.size(), cfg_.check_interval.count());
    return true;
}

void HealthMonitor::update_targets(MonitorTargets targets) {
    for (const auto& [id, ip] : targets) cache_->register_path(id);
    std::lock_guard<std::mutex> lk(loop_mu_);
    targets_ = std::move(targets);
}

void HealthMonitor::stop_monitoring() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(loop_mu_);
        if (!running_.load()) return;
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    loop_cv_.notify_all();
    if (!worker.joinable()) return;
    worker.join();
    running_.store(false);
    obs::logger()->info("health: monitoring stopped after {} tick(s)", ticks_.load());
}

bool HealthMonitor::monitoring() const noexcept {
    return running_.load();
}

std::uint64_t HealthMonitor::ticks() const noexcept {
    return ticks_.load();
}

void HealthMonitor::run_tick(const MonitorTargets& targets) {
    std::vector<std::future<void>> inflight;
    inflight.reserve(targets.size());
    for (const auto& [id, ip] : targets) {
        inflight.push_back(std::async(std::launch::async, [this, id = id, ip = ip] {
            (void)check_path_health(id, ip);
        }));
    }
    // Next tick waits for the slowest path.
    for (auto& f : inflight) f.get();
}

void HealthMonitor::run_loop() {
    using clock = std::chrono::steady_clock;
    for (;;) {
        MonitorTargets snapshot;
        {
            std::lock_guard<std::mutex> lk(loop_mu_);
            if (stop_requested_) break;
            snapshot = targets_;
        }

        const auto tick_start = clock::now();
        run_tick(snapshot);
        ticks_.fetch_add(1);

        std::unique_lock<std::mutex> lk(loop_mu_);
        loop_cv_.wait_until(lk, tick_start + cfg_.check_interval, [this] { return stop_requested_; });
        if (stop_requested_) break;
    }
}

} // namespace sdwan::health
