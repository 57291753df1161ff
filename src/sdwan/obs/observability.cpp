/**
 * @file observability.cpp
 * @brief spdlog-backed Observer.
 */
#include "sdwan/obs/observability.hpp"

#include <mutex>

#include "sdwan/obs/log.hpp"

namespace sdwan::obs {

namespace {

std::string path_label(const std::optional<net::PathId>& p) {
    return p ? p->to_string() : std::string{"none"};
}

class LoggingObserver final : public Observer {
public:
    void record(const DecisionEvent& e) override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.decisions++;
            switch (e.kind) {
                case DecisionKind::Sticky:   ctr_.sticky_hits++; break;
                case DecisionKind::Failover: ctr_.failovers++; break;
                case DecisionKind::Denied:   ctr_.denials++; break;
                case DecisionKind::NoPath:   ctr_.no_path++; break;
                case DecisionKind::Selected: break;
            }
        }
        auto lg = logger();
        if (!lg->should_log(spdlog::level::debug)) return;
        lg->debug(R"({{"flow":"{}","kind":"{}","path":"{}","previous":"{}","policy":"{}","score":{:.3f},"candidates":{}}})",
                  e.flow, to_string(e.kind), path_label(e.selected), path_label(e.previous),
                  e.policy, e.best_score, e.scored.size());
    }

    Counters snapshot() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

private:
    mutable std::mutex mu_;
    Counters ctr_;
};

} // namespace

std::shared_ptr<Observer> make_logging_observer() {
    return std::make_shared<LoggingObserver>();
}

} // namespace sdwan::obs
