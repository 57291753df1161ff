/**
 * @file health_cache.cpp
 * @brief HealthCache implementation.
 */
#include "sdwan/health/health_cache.hpp"

#include <mutex>

namespace sdwan::health {

bool HealthCache::register_path(net::PathId id) {
    std::unique_lock lk(mu_);
    if (index_.contains(id)) return false;
    index_.emplace(id, entries_.size());
    entries_.push_back(PathHealth::unknown(id));
    return true;
}

bool HealthCache::deregister_path(net::PathId id) {
    std::unique_lock lk(mu_);
    const auto it = index_.find(id);
    if (it == index_.end()) return false;

    const std::size_t slot = it->second;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(slot));
    index_.erase(it);
    for (auto& [pid, pos] : index_) {
        if (pos > slot) --pos;
    }
    return true;
}

std::optional<net::PathStatus> HealthCache::publish(const PathHealth& h) {
    std::unique_lock lk(mu_);
    const auto it = index_.find(h.path_id);
    if (it == index_.end()) return std::nullopt;
    auto& slot = entries_[it->second];
    const auto previous = slot.status;
    slot = h;
    return previous;
}

std::optional<PathHealth> HealthCache::get(net::PathId id) const {
    std::shared_lock lk(mu_);
    const auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second];
}

bool HealthCache::contains(net::PathId id) const {
    std::shared_lock lk(mu_);
    return index_.contains(id);
}

std::vector<PathHealth> HealthCache::snapshot() const {
    std::shared_lock lk(mu_);
    return entries_;
}

std::size_t HealthCache::size() const {
    std::shared_lock lk(mu_);
    return entries_.size();
}

} // namespace sdwan::health
