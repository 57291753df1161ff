/**
 * @file health_store.cpp
 * @brief MemoryHealthStore implementation.
 */
#include "sdwan/health/health_store.hpp"

#include <algorithm>

namespace sdwan::health {

namespace {
constexpr auto by_time = [](const PathHealth& a, const PathHealth& b) {
    return a.last_checked < b.last_checked;
};
} // namespace

sdwan_detail::expected<void, StoreError> MemoryHealthStore::append(const PathHealth& row) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& rows = rows_[row.path_id];
    // upper_bound keeps equal timestamps in arrival order
    rows.insert(std::upper_bound(rows.begin(), rows.end(), row, by_time), row);
    if (max_rows_ != 0 && rows.size() > max_rows_) {
        rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(rows.size() - max_rows_));
    }
    return {};
}

sdwan_detail::expected<std::vector<PathHealth>, StoreError>
MemoryHealthStore::history(net::PathId id, Timestamp since, Timestamp until) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<PathHealth> out;
    const auto it = rows_.find(id);
    if (it == rows_.end() || since > until) return out;

    const auto& rows = it->second;
    PathHealth lo; lo.last_checked = since;
    PathHealth hi; hi.last_checked = until;
    out.assign(std::lower_bound(rows.begin(), rows.end(), lo, by_time),
               std::upper_bound(rows.begin(), rows.end(), hi, by_time));
    return out;
}

std::size_t MemoryHealthStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (const auto& [id, rows] : rows_) n += rows.size();
    return n;
}

} // namespace sdwan::health
