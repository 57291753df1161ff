#pragma once
/**
 * @file health_store.hpp
 * @brief Persistence collaborator for PathHealth snapshots.
 */

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sdwan/compat/expected.hpp"
#include "sdwan/config/constants.hpp"
#include "sdwan/health/path_health.hpp"

namespace sdwan::health {

/// Persistence failures. Logged and skipped by the Health Monitor.
enum class StoreError : std::uint8_t {
    WriteFailed,
    ReadFailed
};

constexpr std::string_view to_string(StoreError e) noexcept {
    switch (e) {
        case StoreError::WriteFailed: return "write_failed";
        case StoreError::ReadFailed:  return "read_failed";
    }
    return "read_failed";
}

/**
 * @class HealthStore
 * @brief Row store of (path, timestamp, latency, loss, jitter, score, status).
 */
class HealthStore {
public:
    virtual ~HealthStore() = default;

    /// Persist one snapshot.
    virtual sdwan_detail::expected<void, StoreError> append(const PathHealth& row) = 0;

    /**
     * @brief Snapshots of @p id with since <= last_checked <= until, oldest first.
     * @return Empty vector when nothing matches.
     */
    virtual sdwan_detail::expected<std::vector<PathHealth>, StoreError>
    history(net::PathId id, Timestamp since, Timestamp until) const = 0;
};

/**
 * @class MemoryHealthStore
 * @brief In-process store; rows kept sorted by timestamp per path.
 * @details At most @c max_rows_per_path rows are kept per path; the oldest
 *          rows are dropped first. 0 disables the cap.
 */
class MemoryHealthStore final : public HealthStore {
public:
    explicit MemoryHealthStore(std::size_t max_rows_per_path = config::constants::HEALTH_HISTORY_ROWS_DEFAULT)
        : max_rows_(max_rows_per_path) {}

    sdwan_detail::expected<void, StoreError> append(const PathHealth& row) override;

    sdwan_detail::expected<std::vector<PathHealth>, StoreError>
    history(net::PathId id, Timestamp since, Timestamp until) const override;

    /// Total rows across all paths.
    [[nodiscard]] std::size_t size() const;

private:
    std::size_t                                                max_rows_;
    mutable std::mutex                                         mu_;
    std::unordered_map<net::PathId, std::vector<PathHealth>>   rows_;
};

} // namespace sdwan::health
