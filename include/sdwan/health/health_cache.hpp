#pragma once
/**
 * @file health_cache.hpp
 * @brief Shared PathHealth table, guarded by one reader/writer lock.
 * @details Written by the Health Monitor, read by the Routing Engine and the
 *          admin surface. Iteration order is registration order, which the
 *          Routing Engine uses as its deterministic tie-breaker.
 */

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "sdwan/health/path_health.hpp"

namespace sdwan::health {

/**
 * @class HealthCache
 * @brief Thread-safe map PathId -> PathHealth with stable insertion order.
 */
class HealthCache final {
public:
    /// Add a path in the "no data" state. Returns false if already present.
    bool register_path(net::PathId id);

    /// Remove a path. Returns false if it was not present.
    bool deregister_path(net::PathId id);

    /**
     * @brief Overwrite the record for h.path_id.
     * @return Status held before the update, or std::nullopt if the path is not
     *         registered (nothing is stored).
     */
    std::optional<net::PathStatus> publish(const PathHealth& h);

    [[nodiscard]] std::optional<PathHealth> get(net::PathId id) const;
    [[nodiscard]] bool contains(net::PathId id) const;

    /// Copy of all records, in registration order.
    [[nodiscard]] std::vector<PathHealth> snapshot() const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex                      mu_;
    std::vector<PathHealth>                        entries_;  ///< Registration order
    std::unordered_map<net::PathId, std::size_t>   index_;    ///< PathId -> entries_ slot
};

} // namespace sdwan::health
