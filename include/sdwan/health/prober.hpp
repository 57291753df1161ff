#pragma once
/**
 * @file prober.hpp
 * @brief Multi-strategy round-trip prober with automatic capability fallback.
 * @details Strategy chain: Icmp -> Udp -> Simulated. The chain is evaluated once
 *          at construction and again whenever a backend reports an error; a
 *          downgrade is permanent for the lifetime of the Prober. The active
 *          strategy is the only state shared across concurrent probe() calls.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>

#include "sdwan/config/constants.hpp"
#include "sdwan/health/probe_backend.hpp"

namespace sdwan::health {

/**
 * @struct ProbeConfig
 * @brief Parameters of one measurement round.
 */
struct ProbeConfig {
    std::uint32_t             count{config::constants::PROBE_COUNT_DEFAULT};   ///< Probes per round (>= 1)
    std::chrono::milliseconds timeout{config::constants::PROBE_TIMEOUT_MS_DEFAULT};
    std::chrono::milliseconds interval{config::constants::PROBE_INTERVAL_MS_DEFAULT}; ///< Gap between probes
    ProbeStrategy             strategy{ProbeStrategy::Icmp};                  ///< Requested starting strategy
    std::uint16_t             udp_port{config::constants::PROBE_UDP_PORT_DEFAULT};

    bool operator==(const ProbeConfig&) const = default;
};

/**
 * @struct ProbeResult
 * @brief Aggregate of one measurement round. Immutable once built.
 */
struct ProbeResult {
    double        latency_ms{0.0};       ///< Mean RTT of replies; +inf if none
    double        packet_loss_pct{0.0};  ///< (sent - received) / sent * 100
    double        jitter_ms{0.0};        ///< Sample stddev of RTTs; 0 with < 2 replies
    std::uint32_t probes_sent{0};
    std::uint32_t probes_received{0};

    /// Build a result from the RTTs of the probes that got an answer.
    static ProbeResult from_samples(std::span<const double> rtts_ms, std::uint32_t sent) noexcept;

    [[nodiscard]] bool all_lost() const noexcept { return probes_received == 0; }
};

/**
 * @struct ProbeBackends
 * @brief One backend per strategy level. A null slot is skipped; Simulated is
 *        always filled in by the Prober when missing.
 */
struct ProbeBackends {
    std::unique_ptr<ProbeBackend> echo;       ///< Icmp level
    std::unique_ptr<ProbeBackend> datagram;   ///< Udp level
    std::unique_ptr<ProbeBackend> simulated;  ///< Simulated level
};

/**
 * @class Prober
 * @brief Produces a ProbeResult per call; thread-safe.
 */
class Prober {
public:
    /// Build the real backends; Icmp is opened only if requested and permitted.
    explicit Prober(ProbeConfig cfg);

    /// Use caller-supplied backends (tests, embedding).
    Prober(ProbeConfig cfg, ProbeBackends backends);

    Prober(const Prober&) = delete;
    Prober& operator=(const Prober&) = delete;

    /// Run one round with the configured probe count.
    ProbeResult probe(const net::IpAddress& target);

    /**
     * @brief Run one round of @p count probes (count 0 is treated as 1).
     * @details Never fails: if every probe is lost the result carries
     *          latency +inf, loss 100 and jitter 0.
     */
    ProbeResult probe(const net::IpAddress& target, std::uint32_t count);

    /// Strategy currently in use.
    [[nodiscard]] ProbeStrategy active_strategy() const noexcept {
        return active_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ProbeConfig& config() const noexcept { return cfg_; }

private:
    ProbeBackend* backend_for(ProbeStrategy s) const noexcept;

    /// First strategy at or after @p s that has a backend.
    ProbeStrategy settle(ProbeStrategy s) const noexcept;

    /// Move from @p from to the next usable strategy; logs once per transition.
    ProbeStrategy downgrade(ProbeStrategy from, ProbeBackendError why) noexcept;

    /// One probe, walking the chain until a backend answers without error.
    std::optional<double> probe_one(const net::IpAddress& target);

private:
    ProbeConfig                cfg_;
    ProbeBackends              backends_;
    std::atomic<ProbeStrategy> active_{ProbeStrategy::Simulated};
};

} // namespace sdwan::health
