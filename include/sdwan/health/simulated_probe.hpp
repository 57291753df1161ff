#pragma once
/**
 * @file simulated_probe.hpp
 * @brief Synthetic probe backend for hosts without network reachability.
 */

#include <cstdint>
#include <mutex>
#include <random>

#include "sdwan/config/constants.hpp"
#include "sdwan/health/probe_backend.hpp"

namespace sdwan::health {

/**
 * @struct SimulatedProfile
 * @brief Shape of the synthetic measurements.
 */
struct SimulatedProfile {
    double base_latency_ms{config::constants::SIM_BASE_LATENCY_MS};  ///< Mean RTT
    double jitter_span_ms{config::constants::SIM_JITTER_SPAN_MS};    ///< Uniform span centred on the mean
    double loss_probability{config::constants::SIM_LOSS_PROBABILITY}; ///< Per-probe loss [0,1]
    bool   sleep_for_latency{true};  ///< Block for the synthetic RTT, like a real probe would
};

/**
 * @class SimulatedProbe
 * @brief Never errors: returns baseline +/- jitter, or a lost probe.
 */
class SimulatedProbe final : public ProbeBackend {
public:
    explicit SimulatedProbe(SimulatedProfile profile = {},
                            std::uint64_t seed = std::random_device{}()) noexcept
        : profile_(profile), rng_(seed) {}

    ProbeStrategy strategy() const noexcept override { return ProbeStrategy::Simulated; }

    ProbeOutcome probe_once(const net::IpAddress& target,
                            std::chrono::milliseconds timeout) override;

private:
    SimulatedProfile profile_;
    std::mutex       mu_;   ///< Guards rng_
    std::mt19937_64  rng_;
};

} // namespace sdwan::health
