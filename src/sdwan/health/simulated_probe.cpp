/**
 * @file simulated_probe.cpp
 * @brief Synthetic latency/loss generator.
 */
#include "sdwan/health/simulated_probe.hpp"

#include <algorithm>
#include <thread>

namespace sdwan::health {

ProbeOutcome SimulatedProbe::probe_once(const net::IpAddress&, std::chrono::milliseconds timeout) {
    double rtt = 0.0;
    bool lost = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::bernoulli_distribution loss(std::clamp(profile_.loss_probability, 0.0, 1.0));
        lost = loss(rng_);
        if (!lost) {
            const double half = profile_.jitter_span_ms / 2.0;
            std::uniform_real_distribution<double> jitter(-half, half);
            rtt = std::max(0.0, profile_.base_latency_ms + jitter(rng_));
        }
    }
    if (lost) return std::optional<double>{};

    // Beyond the deadline the probe would have been counted as lost.
    const std::chrono::duration<double, std::milli> rtt_d{rtt};
    if (rtt_d > timeout) return std::optional<double>{};

    if (profile_.sleep_for_latency) {
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(rtt_d));
    }
    return std::optional<double>{rtt};
}

} // namespace sdwan::health
