/**
 * @file prober.cpp
 * @brief Prober round loop, statistics and strategy fallback.
 */
#include "sdwan/health/prober.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <thread>
#include <vector>

#include "sdwan/health/icmp_probe.hpp"
#include "sdwan/health/simulated_probe.hpp"
#include "sdwan/health/udp_probe.hpp"
#include "sdwan/obs/log.hpp"

namespace sdwan::health {

ProbeResult ProbeResult::from_samples(std::span<const double> rtts_ms, std::uint32_t sent) noexcept {
    ProbeResult r;
    r.probes_sent = sent;
    r.probes_received = static_cast<std::uint32_t>(rtts_ms.size());
    if (sent == 0) return r;

    r.packet_loss_pct = static_cast<double>(sent - r.probes_received) / static_cast<double>(sent) * 100.0;

    if (rtts_ms.empty()) {
        r.latency_ms = std::numeric_limits<double>::infinity();
        r.jitter_ms = 0.0;
        return r;
    }

    const double n = static_cast<double>(rtts_ms.size());
    const double mean = std::accumulate(rtts_ms.begin(), rtts_ms.end(), 0.0) / n;
    r.latency_ms = mean;

    if (rtts_ms.size() >= 2) {
        double sq = 0.0;
        for (double v : rtts_ms) sq += (v - mean) * (v - mean);
        r.jitter_ms = std::sqrt(sq / (n - 1.0));
    }
    return r;
}

static ProbeBackends make_default_backends(const ProbeConfig& cfg) {
    ProbeBackends b;
    if (cfg.strategy == ProbeStrategy::Icmp) {
        auto icmp = IcmpProbe::open();
        if (icmp) {
            b.echo = std::move(*icmp);
        } else {
            obs::logger()->warn("icmp probing not permitted ({}), using udp", to_string(icmp.error()));
        }
    }
    if (cfg.strategy != ProbeStrategy::Simulated) {
        b.datagram = std::make_unique<UdpProbe>(cfg.udp_port);
    }
    b.simulated = std::make_unique<SimulatedProbe>();
    return b;
}

Prober::Prober(ProbeConfig cfg)
    : Prober(cfg, make_default_backends(cfg)) {}

Prober::Prober(ProbeConfig cfg, ProbeBackends backends)
    : cfg_(cfg), backends_(std::move(backends)) {
    if (!backends_.simulated) backends_.simulated = std::make_unique<SimulatedProbe>();
    if (cfg_.count == 0) cfg_.count = 1;
    active_.store(settle(cfg_.strategy), std::memory_order_release);
    obs::logger()->debug("prober ready: requested={} active={}",
                         to_string(cfg_.strategy), to_string(active_strategy()));
}

ProbeBackend* Prober::backend_for(ProbeStrategy s) const noexcept {
    switch (s) {
        case ProbeStrategy::Icmp:      return backends_.echo.get();
        case ProbeStrategy::Udp:       return backends_.datagram.get();
        case ProbeStrategy::Simulated: return backends_.simulated.get();
    }
    return backends_.simulated.get();
}

ProbeStrategy Prober::settle(ProbeStrategy s) const noexcept {
    while (s != ProbeStrategy::Simulated && backend_for(s) == nullptr) s = next_strategy(s);
    return s;
}

ProbeStrategy Prober::downgrade(ProbeStrategy from, ProbeBackendError why) noexcept {
    const ProbeStrategy to = settle(next_strategy(from));
    ProbeStrategy expected = from;
    if (active_.compare_exchange_strong(expected, to, std::memory_order_acq_rel)) {
        obs::logger()->warn("probe strategy {} failed ({}), downgrading to {}",
                            to_string(from), to_string(why), to_string(to));
        return to;
    }
    // Another caller already moved the chain on; follow it.
    return expected;
}

std::optional<double> Prober::probe_one(const net::IpAddress& target) {
    ProbeStrategy s = active_strategy();
    for (;;) {
        auto out = backend_for(s)->probe_once(target, cfg_.timeout);
        if (out) return *out;
        if (s == ProbeStrategy::Simulated) return std::nullopt;
        s = downgrade(s, out.error());
    }
}

ProbeResult Prober::probe(const net::IpAddress& target) {
    return probe(target, cfg_.count);
}

ProbeResult Prober::probe(const net::IpAddress& target, std::uint32_t count) {
    if (count == 0) count = 1;

    std::vector<double> rtts;
    rtts.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        if (auto rtt = probe_one(target)) {
            rtts.push_back(*rtt);
            obs::logger()->trace("probe {} seq={} rtt={:.3f}ms", target.to_string(), i, *rtt);
        } else {
            obs::logger()->trace("probe {} seq={} lost", target.to_string(), i);
        }
        if (i + 1 < count && cfg_.interval.count() > 0) std::this_thread::sleep_for(cfg_.interval);
    }

    auto r = ProbeResult::from_samples(rtts, count);
    obs::logger()->debug("probe round {} via {}: latency={:.2f}ms loss={:.1f}% jitter={:.2f}ms ({}/{})",
                         target.to_string(), to_string(active_strategy()), r.latency_ms,
                         r.packet_loss_pct, r.jitter_ms, r.probes_received, r.probes_sent);
    return r;
}

} // namespace sdwan::health
