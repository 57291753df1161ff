// apps/path_probe/src/main.cpp
// sdwan: path_probe
// Purpose: one-shot measurement of a single target (latency, loss, jitter) using
// the same Prober and fallback chain as the agent.
//
// Usage:
//   ./path_probe <target_ip> [count] [icmp|udp|simulated] [timeout_ms]
//
// Notes:
// - Without CAP_NET_RAW the icmp strategy downgrades to udp automatically.
// - Exit code 0 if at least one probe got an answer, 1 if all were lost, 2 on usage errors.

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

#include "sdwan/health/prober.hpp"
#include "sdwan/net/ip_address.hpp"
#include "sdwan/obs/log.hpp"
#include "sdwan/version.hpp"

namespace {

bool parse_u32(std::string_view s, std::uint32_t& out) {
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

int usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <target_ip> [count] [icmp|udp|simulated] [timeout_ms]\n";
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) return usage(argv[0]);

    const auto target = sdwan::net::IpAddress::parse(argv[1]);
    if (!target) {
        std::cerr << "invalid target address: " << argv[1] << "\n";
        return usage(argv[0]);
    }

    sdwan::health::ProbeConfig cfg;
    if (argc > 2 && (!parse_u32(argv[2], cfg.count) || cfg.count == 0)) return usage(argv[0]);
    if (argc > 3) {
        const auto s = sdwan::health::probe_strategy_from_string(argv[3]);
        if (!s) return usage(argv[0]);
        cfg.strategy = *s;
    }
    if (argc > 4) {
        std::uint32_t ms = 0;
        if (!parse_u32(argv[4], ms) || ms == 0) return usage(argv[0]);
        cfg.timeout = std::chrono::milliseconds(ms);
    }

    sdwan::obs::set_level("warn");

    std::cout << "sdwan path_probe " << sdwan::version_string << "\n"
              << "Target: " << target->to_string() << ", count: " << cfg.count
              << ", requested: " << sdwan::health::to_string(cfg.strategy) << std::endl;

    sdwan::health::Prober prober(cfg);
    const auto r = prober.probe(*target);

    std::cout << "strategy:  " << sdwan::health::to_string(prober.active_strategy()) << "\n"
              << "sent:      " << r.probes_sent << "\n"
              << "received:  " << r.probes_received << "\n"
              << "latency:   " << r.latency_ms << " ms\n"
              << "loss:      " << r.packet_loss_pct << " %\n"
              << "jitter:    " << r.jitter_ms << " ms" << std::endl;

    return r.all_lost() ? 1 : 0;
}
