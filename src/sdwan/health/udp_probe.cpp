/**
 * @file udp_probe.cpp
 * @brief Connected-UDP reachability probe.
 */
#include "sdwan/health/udp_probe.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>

#include "sdwan/net/socket_util.hpp"
#include "sdwan/obs/log.hpp"

namespace sdwan::health {

using namespace sdwan::config::constants;
using clock_type = std::chrono::steady_clock;

namespace {

/// magic | u64 BE microsecond timestamp | zero padding
std::array<std::uint8_t, PROBE_PAYLOAD_SIZE> build_payload() noexcept {
    std::array<std::uint8_t, PROBE_PAYLOAD_SIZE> buf{};
    constexpr std::size_t magic_len = sizeof(PROBE_MAGIC) - 1;
    std::memcpy(buf.data(), PROBE_MAGIC, magic_len);

    const auto micros = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    for (std::size_t i = 0; i < 8; ++i) {
        buf[magic_len + i] = static_cast<std::uint8_t>(micros >> (56 - 8 * i));
    }
    return buf;
}

std::optional<double> elapsed_ms(clock_type::time_point t0) noexcept {
    const std::chrono::duration<double, std::milli> rtt = clock_type::now() - t0;
    return rtt.count();
}

} // namespace

ProbeOutcome UdpProbe::probe_once(const net::IpAddress& target, std::chrono::milliseconds timeout) {
    const auto dst = net::to_sockaddr_v4(net::SocketAddress{target, port_});
    if (!dst) return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);

    net::UniqueFd fd{::socket(AF_INET, SOCK_DGRAM, 0)};
    if (!fd) return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);

    // connect() so the kernel reports ICMP port-unreachable back as ECONNREFUSED.
    if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&*dst), sizeof(sockaddr_in)) < 0) {
        obs::logger()->debug("udp probe connect {} failed: {}", target.to_string(), std::strerror(errno));
        return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);
    }

    const auto payload = build_payload();
    const auto t0 = clock_type::now();
    if (::send(fd.get(), payload.data(), payload.size(), 0) < 0) {
        if (errno == ECONNREFUSED) return elapsed_ms(t0);
        return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);
    }

    const auto deadline = t0 + timeout;
    std::array<std::uint8_t, PROBE_PAYLOAD_SIZE> buf{};
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now());
        if (left.count() <= 0) return std::optional<double>{};

        const int ready = net::wait_readable(fd.get(), left);
        if (ready == 0) return std::optional<double>{};
        if (ready < 0) return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);

        const ssize_t n = ::recv(fd.get(), buf.data(), buf.size(), 0);
        if (n >= 0) return elapsed_ms(t0);
        if (errno == ECONNREFUSED) return elapsed_ms(t0);
        if (errno == EINTR || errno == EAGAIN) continue;
        return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);
    }
}

} // namespace sdwan::health
