#pragma once
/**
 * @file udp_probe.hpp
 * @brief Unprivileged datagram probe backend (IPv4).
 */

#include <cstdint>

#include "sdwan/config/constants.hpp"
#include "sdwan/health/probe_backend.hpp"

namespace sdwan::health {

/**
 * @class UdpProbe
 * @brief Sends a tagged datagram to a (normally closed) port and times the answer.
 *
 * Either an echoed datagram or a connection-refused error (ICMP port
 * unreachable) proves the host answered and counts as a reply. A timeout is a
 * lost probe; any other socket error is reported as Transport.
 */
class UdpProbe final : public ProbeBackend {
public:
    explicit UdpProbe(std::uint16_t port = config::constants::PROBE_UDP_PORT_DEFAULT) noexcept
        : port_(port) {}

    ProbeStrategy strategy() const noexcept override { return ProbeStrategy::Udp; }

    ProbeOutcome probe_once(const net::IpAddress& target,
                            std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
    std::uint16_t port_;
};

} // namespace sdwan::health
