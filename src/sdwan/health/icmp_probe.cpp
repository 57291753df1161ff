/**
 * @file icmp_probe.cpp
 * @brief Raw-socket ICMP echo probe.
 */
#include "sdwan/health/icmp_probe.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>
#include <unistd.h>

#include "sdwan/config/constants.hpp"
#include "sdwan/net/socket_util.hpp"
#include "sdwan/obs/log.hpp"

namespace sdwan::health {

using namespace sdwan::config::constants;
using clock_type = std::chrono::steady_clock;

namespace {

constexpr std::uint8_t ICMP_ECHO_REQUEST = 8;
constexpr std::uint8_t ICMP_ECHO_REPLY   = 0;
constexpr std::size_t  ICMP_HEADER_SIZE  = 8;

ProbeBackendError classify_socket_errno(int err) noexcept {
    if (err == EPERM || err == EACCES) return ProbeBackendError::PermissionDenied;
    if (err == EAFNOSUPPORT || err == EPROTONOSUPPORT || err == ESOCKTNOSUPPORT) {
        return ProbeBackendError::Unavailable;
    }
    return ProbeBackendError::Transport;
}

} // namespace

sdwan_detail::expected<std::unique_ptr<IcmpProbe>, ProbeBackendError> IcmpProbe::open() {
    net::UniqueFd fd{::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP)};
    if (!fd) {
        const auto err = classify_socket_errno(errno);
        obs::logger()->debug("icmp probe unavailable: {} ({})", to_string(err), std::strerror(errno));
        return sdwan_detail::unexpected<ProbeBackendError>(err);
    }
    const auto ident = static_cast<std::uint16_t>(::getpid() & 0xFFFF);
    return std::unique_ptr<IcmpProbe>(new IcmpProbe(ident));
}

ProbeOutcome IcmpProbe::probe_once(const net::IpAddress& target, std::chrono::milliseconds timeout) {
    if (!target.is_v4()) return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);

    net::UniqueFd fd{::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP)};
    if (!fd) return sdwan_detail::unexpected<ProbeBackendError>(classify_socket_errno(errno));

    const std::uint16_t seq = seq_.fetch_add(1, std::memory_order_relaxed);

    // type | code | checksum | ident | seq | payload
    std::array<std::uint8_t, PROBE_PAYLOAD_SIZE> pkt{};
    pkt[0] = ICMP_ECHO_REQUEST;
    pkt[1] = 0;
    const std::uint16_t id_be  = htons(ident_);
    const std::uint16_t seq_be = htons(seq);
    std::memcpy(&pkt[4], &id_be, 2);
    std::memcpy(&pkt[6], &seq_be, 2);
    for (std::size_t i = ICMP_HEADER_SIZE; i < pkt.size(); ++i) pkt[i] = static_cast<std::uint8_t>(i);
    const std::uint16_t ck = net::csum16(pkt.data(), pkt.size());
    std::memcpy(&pkt[2], &ck, 2);

    const auto dst = net::to_sockaddr_v4(net::SocketAddress{target, 0});
    const auto t0 = clock_type::now();
    if (::sendto(fd.get(), pkt.data(), pkt.size(), 0,
                 reinterpret_cast<const sockaddr*>(&*dst), sizeof(sockaddr_in)) < 0) {
        return sdwan_detail::unexpected<ProbeBackendError>(classify_socket_errno(errno));
    }

    const auto deadline = t0 + timeout;
    std::array<std::uint8_t, 1500> buf{};
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now());
        if (left.count() <= 0) return std::optional<double>{};

        const int ready = net::wait_readable(fd.get(), left);
        if (ready == 0) return std::optional<double>{};
        if (ready < 0) return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);

        sockaddr_in src{};
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(fd.get(), buf.data(), buf.size(), 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return sdwan_detail::unexpected<ProbeBackendError>(ProbeBackendError::Transport);
        }

        // Raw IPv4 sockets deliver the IP header in front of the ICMP message.
        const std::size_t ihl = static_cast<std::size_t>(buf[0] & 0x0F) * 4;
        if (static_cast<std::size_t>(n) < ihl + ICMP_HEADER_SIZE) continue;
        if (ntohl(src.sin_addr.s_addr) != target.v4_bits()) continue;

        const std::uint8_t* icmp = buf.data() + ihl;
        std::uint16_t r_id = 0, r_seq = 0;
        std::memcpy(&r_id, icmp + 4, 2);
        std::memcpy(&r_seq, icmp + 6, 2);
        if (icmp[0] != ICMP_ECHO_REPLY || ntohs(r_id) != ident_ || ntohs(r_seq) != seq) continue;

        const std::chrono::duration<double, std::milli> rtt = clock_type::now() - t0;
        return std::optional<double>{rtt.count()};
    }
}

} // namespace sdwan::health
