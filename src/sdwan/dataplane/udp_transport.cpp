/**
 * @file udp_transport.cpp
 * @brief POSIX UDP DatagramTransport.
 */
#include "sdwan/dataplane/transport.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>

#include "sdwan/obs/log.hpp"

namespace sdwan::dataplane {

sdwan_detail::expected<std::unique_ptr<UdpTransport>, TransportError>
UdpTransport::open(const net::SocketAddress& local) {
    const auto sa = net::to_sockaddr_v4(local);
    if (!sa) return sdwan_detail::unexpected<TransportError>(TransportError::Unsupported);

    net::UniqueFd fd{::socket(AF_INET, SOCK_DGRAM, 0)};
    if (!fd) {
        obs::logger()->error("udp transport: socket() failed: {}", std::strerror(errno));
        return sdwan_detail::unexpected<TransportError>(TransportError::BindFailed);
    }
    int yes = 1;
    if (::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        obs::logger()->warn("udp transport: SO_REUSEADDR: {}", std::strerror(errno));
    }

    if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&*sa), sizeof(sockaddr_in)) < 0) {
        obs::logger()->error("udp transport: bind {} failed: {}", local.to_string(), std::strerror(errno));
        return sdwan_detail::unexpected<TransportError>(TransportError::BindFailed);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd.get(), reinterpret_cast<sockaddr*>(&bound), &len) < 0) {
        return sdwan_detail::unexpected<TransportError>(TransportError::BindFailed);
    }
    const auto port = net::from_sockaddr_v4(bound).port;
    return std::unique_ptr<UdpTransport>(new UdpTransport(std::move(fd), port));
}

sdwan_detail::expected<void, TransportError>
UdpTransport::send_to(std::span<const std::uint8_t> bytes, const net::SocketAddress& to) {
    const auto sa = net::to_sockaddr_v4(to);
    if (!sa) return sdwan_detail::unexpected<TransportError>(TransportError::Unsupported);

    const ssize_t n = ::sendto(fd_.get(), bytes.data(), bytes.size(), 0,
                               reinterpret_cast<const sockaddr*>(&*sa), sizeof(sockaddr_in));
    if (n < 0 || static_cast<std::size_t>(n) != bytes.size()) {
        obs::logger()->debug("udp transport: send to {} failed: {}", to.to_string(),
                             n < 0 ? std::strerror(errno) : "short write");
        return sdwan_detail::unexpected<TransportError>(TransportError::SendFailed);
    }
    return {};
}

sdwan_detail::expected<std::optional<Received>, TransportError>
UdpTransport::receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) {
    const int ready = net::wait_readable(fd_.get(), timeout);
    if (ready == 0) return std::optional<Received>{};
    if (ready < 0) return sdwan_detail::unexpected<TransportError>(TransportError::ReceiveFailed);

    sockaddr_in src{};
    socklen_t slen = sizeof(src);
    const ssize_t n = ::recvfrom(fd_.get(), buf.data(), buf.size(), 0, reinterpret_cast<sockaddr*>(&src), &slen);
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) return std::optional<Received>{};
        return sdwan_detail::unexpected<TransportError>(TransportError::ReceiveFailed);
    }
    return std::optional<Received>{Received{net::from_sockaddr_v4(src), static_cast<std::size_t>(n)}};
}

} // namespace sdwan::dataplane
