/**
 * @file socket_util.cpp
 * @brief sockaddr conversion and poll() wrapper.
 */
#include "sdwan/net/socket_util.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <poll.h>

namespace sdwan::net {

std::optional<sockaddr_in> to_sockaddr_v4(const SocketAddress& addr) noexcept {
    if (!addr.ip.is_v4()) return std::nullopt;
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(addr.port);
    sa.sin_addr.s_addr = htonl(addr.ip.v4_bits());
    return sa;
}

SocketAddress from_sockaddr_v4(const sockaddr_in& sa) noexcept {
    return SocketAddress{IpAddress::v4(ntohl(sa.sin_addr.s_addr)), ntohs(sa.sin_port)};
}

int wait_readable(int fd, std::chrono::milliseconds timeout) noexcept {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        pollfd pfd{fd, POLLIN, 0};
        const int r = ::poll(&pfd, 1, left.count() > 0 ? static_cast<int>(left.count()) : 0);
        if (r < 0 && errno == EINTR) continue;
        if (r > 0) return 1;
        return r;
    }
}

} // namespace sdwan::net
