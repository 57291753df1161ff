#pragma once
/**
 * @file socket_util.hpp
 * @brief Small POSIX socket helpers shared by the probe backends and the UDP transport.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>

#include <netinet/in.h>
#include <unistd.h>

#include "sdwan/net/ip_address.hpp"

namespace sdwan::net {

/**
 * @class UniqueFd
 * @brief Move-only owner of a file descriptor; closes on destruction.
 */
class UniqueFd final {
public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) reset(o.release());
        return *this;
    }

    [[nodiscard]] int  get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept { const int fd = fd_; fd_ = -1; return fd; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

/// RFC 1071 one's-complement checksum over native 16-bit words; store the result as-is.
inline std::uint16_t csum16(const void* data, std::size_t len) noexcept {
    const auto* p = static_cast<const std::uint8_t*>(data);
    std::uint32_t sum = 0;
    while (len > 1) {
        std::uint16_t w;
        std::memcpy(&w, p, 2);
        sum += w;
        p += 2;
        len -= 2;
    }
    if (len) sum += *p;
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<std::uint16_t>(~sum);
}

/// Fill a sockaddr_in from an IPv4 SocketAddress. std::nullopt for IPv6.
std::optional<sockaddr_in> to_sockaddr_v4(const SocketAddress& addr) noexcept;

/// Convert a sockaddr_in back to a SocketAddress.
SocketAddress from_sockaddr_v4(const sockaddr_in& sa) noexcept;

/**
 * @brief Wait until @p fd is readable or @p timeout elapses.
 * @return 1 readable, 0 timeout, -1 error (errno set). EINTR is retried.
 */
int wait_readable(int fd, std::chrono::milliseconds timeout) noexcept;

} // namespace sdwan::net
