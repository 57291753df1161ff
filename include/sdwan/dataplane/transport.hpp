#pragma once
/**
 * @file transport.hpp
 * @brief Connectionless datagram transport used by the data plane.
 * @details Unordered, unreliable, no acknowledgements. One instance per DataPlane.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "sdwan/compat/expected.hpp"
#include "sdwan/net/ip_address.hpp"
#include "sdwan/net/socket_util.hpp"

namespace sdwan::dataplane {

enum class TransportError : std::uint8_t {
    BindFailed,
    SendFailed,
    ReceiveFailed,
    Unsupported    ///< Address family not handled by this transport
};

constexpr std::string_view to_string(TransportError e) noexcept {
    switch (e) {
        case TransportError::BindFailed:    return "bind_failed";
        case TransportError::SendFailed:    return "send_failed";
        case TransportError::ReceiveFailed: return "receive_failed";
        case TransportError::Unsupported:   return "unsupported";
    }
    return "send_failed";
}

/// Metadata of one received datagram.
struct Received {
    net::SocketAddress from{};
    std::size_t        size{0};
};

class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;

    /// Send one datagram; partial sends count as failure.
    virtual sdwan_detail::expected<void, TransportError>
    send_to(std::span<const std::uint8_t> bytes, const net::SocketAddress& to) = 0;

    /**
     * @brief Wait up to @p timeout for one datagram.
     * @return std::nullopt on timeout.
     */
    virtual sdwan_detail::expected<std::optional<Received>, TransportError>
    receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) = 0;

    /// Bound local port (host order).
    virtual std::uint16_t local_port() const noexcept = 0;
};

/**
 * @class UdpTransport
 * @brief IPv4 UDP socket implementation.
 */
class UdpTransport final : public DatagramTransport {
public:
    /// Bind to @p local (port 0 picks an ephemeral port).
    static sdwan_detail::expected<std::unique_ptr<UdpTransport>, TransportError>
    open(const net::SocketAddress& local);

    sdwan_detail::expected<void, TransportError>
    send_to(std::span<const std::uint8_t> bytes, const net::SocketAddress& to) override;

    sdwan_detail::expected<std::optional<Received>, TransportError>
    receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) override;

    std::uint16_t local_port() const noexcept override { return port_; }

private:
    UdpTransport(net::UniqueFd fd, std::uint16_t port) noexcept : fd_(std::move(fd)), port_(port) {}

    net::UniqueFd fd_;
    std::uint16_t port_;
};

} // namespace sdwan::dataplane
