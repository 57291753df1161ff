#pragma once
/**
 * @file data_plane.hpp
 * @brief Tunnel forwarding: destination -> path -> endpoint, framing, compression.
 *
 * **Forward path**
 * route lookup -> tunnel lookup -> MTU check -> optional compression -> frame -> send.
 * Every failure is counted as a dropped packet and returned to the caller; nothing
 * is retried here.
 *
 * **Receive path**
 * A background loop parses each datagram, inflates it if flagged and hands the
 * payload to the registered handler. Malformed frames are logged and counted.
 *
 * **Locking**
 * The tunnel table and the route table each have their own reader/writer lock;
 * neither is held while the other is taken.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sdwan/compat/expected.hpp"
#include "sdwan/config/constants.hpp"
#include "sdwan/dataplane/compression.hpp"
#include "sdwan/dataplane/transport.hpp"
#include "sdwan/net/ip_address.hpp"
#include "sdwan/net/types.hpp"

namespace sdwan::dataplane {

/**
 * @struct DataPlaneConfig
 * @brief Socket, MTU and compression settings.
 */
struct DataPlaneConfig {
    net::SocketAddress        bind{net::IpAddress{}, config::constants::DATAPLANE_BIND_PORT_DEFAULT}; ///< 0.0.0.0:51822
    std::size_t               mtu{config::constants::DATAPLANE_MTU_DEFAULT};
    std::chrono::milliseconds rx_poll{config::constants::DATAPLANE_RX_POLL_MS_DEFAULT}; ///< Stop-check granularity
    CompressionConfig         compression{};
};

/**
 * @struct TunnelEndpoint
 * @brief Remote side of one path.
 */
struct TunnelEndpoint {
    net::SiteId        site_id;
    net::PathId        path_id{};
    net::SocketAddress remote{};
    bool               compression_enabled{true};

    bool operator==(const TunnelEndpoint&) const = default;
};

/// Typed forward_packet failures.
enum class ForwardError : std::uint8_t {
    NoRoute,      ///< No path for the destination
    NoTunnel,     ///< Path has no endpoint
    MtuExceeded,  ///< Packet larger than the configured MTU
    SendFailed    ///< Transport refused the datagram
};

constexpr std::string_view to_string(ForwardError e) noexcept {
    switch (e) {
        case ForwardError::NoRoute:     return "no_route";
        case ForwardError::NoTunnel:    return "no_tunnel";
        case ForwardError::MtuExceeded: return "mtu_exceeded";
        case ForwardError::SendFailed:  return "send_failed";
    }
    return "send_failed";
}

/**
 * @struct DataPlaneStats
 * @brief Monotonic counters; cleared only by reset_stats().
 */
struct DataPlaneStats {
    std::uint64_t packets_forwarded{0};
    std::uint64_t bytes_forwarded{0};   ///< Application bytes (pre-framing)
    std::uint64_t packets_dropped{0};
    std::uint64_t packets_received{0};
    std::uint64_t bytes_received{0};    ///< Decapsulated bytes
    std::uint64_t rx_errors{0};         ///< Malformed or undecodable frames
};

/// Consumer of decapsulated traffic.
using ReceiveHandler = std::function<void(std::span<const std::uint8_t> payload, const net::SocketAddress& from)>;

/**
 * @class DataPlane
 * @brief Forwards application packets over tunnels; thread-safe.
 */
class DataPlane {
public:
    /// Bind a UdpTransport to cfg.bind and build the data plane on it.
    static sdwan_detail::expected<std::unique_ptr<DataPlane>, TransportError> create(DataPlaneConfig cfg);

    /// Use an existing transport (tests, alternative carriers).
    DataPlane(DataPlaneConfig cfg, std::unique_ptr<DatagramTransport> transport);
    ~DataPlane();

    DataPlane(const DataPlane&) = delete;
    DataPlane& operator=(const DataPlane&) = delete;

    // ------------------------------ Tables ------------------------------
    void add_tunnel(TunnelEndpoint ep);
    bool remove_tunnel(net::PathId id);
    void add_route(const net::IpAddress& destination, net::PathId path);
    bool remove_route(const net::IpAddress& destination);

    [[nodiscard]] std::vector<TunnelEndpoint>                           tunnels() const;
    [[nodiscard]] std::vector<std::pair<net::IpAddress, net::PathId>>   routes() const;

    // ----------------------------- Forwarding -----------------------------
    sdwan_detail::expected<void, ForwardError>
    forward_packet(std::span<const std::uint8_t> packet, const net::IpAddress& destination);

    /// Decapsulate one inbound datagram (called by the receive loop).
    void handle_datagram(std::span<const std::uint8_t> bytes, const net::SocketAddress& from);

    /// Install the consumer of decapsulated payloads.
    void on_receive(ReceiveHandler handler);

    // ----------------------------- Lifecycle -----------------------------
    /// Start the receive loop. Returns false if already running.
    bool start();

    /// Stop the receive loop; the in-flight receive completes first. Idempotent.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    // ---------------------------- Counters ----------------------------
    [[nodiscard]] DataPlaneStats    stats() const noexcept;
    [[nodiscard]] std::uint64_t     rx_errors() const noexcept { return rx_errors_.load(); }
    [[nodiscard]] CompressionStats  compression_stats() const { return compressor_.stats(); }
    void reset_stats();

    [[nodiscard]] std::uint16_t          local_port() const noexcept { return transport_->local_port(); }
    [[nodiscard]] const DataPlaneConfig& config() const noexcept { return cfg_; }

private:
    void rx_loop();
    sdwan_detail::expected<void, ForwardError> drop(ForwardError why) noexcept;

private:
    DataPlaneConfig                    cfg_;
    std::unique_ptr<DatagramTransport> transport_;
    CompressionEngine                  compressor_;

    mutable std::shared_mutex                          tunnels_mu_;
    std::unordered_map<net::PathId, TunnelEndpoint>    tunnels_;

    mutable std::shared_mutex                          routes_mu_;
    std::unordered_map<net::IpAddress, net::PathId>    routes_;

    std::mutex     handler_mu_;
    ReceiveHandler handler_;

    std::atomic<std::uint64_t> packets_forwarded_{0};
    std::atomic<std::uint64_t> bytes_forwarded_{0};
    std::atomic<std::uint64_t> packets_dropped_{0};
    std::atomic<std::uint64_t> packets_received_{0};
    std::atomic<std::uint64_t> bytes_received_{0};
    std::atomic<std::uint64_t> rx_errors_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex        lifecycle_mu_;
    std::thread       rx_thread_;
};

} // namespace sdwan::dataplane
