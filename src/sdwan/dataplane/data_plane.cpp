/**
 * @file data_plane.cpp
 * @brief DataPlane forwarding, decapsulation and receive loop.
 */
#include "sdwan/dataplane/data_plane.hpp"

#include <vector>

#include "sdwan/obs/log.hpp"

namespace sdwan::dataplane {

using namespace sdwan::config::constants;

sdwan_detail::expected<std::unique_ptr<DataPlane>, TransportError> DataPlane::create(DataPlaneConfig cfg) {
    auto transport = UdpTransport::open(cfg.bind);
    if (!transport) return sdwan_detail::unexpected<TransportError>(transport.error());
    return std::make_unique<DataPlane>(cfg, std::move(*transport));
}

DataPlane::DataPlane(DataPlaneConfig cfg, std::unique_ptr<DatagramTransport> transport)
    : cfg_(cfg), transport_(std::move(transport)), compressor_(cfg.compression) {}

DataPlane::~DataPlane() {
    stop();
}

// ------------------------------ Tables ------------------------------

void DataPlane::add_tunnel(TunnelEndpoint ep) {
    obs::logger()->info("dataplane: tunnel {} -> {} (site {}, compression {})", ep.path_id.to_string(),
                        ep.remote.to_string(), ep.site_id, ep.compression_enabled ? "on" : "off");
    std::unique_lock lk(tunnels_mu_);
    tunnels_[ep.path_id] = std::move(ep);
}

bool DataPlane::remove_tunnel(net::PathId id) {
    std::unique_lock lk(tunnels_mu_);
    const bool removed = tunnels_.erase(id) > 0;
    lk.unlock();
    if (removed) obs::logger()->info("dataplane: tunnel {} removed", id.to_string());
    return removed;
}

void DataPlane::add_route(const net::IpAddress& destination, net::PathId path) {
    std::unique_lock lk(routes_mu_);
    routes_[destination] = path;
}

bool DataPlane::remove_route(const net::IpAddress& destination) {
    std::unique_lock lk(routes_mu_);
    return routes_.erase(destination) > 0;
}

std::vector<TunnelEndpoint> DataPlane::tunnels() const {
    std::shared_lock lk(tunnels_mu_);
    std::vector<TunnelEndpoint> out;
    out.reserve(tunnels_.size());
    for (const auto& [id, ep] : tunnels_) out.push_back(ep);
    return out;
}

std::vector<std::pair<net::IpAddress, net::PathId>> DataPlane::routes() const {
    std::shared_lock lk(routes_mu_);
    return std::vector<std::pair<net::IpAddress, net::PathId>>(routes_.begin(), routes_.end());
}

// ----------------------------- Forwarding -----------------------------

sdwan_detail::expected<void, ForwardError> DataPlane::drop(ForwardError why) noexcept {
    packets_dropped_.fetch_add(1, std::memory_order_relaxed);
    return sdwan_detail::unexpected<ForwardError>(why);
}

sdwan_detail::expected<void, ForwardError>
DataPlane::forward_packet(std::span<const std::uint8_t> packet, const net::IpAddress& destination) {
    std::optional<net::PathId> path;
    {
        std::shared_lock lk(routes_mu_);
        if (const auto it = routes_.find(destination); it != routes_.end()) path = it->second;
    }
    if (!path) return drop(ForwardError::NoRoute);

    std::optional<TunnelEndpoint> ep;
    {
        std::shared_lock lk(tunnels_mu_);
        if (const auto it = tunnels_.find(*path); it != tunnels_.end()) ep = it->second;
    }
    if (!ep) return drop(ForwardError::NoTunnel);

    if (packet.size() > cfg_.mtu) {
        obs::logger()->debug("dataplane: {} byte packet to {} exceeds mtu {}", packet.size(),
                             destination.to_string(), cfg_.mtu);
        return drop(ForwardError::MtuExceeded);
    }

    const CompressedPacket frame = ep->compression_enabled ? compressor_.pack(packet)
                                                           : CompressedPacket::uncompressed(packet);
    const auto wire = frame.to_bytes();

    if (auto sent = transport_->send_to(wire, ep->remote); !sent) {
        obs::logger()->debug("dataplane: send via {} to {} failed ({})", path->to_string(),
                             ep->remote.to_string(), to_string(sent.error()));
        return drop(ForwardError::SendFailed);
    }

    packets_forwarded_.fetch_add(1, std::memory_order_relaxed);
    bytes_forwarded_.fetch_add(packet.size(), std::memory_order_relaxed);
    return {};
}

void DataPlane::handle_datagram(std::span<const std::uint8_t> bytes, const net::SocketAddress& from) {
    auto frame = CompressedPacket::from_bytes(bytes);
    if (!frame) {
        rx_errors_.fetch_add(1, std::memory_order_relaxed);
        obs::logger()->warn("dataplane: dropped {} byte frame from {} ({})", bytes.size(),
                            from.to_string(), to_string(frame.error()));
        return;
    }

    auto payload = compressor_.unpack(*frame);
    if (!payload) {
        rx_errors_.fetch_add(1, std::memory_order_relaxed);
        obs::logger()->warn("dataplane: undecodable frame from {} ({})", from.to_string(),
                            to_string(payload.error()));
        return;
    }

    packets_received_.fetch_add(1, std::memory_order_relaxed);
    bytes_received_.fetch_add(payload->size(), std::memory_order_relaxed);

    ReceiveHandler handler;
    {
        std::lock_guard<std::mutex> lk(handler_mu_);
        handler = handler_;
    }
    if (handler) handler(*payload, from);
}

void DataPlane::on_receive(ReceiveHandler handler) {
    std::lock_guard<std::mutex> lk(handler_mu_);
    handler_ = std::move(handler);
}

// ----------------------------- Lifecycle -----------------------------

bool DataPlane::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_.load()) return false;
    stop_requested_.store(false);
    running_.store(true);
    rx_thread_ = std::thread(&DataPlane::rx_loop, this);
    obs::logger()->info("dataplane: receiving on port {}", local_port());
    return true;
}

void DataPlane::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!running_.load()) return;
    stop_requested_.store(true);
    if (rx_thread_.joinable()) rx_thread_.join();
    running_.store(false);
    obs::logger()->info("dataplane: receive loop stopped");
}

void DataPlane::rx_loop() {
    std::vector<std::uint8_t> buf(DATAPLANE_RX_BUFFER_SIZE);
    while (!stop_requested_.load()) {
        auto got = transport_->receive(buf, cfg_.rx_poll);
        if (!got) {
            obs::logger()->error("dataplane: receive failed ({})", to_string(got.error()));
            std::this_thread::sleep_for(std::chrono::milliseconds(DATAPLANE_RX_ERROR_BACKOFF_MS));
            continue;
        }
        if (!got->has_value()) continue;

        const Received& r = **got;
        handle_datagram(std::span<const std::uint8_t>(buf.data(), r.size), r.from);
    }
}

// ---------------------------- Counters ----------------------------

DataPlaneStats DataPlane::stats() const noexcept {
    DataPlaneStats s;
    s.packets_forwarded = packets_forwarded_.load(std::memory_order_relaxed);
    s.bytes_forwarded   = bytes_forwarded_.load(std::memory_order_relaxed);
    s.packets_dropped   = packets_dropped_.load(std::memory_order_relaxed);
    s.packets_received  = packets_received_.load(std::memory_order_relaxed);
    s.bytes_received    = bytes_received_.load(std::memory_order_relaxed);
    s.rx_errors         = rx_errors_.load(std::memory_order_relaxed);
    return s;
}

void DataPlane::reset_stats() {
    packets_forwarded_.store(0);
    bytes_forwarded_.store(0);
    packets_dropped_.store(0);
    packets_received_.store(0);
    bytes_received_.store(0);
    rx_errors_.store(0);
    compressor_.reset_stats();
}

} // namespace sdwan::dataplane
