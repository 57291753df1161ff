/**
 * @file test_dataplane.cpp
 * @brief Tests for DataPlane forwarding, decapsulation and the UDP receive loop.
 *
 * Validates:
 *  - Route -> tunnel -> frame -> transport forwarding
 *  - NoRoute / NoTunnel / MtuExceeded / SendFailed drops are counted
 *  - Per-tunnel compression toggle
 *  - Malformed frames increment rx_errors and never reach the handler
 *  - Loopback end-to-end over two real UDP sockets
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "sdwan/dataplane/data_plane.hpp"

using namespace std::chrono_literals;
using sdwan::dataplane::CompressedPacket;
using sdwan::dataplane::DataPlane;
using sdwan::dataplane::DataPlaneConfig;
using sdwan::dataplane::DatagramTransport;
using sdwan::dataplane::ForwardError;
using sdwan::dataplane::Received;
using sdwan::dataplane::TransportError;
using sdwan::dataplane::TunnelEndpoint;
using sdwan::net::IpAddress;
using sdwan::net::PathId;
using sdwan::net::SocketAddress;

namespace {

struct Sent {
  std::vector<std::uint8_t> bytes;
  SocketAddress             to;
};

///
/// In-memory transport: records sends, replays injected datagrams.
///
class FakeTransport final : public DatagramTransport {
public:
  sdwan_detail::expected<void, TransportError>
  send_to(std::span<const std::uint8_t> bytes, const SocketAddress& to) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (fail_sends) return sdwan_detail::unexpected<TransportError>(TransportError::SendFailed);
    sent_.push_back(Sent{{bytes.begin(), bytes.end()}, to});
    return {};
  }

  sdwan_detail::expected<std::optional<Received>, TransportError>
  receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, timeout, [this] { return !inbox_.empty(); })) return std::optional<Received>{};
    auto [bytes, from] = std::move(inbox_.front());
    inbox_.pop_front();
    const std::size_t n = std::min(bytes.size(), buf.size());
    std::copy_n(bytes.begin(), n, buf.begin());
    return std::optional<Received>{Received{from, n}};
  }

  std::uint16_t local_port() const noexcept override { return 40000; }

  void inject(std::vector<std::uint8_t> bytes, SocketAddress from) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      inbox_.push_back(Sent{std::move(bytes), from});
    }
    cv_.notify_all();
  }

  std::vector<Sent> sent() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
  }

  bool fail_sends{false};

private:
  mutable std::mutex      mu_;
  std::condition_variable cv_;
  std::vector<Sent>       sent_;
  std::deque<Sent>        inbox_;
};

const IpAddress kDest   = IpAddress::v4(0x0A140001);             // 10.20.0.1
const SocketAddress kPeer{IpAddress::v4(0xC6336401), 51822};     // 198.51.100.1:51822

DataPlaneConfig test_config() {
  DataPlaneConfig cfg;
  cfg.mtu = 1500;
  cfg.rx_poll = 20ms;
  cfg.compression.min_size = 64;
  return cfg;
}

std::vector<std::uint8_t> text_packet(std::size_t n) {
  std::vector<std::uint8_t> out(n);
  for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<std::uint8_t>('a' + (i % 7));
  return out;
}

/// Poll until @p pred holds or two seconds pass.
template <class Pred>
bool eventually(Pred pred) {
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

} // namespace

// --------------------------- Forwarding ------------------------------------

/**
 * @test Forward_Frames_To_Tunnel_Remote
 * @brief Routed packet is framed, compressed and sent to the endpoint.
 */
TEST(DataPlane, Forward_Frames_To_Tunnel_Remote) {
  auto transport = std::make_unique<FakeTransport>();
  auto* fake = transport.get();
  DataPlane dp(test_config(), std::move(transport));
  dp.add_tunnel(TunnelEndpoint{"branch-a", PathId{1}, kPeer, true});
  dp.add_route(kDest, PathId{1});

  const auto pkt = text_packet(1000);
  ASSERT_TRUE(dp.forward_packet(pkt, kDest).has_value());

  const auto sent = fake->sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].to, kPeer);

  const auto frame = CompressedPacket::from_bytes(sent[0].bytes);
  ASSERT_TRUE(frame.has_value());
  EXPECT_TRUE(frame->is_compressed());
  EXPECT_EQ(frame->original_size(), 1000u);

  const auto s = dp.stats();
  EXPECT_EQ(s.packets_forwarded, 1u);
  EXPECT_EQ(s.bytes_forwarded, 1000u);
  EXPECT_EQ(s.packets_dropped, 0u);
  EXPECT_EQ(dp.compression_stats().compressed, 1u);
}

/**
 * @test Forward_Compression_Disabled_Per_Tunnel
 * @brief Endpoint without compression always sends raw frames.
 */
TEST(DataPlane, Forward_Compression_Disabled_Per_Tunnel) {
  auto transport = std::make_unique<FakeTransport>();
  auto* fake = transport.get();
  DataPlane dp(test_config(), std::move(transport));
  dp.add_tunnel(TunnelEndpoint{"branch-a", PathId{1}, kPeer, false});
  dp.add_route(kDest, PathId{1});

  const auto pkt = text_packet(1000);
  ASSERT_TRUE(dp.forward_packet(pkt, kDest).has_value());
  const auto frame = CompressedPacket::from_bytes(fake->sent().at(0).bytes);
  ASSERT_TRUE(frame.has_value());
  EXPECT_FALSE(frame->is_compressed());
  EXPECT_EQ(frame->payload(), pkt);
}

/**
 * @test Forward_Drops_Are_Counted
 * @brief Every failure kind returns its error and bumps packets_dropped.
 */
TEST(DataPlane, Forward_Drops_Are_Counted) {
  auto transport = std::make_unique<FakeTransport>();
  auto* fake = transport.get();
  auto cfg = test_config();
  cfg.mtu = 500;
  DataPlane dp(cfg, std::move(transport));
  const auto pkt = text_packet(100);

  EXPECT_EQ(dp.forward_packet(pkt, kDest).error(), ForwardError::NoRoute);

  dp.add_route(kDest, PathId{3});
  EXPECT_EQ(dp.forward_packet(pkt, kDest).error(), ForwardError::NoTunnel);

  dp.add_tunnel(TunnelEndpoint{"branch-b", PathId{3}, kPeer, true});
  EXPECT_EQ(dp.forward_packet(text_packet(501), kDest).error(), ForwardError::MtuExceeded);
  EXPECT_TRUE(dp.forward_packet(text_packet(500), kDest).has_value());

  fake->fail_sends = true;
  EXPECT_EQ(dp.forward_packet(pkt, kDest).error(), ForwardError::SendFailed);

  const auto s = dp.stats();
  EXPECT_EQ(s.packets_dropped, 4u);
  EXPECT_EQ(s.packets_forwarded, 1u);
}

/**
 * @test Tables_Add_Remove
 * @brief Route/tunnel tables replace by key and report removals.
 */
TEST(DataPlane, Tables_Add_Remove) {
  DataPlane dp(test_config(), std::make_unique<FakeTransport>());
  dp.add_tunnel(TunnelEndpoint{"a", PathId{1}, kPeer, true});
  dp.add_tunnel(TunnelEndpoint{"a2", PathId{1}, kPeer, false});
  dp.add_route(kDest, PathId{1});
  dp.add_route(kDest, PathId{2});

  ASSERT_EQ(dp.tunnels().size(), 1u);
  EXPECT_EQ(dp.tunnels()[0].site_id, "a2");
  ASSERT_EQ(dp.routes().size(), 1u);
  EXPECT_EQ(dp.routes()[0].second, PathId{2});

  EXPECT_TRUE(dp.remove_tunnel(PathId{1}));
  EXPECT_FALSE(dp.remove_tunnel(PathId{1}));
  EXPECT_TRUE(dp.remove_route(kDest));
  EXPECT_FALSE(dp.remove_route(kDest));
}

// --------------------------- Receive path ----------------------------------

/**
 * @test Receive_Decapsulates_To_Handler
 * @brief Compressed and raw frames both reach the handler as original bytes.
 */
TEST(DataPlane, Receive_Decapsulates_To_Handler) {
  DataPlane dp(test_config(), std::make_unique<FakeTransport>());
  std::vector<std::vector<std::uint8_t>> got;
  dp.on_receive([&](std::span<const std::uint8_t> payload, const SocketAddress& from) {
    EXPECT_EQ(from, kPeer);
    got.emplace_back(payload.begin(), payload.end());
  });

  sdwan::dataplane::CompressionEngine peer;
  const auto big = text_packet(900);
  const auto small = text_packet(10);
  dp.handle_datagram(peer.pack(big).to_bytes(), kPeer);
  dp.handle_datagram(CompressedPacket::uncompressed(small).to_bytes(), kPeer);

  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0], big);
  EXPECT_EQ(got[1], small);
  EXPECT_EQ(dp.stats().packets_received, 2u);
  EXPECT_EQ(dp.stats().bytes_received, 910u);
}

/**
 * @test Receive_Malformed_Counts_Error
 * @brief Short, truncated and undecodable frames are rejected and counted.
 */
TEST(DataPlane, Receive_Malformed_Counts_Error) {
  DataPlane dp(test_config(), std::make_unique<FakeTransport>());
  int calls = 0;
  dp.on_receive([&](std::span<const std::uint8_t>, const SocketAddress&) { ++calls; });

  const std::vector<std::uint8_t> short_frame{1, 2, 3};
  dp.handle_datagram(short_frame, kPeer);

  auto truncated = CompressedPacket::uncompressed(text_packet(50)).to_bytes();
  truncated.resize(30);
  dp.handle_datagram(truncated, kPeer);

  const auto bogus = CompressedPacket::compressed({0xFF, 0xFF, 0xFF, 0xFF}, 100).to_bytes();
  dp.handle_datagram(bogus, kPeer);

  EXPECT_EQ(calls, 0);
  EXPECT_EQ(dp.rx_errors(), 3u);
  EXPECT_EQ(dp.stats().packets_received, 0u);

  dp.reset_stats();
  EXPECT_EQ(dp.rx_errors(), 0u);
}

/**
 * @test Rx_Loop_Start_Stop
 * @brief Receive loop delivers injected datagrams and stops idempotently.
 */
TEST(DataPlane, Rx_Loop_Start_Stop) {
  auto transport = std::make_unique<FakeTransport>();
  auto* fake = transport.get();
  DataPlane dp(test_config(), std::move(transport));
  std::atomic<int> delivered{0};
  dp.on_receive([&](std::span<const std::uint8_t>, const SocketAddress&) { delivered.fetch_add(1); });

  ASSERT_TRUE(dp.start());
  EXPECT_FALSE(dp.start());
  EXPECT_TRUE(dp.running());

  fake->inject(CompressedPacket::uncompressed(text_packet(20)).to_bytes(), kPeer);
  fake->inject(CompressedPacket::uncompressed(text_packet(30)).to_bytes(), kPeer);
  EXPECT_TRUE(eventually([&] { return delivered.load() == 2; }));

  dp.stop();
  EXPECT_FALSE(dp.running());
  dp.stop();
}

// --------------------------- Loopback --------------------------------------

/**
 * @test Loopback_Two_Sites_Udp
 * @brief Site A forwards over a real UDP socket to site B's receive loop.
 */
TEST(DataPlane, Loopback_Two_Sites_Udp) {
  auto cfg = test_config();
  cfg.bind = SocketAddress{IpAddress::v4(0x7F000001), 0};

  auto a = DataPlane::create(cfg);
  auto b = DataPlane::create(cfg);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  auto& site_a = **a;
  auto& site_b = **b;
  ASSERT_NE(site_b.local_port(), 0);

  std::mutex mu;
  std::vector<std::vector<std::uint8_t>> got;
  site_b.on_receive([&](std::span<const std::uint8_t> payload, const SocketAddress& from) {
    EXPECT_EQ(from.port, site_a.local_port());
    std::lock_guard<std::mutex> lk(mu);
    got.emplace_back(payload.begin(), payload.end());
  });
  ASSERT_TRUE(site_b.start());

  site_a.add_tunnel(TunnelEndpoint{"site-b", PathId{1},
                                   SocketAddress{IpAddress::v4(0x7F000001), site_b.local_port()}, true});
  site_a.add_route(kDest, PathId{1});

  const auto big = text_packet(1200);
  const auto small = text_packet(16);
  ASSERT_TRUE(site_a.forward_packet(big, kDest).has_value());
  ASSERT_TRUE(site_a.forward_packet(small, kDest).has_value());

  EXPECT_TRUE(eventually([&] {
    std::lock_guard<std::mutex> lk(mu);
    return got.size() == 2;
  }));
  site_b.stop();

  std::lock_guard<std::mutex> lk(mu);
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0], big);
  EXPECT_EQ(got[1], small);
  EXPECT_EQ(site_b.stats().rx_errors, 0u);
}
