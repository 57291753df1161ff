/**
 * @file test_compression.cpp
 * @brief Tests for the tunnel frame codec and the zlib CompressionEngine.
 *
 * Validates:
 *  - Frame header layout (flag, original size, payload length; big-endian)
 *  - TooShort / Truncated decoding errors, trailing bytes ignored
 *  - Compression only when strictly smaller; skip rules (disabled, min size)
 *  - Decompression size checks
 *  - Statistics and ratio
 */

#include <gtest/gtest.h>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "sdwan/dataplane/compressed_packet.hpp"
#include "sdwan/dataplane/compression.hpp"

using sdwan::dataplane::CompressedPacket;
using sdwan::dataplane::CompressionConfig;
using sdwan::dataplane::CompressionEngine;
using sdwan::dataplane::CompressionError;
using sdwan::dataplane::FrameError;

namespace {

std::vector<std::uint8_t> repetitive(std::size_t n) {
  const std::string line = "GET /index.html HTTP/1.1\r\nHost: branch.example\r\n";
  std::vector<std::uint8_t> out;
  out.reserve(n);
  while (out.size() < n) out.push_back(static_cast<std::uint8_t>(line[out.size() % line.size()]));
  return out;
}

std::vector<std::uint8_t> random_bytes(std::size_t n, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> byte(0, 255);
  std::vector<std::uint8_t> out(n);
  for (auto& b : out) b = static_cast<std::uint8_t>(byte(rng));
  return out;
}

} // namespace

// --------------------------- Frame codec -----------------------------------

/**
 * @test Frame_Uncompressed_Layout
 * @brief Flag 0, original size = payload length, header is 9 bytes.
 */
TEST(CompressedPacket, Frame_Uncompressed_Layout) {
  const std::vector<std::uint8_t> data{0xDE, 0xAD, 0xBE, 0xEF, 0x01};
  const auto pkt = CompressedPacket::uncompressed(data);
  EXPECT_FALSE(pkt.is_compressed());
  EXPECT_FALSE(pkt.original_size().has_value());

  const auto wire = pkt.to_bytes();
  ASSERT_EQ(wire.size(), 14u);
  EXPECT_EQ(pkt.wire_size(), wire.size());
  EXPECT_EQ(wire[0], 0x00);
  EXPECT_EQ((std::vector<std::uint8_t>(wire.begin() + 1, wire.begin() + 9)),
            (std::vector<std::uint8_t>{0, 0, 0, 5, 0, 0, 0, 5}));
  EXPECT_EQ((std::vector<std::uint8_t>(wire.begin() + 9, wire.end())), data);

  const auto back = CompressedPacket::from_bytes(wire);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, pkt);
}

/**
 * @test Frame_Compressed_Layout
 * @brief Flag bit set and original size carried big-endian.
 */
TEST(CompressedPacket, Frame_Compressed_Layout) {
  const auto pkt = CompressedPacket::compressed({1, 2, 3}, 0x01020304);
  const auto wire = pkt.to_bytes();
  ASSERT_EQ(wire.size(), 12u);
  EXPECT_EQ(wire[0] & 0x01, 0x01);
  EXPECT_EQ(wire[1], 0x01);
  EXPECT_EQ(wire[4], 0x04);
  EXPECT_EQ(wire[8], 0x03);

  const auto back = CompressedPacket::from_bytes(wire);
  ASSERT_TRUE(back.has_value());
  EXPECT_TRUE(back->is_compressed());
  EXPECT_EQ(back->original_size(), 0x01020304u);
  EXPECT_EQ(back->payload(), (std::vector<std::uint8_t>{1, 2, 3}));
}

/**
 * @test Frame_Decode_Errors
 * @brief Short header => TooShort; payload shorter than announced => Truncated.
 */
TEST(CompressedPacket, Frame_Decode_Errors) {
  const std::vector<std::uint8_t> tiny{0, 0, 0, 0, 0, 0, 0, 0};
  auto r = CompressedPacket::from_bytes(tiny);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), FrameError::TooShort);

  EXPECT_EQ(CompressedPacket::from_bytes({}).error(), FrameError::TooShort);

  auto wire = CompressedPacket::uncompressed(std::vector<std::uint8_t>(10, 7)).to_bytes();
  wire.pop_back();
  r = CompressedPacket::from_bytes(wire);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), FrameError::Truncated);
}

/**
 * @test Frame_Trailing_Bytes_Ignored
 * @brief Extra bytes after the payload are not part of the frame.
 */
TEST(CompressedPacket, Frame_Trailing_Bytes_Ignored) {
  auto wire = CompressedPacket::uncompressed(std::vector<std::uint8_t>{9, 9}).to_bytes();
  wire.push_back(0xFF);
  wire.push_back(0xFF);
  const auto r = CompressedPacket::from_bytes(wire);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->payload(), (std::vector<std::uint8_t>{9, 9}));
}

// --------------------------- CompressionEngine -----------------------------

/**
 * @test Engine_Compressible_RoundTrip
 * @brief Repetitive payload shrinks and inflates back exactly.
 */
TEST(CompressionEngine, Engine_Compressible_RoundTrip) {
  CompressionEngine eng;
  const auto data = repetitive(1400);

  const auto pkt = eng.pack(data);
  ASSERT_TRUE(pkt.is_compressed());
  EXPECT_LT(pkt.payload().size(), data.size());
  EXPECT_EQ(pkt.original_size(), 1400u);

  const auto parsed = CompressedPacket::from_bytes(pkt.to_bytes());
  ASSERT_TRUE(parsed.has_value());
  const auto out = eng.unpack(*parsed);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, data);

  const auto s = eng.stats();
  EXPECT_EQ(s.compressed, 1u);
  EXPECT_EQ(s.bytes_in, 1400u);
  EXPECT_EQ(s.bytes_out, pkt.payload().size());
  EXPECT_GT(s.ratio(), 1.0);
  EXPECT_GT(s.saved_pct(), 0.0);
}

/**
 * @test Engine_Incompressible_Sent_Raw
 * @brief Random bytes do not shrink => uncompressed frame, counted as skipped.
 */
TEST(CompressionEngine, Engine_Incompressible_Sent_Raw) {
  CompressionEngine eng;
  const auto data = random_bytes(1000, 17);

  const auto attempt = eng.compress(data);
  ASSERT_TRUE(attempt.has_value());
  EXPECT_FALSE(attempt->has_value());

  const auto pkt = eng.pack(data);
  EXPECT_FALSE(pkt.is_compressed());
  EXPECT_EQ(pkt.payload(), data);

  const auto s = eng.stats();
  EXPECT_EQ(s.compressed, 0u);
  EXPECT_EQ(s.skipped, 2u);
  EXPECT_EQ(s.bytes_in, s.bytes_out);
  EXPECT_DOUBLE_EQ(s.saved_pct(), 0.0);
}

/**
 * @test Engine_Skip_Rules
 * @brief Below min_size or disabled => never compressed, never counted as bytes.
 */
TEST(CompressionEngine, Engine_Skip_Rules) {
  CompressionEngine small_min(CompressionConfig{true, 1, 128});
  EXPECT_FALSE(small_min.pack(repetitive(127)).is_compressed());
  EXPECT_TRUE(small_min.pack(repetitive(128)).is_compressed());

  CompressionEngine off(CompressionConfig{false, 6, 0});
  EXPECT_FALSE(off.pack(repetitive(4096)).is_compressed());
  EXPECT_EQ(off.stats().skipped, 1u);
  EXPECT_EQ(off.stats().bytes_in, 0u);
  EXPECT_DOUBLE_EQ(off.stats().ratio(), 1.0);
}

/**
 * @test Engine_Level_Clamped
 * @brief Out-of-range levels are clamped to zlib's 1..9.
 */
TEST(CompressionEngine, Engine_Level_Clamped) {
  EXPECT_EQ(CompressionEngine(CompressionConfig{true, 0, 0}).config().level, 1);
  EXPECT_EQ(CompressionEngine(CompressionConfig{true, 42, 0}).config().level, 9);
}

/**
 * @test Engine_Decompress_Size_Checks
 * @brief Short inflate => SizeMismatch; overflow, truncation, garbage and the
 *        output ceiling => DecompressFailed. Every failure is counted.
 */
TEST(CompressionEngine, Engine_Decompress_Size_Checks) {
  CompressionEngine eng(CompressionConfig{true, 6, 0});
  const auto data = repetitive(2000);
  const auto c = eng.compress(data);
  ASSERT_TRUE(c.has_value());
  ASSERT_TRUE(c->has_value());
  const auto& z = **c;
  const auto errors_before = eng.stats().errors;

  EXPECT_EQ(eng.decompress(z, 3000).error(), CompressionError::SizeMismatch);
  EXPECT_EQ(eng.decompress(z, 1000).error(), CompressionError::DecompressFailed);
  EXPECT_TRUE(eng.decompress(z, 2000).has_value());

  const std::vector<std::uint8_t> truncated(z.begin(), z.begin() + static_cast<std::ptrdiff_t>(z.size() / 2));
  EXPECT_EQ(eng.decompress(truncated, 2000).error(), CompressionError::DecompressFailed);

  const std::vector<std::uint8_t> junk{0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
  EXPECT_EQ(eng.decompress(junk, 100).error(), CompressionError::DecompressFailed);

  EXPECT_EQ(eng.decompress(z, std::size_t{64} << 20).error(), CompressionError::DecompressFailed);

  EXPECT_EQ(eng.stats().errors - errors_before, 5u);
}

/**
 * @test Engine_Reset_Stats
 * @brief reset_stats zeroes every counter.
 */
TEST(CompressionEngine, Engine_Reset_Stats) {
  CompressionEngine eng;
  (void)eng.pack(repetitive(1000));
  (void)eng.pack(repetitive(10));
  eng.reset_stats();
  const auto s = eng.stats();
  EXPECT_EQ(s.bytes_in, 0u);
  EXPECT_EQ(s.compressed, 0u);
  EXPECT_EQ(s.skipped, 0u);
}
