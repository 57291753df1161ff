/**
 * @file compressed_packet.cpp
 * @brief Frame encode/decode.
 */
#include "sdwan/dataplane/compressed_packet.hpp"

#include "sdwan/config/constants.hpp"

namespace sdwan::dataplane {

using namespace sdwan::config::constants;

namespace {

void put_be32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

std::uint32_t get_be32(const std::uint8_t* p) noexcept {
    return (std::uint32_t{p[0]} << 24) | (std::uint32_t{p[1]} << 16) |
           (std::uint32_t{p[2]} << 8)  |  std::uint32_t{p[3]};
}

} // namespace

CompressedPacket CompressedPacket::uncompressed(std::span<const std::uint8_t> bytes) {
    CompressedPacket p;
    p.payload_.assign(bytes.begin(), bytes.end());
    return p;
}

CompressedPacket CompressedPacket::compressed(std::vector<std::uint8_t> payload, std::uint32_t original_size) {
    CompressedPacket p;
    p.compressed_ = true;
    p.payload_ = std::move(payload);
    p.original_size_ = original_size;
    return p;
}

std::size_t CompressedPacket::wire_size() const noexcept {
    return FRAME_HEADER_SIZE + payload_.size();
}

std::vector<std::uint8_t> CompressedPacket::to_bytes() const {
    std::vector<std::uint8_t> out;
    out.reserve(wire_size());
    out.push_back(compressed_ ? FRAME_FLAG_COMPRESSED : std::uint8_t{0});
    const auto payload_len = static_cast<std::uint32_t>(payload_.size());
    put_be32(out, original_size_.value_or(payload_len));
    put_be32(out, payload_len);
    out.insert(out.end(), payload_.begin(), payload_.end());
    return out;
}

sdwan_detail::expected<CompressedPacket, FrameError>
CompressedPacket::from_bytes(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < FRAME_HEADER_SIZE) return sdwan_detail::unexpected<FrameError>(FrameError::TooShort);

    const bool is_compressed = (bytes[0] & FRAME_FLAG_COMPRESSED) != 0;
    const std::uint32_t original = get_be32(bytes.data() + 1);
    const std::uint32_t payload_len = get_be32(bytes.data() + 5);
    if (bytes.size() - FRAME_HEADER_SIZE < payload_len) {
        return sdwan_detail::unexpected<FrameError>(FrameError::Truncated);
    }

    const auto body = bytes.subspan(FRAME_HEADER_SIZE, payload_len);
    if (is_compressed) return compressed(std::vector<std::uint8_t>(body.begin(), body.end()), original);
    return uncompressed(body);
}

} // namespace sdwan::dataplane
