#pragma once
/**
 * @file compressed_packet.hpp
 * @brief Tunnel payload frame: flags(1) | original_size(4, BE) | payload_size(4, BE) | payload.
 * @details original_size is present exactly when the payload is compressed; an
 *          uncompressed frame carries the payload length in that field.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "sdwan/compat/expected.hpp"

namespace sdwan::dataplane {

/// Frame decoding failures.
enum class FrameError : std::uint8_t {
    TooShort,   ///< Fewer bytes than the fixed header
    Truncated   ///< Header announces more payload than was received
};

constexpr std::string_view to_string(FrameError e) noexcept {
    return e == FrameError::TooShort ? "too_short" : "truncated";
}

/**
 * @class CompressedPacket
 * @brief Value type for one framed payload.
 */
class CompressedPacket final {
public:
    /// Frame carrying @p bytes as-is.
    static CompressedPacket uncompressed(std::span<const std::uint8_t> bytes);

    /// Frame carrying a compressed payload of an @p original_size byte packet.
    static CompressedPacket compressed(std::vector<std::uint8_t> payload, std::uint32_t original_size);

    [[nodiscard]] bool is_compressed() const noexcept { return compressed_; }
    [[nodiscard]] const std::vector<std::uint8_t>& payload() const noexcept { return payload_; }
    [[nodiscard]] std::optional<std::uint32_t> original_size() const noexcept { return original_size_; }

    /// Encoded size (header + payload).
    [[nodiscard]] std::size_t wire_size() const noexcept;

    /// Serialize to the wire layout.
    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

    /// Parse a frame. Bytes past the announced payload are ignored.
    static sdwan_detail::expected<CompressedPacket, FrameError> from_bytes(std::span<const std::uint8_t> bytes);

    bool operator==(const CompressedPacket&) const = default;

private:
    CompressedPacket() = default;

    bool                          compressed_{false};
    std::vector<std::uint8_t>     payload_;
    std::optional<std::uint32_t>  original_size_;
};

} // namespace sdwan::dataplane
