#pragma once
/**
 * @file compression.hpp
 * @brief Per-packet compression policy over zlib, with running statistics.
 * @details Compressed output is used only when strictly smaller than the input.
 *          Disabled engines and packets below min_size pass through untouched.
 */

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "sdwan/compat/expected.hpp"
#include "sdwan/config/constants.hpp"
#include "sdwan/dataplane/compressed_packet.hpp"

namespace sdwan::dataplane {

enum class CompressionError : std::uint8_t {
    CompressFailed,
    DecompressFailed,
    SizeMismatch   ///< Stream inflated to fewer bytes than the frame's original size
};

constexpr std::string_view to_string(CompressionError e) noexcept {
    switch (e) {
        case CompressionError::CompressFailed:   return "compress_failed";
        case CompressionError::DecompressFailed: return "decompress_failed";
        case CompressionError::SizeMismatch:     return "size_mismatch";
    }
    return "decompress_failed";
}

/**
 * @struct CompressionConfig
 * @brief Compression knobs.
 */
struct CompressionConfig {
    bool        enabled{config::constants::COMPRESSION_ENABLED_DEFAULT};
    int         level{config::constants::COMPRESSION_LEVEL_DEFAULT};        ///< zlib level 1..9
    std::size_t min_size{config::constants::COMPRESSION_MIN_SIZE_DEFAULT};  ///< Smaller packets are skipped

    bool operator==(const CompressionConfig&) const = default;
};

/**
 * @struct CompressionStats
 * @brief Totals over packets that went through a compression attempt.
 */
struct CompressionStats {
    std::uint64_t bytes_in{0};      ///< Input bytes of attempted packets
    std::uint64_t bytes_out{0};     ///< Bytes actually emitted for those packets
    std::uint64_t compressed{0};    ///< Packets sent compressed
    std::uint64_t skipped{0};       ///< Disabled, too small or not beneficial
    std::uint64_t errors{0};        ///< zlib failures and size mismatches

    /// bytes_in / bytes_out (1.0 when nothing was attempted).
    [[nodiscard]] double ratio() const noexcept {
        return (bytes_in == 0 || bytes_out == 0) ? 1.0
                                                 : static_cast<double>(bytes_in) / static_cast<double>(bytes_out);
    }

    /// Percentage of input bytes saved.
    [[nodiscard]] double saved_pct() const noexcept {
        if (bytes_in == 0 || bytes_out >= bytes_in) return 0.0;
        return static_cast<double>(bytes_in - bytes_out) / static_cast<double>(bytes_in) * 100.0;
    }
};

/**
 * @class CompressionEngine
 * @brief Thread-safe; statistics are kept under a mutex.
 */
class CompressionEngine {
public:
    explicit CompressionEngine(CompressionConfig cfg = {}) noexcept;

    /**
     * @brief Try to compress @p data.
     * @return Compressed bytes if strictly smaller; std::nullopt when the
     *         original should be sent; error on zlib failure.
     */
    sdwan_detail::expected<std::optional<std::vector<std::uint8_t>>, CompressionError>
    compress(std::span<const std::uint8_t> data);

    /// Inflate @p data, which must expand to exactly @p original_size bytes.
    sdwan_detail::expected<std::vector<std::uint8_t>, CompressionError>
    decompress(std::span<const std::uint8_t> data, std::size_t original_size);

    /// Frame @p data, compressing when beneficial; falls back to uncompressed on error.
    CompressedPacket pack(std::span<const std::uint8_t> data);

    /// Payload bytes of @p pkt, inflating when flagged.
    sdwan_detail::expected<std::vector<std::uint8_t>, CompressionError> unpack(const CompressedPacket& pkt);

    [[nodiscard]] CompressionStats stats() const;
    void reset_stats();

    [[nodiscard]] const CompressionConfig& config() const noexcept { return cfg_; }

private:
    CompressionConfig  cfg_;
    mutable std::mutex mu_;
    CompressionStats   stats_;
};

} // namespace sdwan::dataplane
