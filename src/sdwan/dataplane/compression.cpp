/**
 * @file compression.cpp
 * @brief zlib-backed CompressionEngine.
 */
#include "sdwan/dataplane/compression.hpp"

#include <algorithm>

#include <zlib.h>

#include "sdwan/obs/log.hpp"

namespace sdwan::dataplane {

using namespace sdwan::config::constants;

CompressionEngine::CompressionEngine(CompressionConfig cfg) noexcept
    : cfg_(cfg) {
    cfg_.level = std::clamp(cfg_.level, Z_BEST_SPEED, Z_BEST_COMPRESSION);
}

sdwan_detail::expected<std::optional<std::vector<std::uint8_t>>, CompressionError>
CompressionEngine::compress(std::span<const std::uint8_t> data) {
    if (!cfg_.enabled || data.size() < cfg_.min_size) {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.skipped++;
        return std::optional<std::vector<std::uint8_t>>{};
    }

    uLongf out_len = compressBound(static_cast<uLong>(data.size()));
    std::vector<std::uint8_t> out(out_len);
    const int rc = compress2(out.data(), &out_len, data.data(), static_cast<uLong>(data.size()), cfg_.level);
    if (rc != Z_OK) {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.errors++;
        return sdwan_detail::unexpected<CompressionError>(CompressionError::CompressFailed);
    }
    out.resize(out_len);

    std::lock_guard<std::mutex> lk(mu_);
    stats_.bytes_in += data.size();
    if (out.size() < data.size()) {
        stats_.bytes_out += out.size();
        stats_.compressed++;
        return std::optional<std::vector<std::uint8_t>>{std::move(out)};
    }
    stats_.bytes_out += data.size();
    stats_.skipped++;
    return std::optional<std::vector<std::uint8_t>>{};
}

sdwan_detail::expected<std::vector<std::uint8_t>, CompressionError>
CompressionEngine::decompress(std::span<const std::uint8_t> data, std::size_t original_size) {
    if (original_size > COMPRESSION_MAX_OUTPUT) {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.errors++;
        return sdwan_detail::unexpected<CompressionError>(CompressionError::DecompressFailed);
    }

    std::vector<std::uint8_t> out(original_size);
    uLongf out_len = static_cast<uLongf>(original_size);
    const int rc = uncompress(out.data(), &out_len, data.data(), static_cast<uLong>(data.size()));
    if (rc != Z_OK) {
        // Z_BUF_ERROR covers both an oversized output and a truncated stream.
        std::lock_guard<std::mutex> lk(mu_);
        stats_.errors++;
        return sdwan_detail::unexpected<CompressionError>(CompressionError::DecompressFailed);
    }
    if (out_len != original_size) {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.errors++;
        return sdwan_detail::unexpected<CompressionError>(CompressionError::SizeMismatch);
    }
    return out;
}

CompressedPacket CompressionEngine::pack(std::span<const std::uint8_t> data) {
    auto attempt = compress(data);
    if (!attempt) {
        obs::logger()->debug("compression failed ({}), sending {} bytes uncompressed",
                             to_string(attempt.error()), data.size());
        return CompressedPacket::uncompressed(data);
    }
    if (!attempt->has_value()) return CompressedPacket::uncompressed(data);
    return CompressedPacket::compressed(std::move(**attempt), static_cast<std::uint32_t>(data.size()));
}

sdwan_detail::expected<std::vector<std::uint8_t>, CompressionError>
CompressionEngine::unpack(const CompressedPacket& pkt) {
    if (!pkt.is_compressed()) return pkt.payload();
    return decompress(pkt.payload(), pkt.original_size().value_or(0));
}

CompressionStats CompressionEngine::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stats_;
}

void CompressionEngine::reset_stats() {
    std::lock_guard<std::mutex> lk(mu_);
    stats_ = {};
}

} // namespace sdwan::dataplane
