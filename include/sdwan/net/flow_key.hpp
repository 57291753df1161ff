#pragma once
/**
 * @file flow_key.hpp
 * @brief 5-tuple flow identity with a seeded avalanche hash.
 * @details Fixed size, trivially copyable; safe to use as a map key and to
 *          derive lock stripes from.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "sdwan/config/constants.hpp"
#include "sdwan/net/ip_address.hpp"

namespace sdwan::net {

/// IANA protocol numbers used by policy defaults and tests.
inline constexpr std::uint8_t PROTO_ICMP = 1;
inline constexpr std::uint8_t PROTO_TCP  = 6;
inline constexpr std::uint8_t PROTO_UDP  = 17;

/**
 * @struct FlowKey
 * @brief (src ip, dst ip, src port, dst port, protocol).
 */
struct FlowKey {
    IpAddress     src_ip{};
    IpAddress     dst_ip{};
    std::uint16_t src_port{0};
    std::uint16_t dst_port{0};
    std::uint8_t  protocol{0};

    bool operator==(const FlowKey&) const = default;
    auto operator<=>(const FlowKey&) const = default;

    /// "src:sport -> dst:dport/proto", for logs.
    [[nodiscard]] std::string to_string() const {
        return SocketAddress{src_ip, src_port}.to_string() + " -> " +
               SocketAddress{dst_ip, dst_port}.to_string() + "/" + std::to_string(protocol);
    }
};

/// splitmix64-style avalanche step.
constexpr std::uint64_t mix64(std::uint64_t x, std::uint64_t seed) noexcept {
    constexpr std::uint64_t PHI = 0x9e3779b97f4a7c15ULL;
    constexpr std::uint64_t M1  = 0xff51afd7ed558ccdULL;
    constexpr std::uint64_t M2  = 0xc4ceb9fe1a85ec53ULL;

    x ^= seed + PHI + (x << 6) + (x >> 2);
    x ^= (x >> 33); x *= M1;
    x ^= (x >> 33); x *= M2;
    x ^= (x >> 33);
    return x;
}

/**
 * @brief Hash a flow with an explicit seed.
 * @details Folds the addresses 8 bytes at a time, then ports and protocol.
 */
inline std::uint64_t flow_hash(const FlowKey& k,
                               std::uint64_t seed = config::constants::FLOW_HASH_SEED_DEFAULT) noexcept {
    auto fold_ip = [](const IpAddress& ip, std::uint64_t h) noexcept {
        const auto& b = ip.bytes();
        for (std::size_t off = 0; off < 16; off += 8) {
            std::uint64_t word = 0;
            for (std::size_t i = 0; i < 8; ++i) word = (word << 8) | b[off + i];
            h = mix64(word, h);
        }
        return mix64(static_cast<std::uint64_t>(ip.family()), h);
    };

    std::uint64_t h = seed;
    h = fold_ip(k.src_ip, h);
    h = fold_ip(k.dst_ip, h);
    const std::uint64_t tail = (std::uint64_t{k.src_port} << 24) |
                               (std::uint64_t{k.dst_port} << 8) | k.protocol;
    return mix64(tail, h);
}

} // namespace sdwan::net

template <>
struct std::hash<sdwan::net::FlowKey> {
    std::size_t operator()(const sdwan::net::FlowKey& k) const noexcept {
        return static_cast<std::size_t>(sdwan::net::flow_hash(k));
    }
};
