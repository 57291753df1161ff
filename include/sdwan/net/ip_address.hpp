#pragma once
/**
 * @file ip_address.hpp
 * @brief Fixed-size IPv4/IPv6 address, CIDR network and socket address value types.
 * @details No heap allocation: addresses are stored in a 16-byte array so that
 *          FlowKey stays trivially copyable and cheap to hash.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sdwan::net {

/// Address family of an IpAddress.
enum class Family : std::uint8_t { V4 = 4, V6 = 6 };

/**
 * @class IpAddress
 * @brief IPv4 or IPv6 address in network byte order.
 *
 * IPv4 addresses occupy the first four bytes; the remaining bytes are zero.
 */
class IpAddress final {
public:
    /// Unspecified IPv4 address (0.0.0.0).
    constexpr IpAddress() noexcept = default;

    /// Build an IPv4 address from its host-order 32-bit value.
    static IpAddress v4(std::uint32_t host_order) noexcept;

    /// Build an IPv6 address from 16 network-order bytes.
    static IpAddress v6(const std::array<std::uint8_t, 16>& bytes) noexcept;

    /// Parse a dotted-quad or RFC 4291 textual address. std::nullopt if malformed.
    static std::optional<IpAddress> parse(std::string_view text);

    [[nodiscard]] Family family() const noexcept { return family_; }
    [[nodiscard]] bool is_v4() const noexcept { return family_ == Family::V4; }
    [[nodiscard]] bool is_v6() const noexcept { return family_ == Family::V6; }

    /// Host-order IPv4 value (0 for IPv6 addresses).
    [[nodiscard]] std::uint32_t v4_bits() const noexcept;

    /// Raw network-order bytes (4 significant bytes for IPv4).
    [[nodiscard]] const std::array<std::uint8_t, 16>& bytes() const noexcept { return bytes_; }

    /// Number of significant bytes (4 or 16).
    [[nodiscard]] std::size_t width() const noexcept { return is_v4() ? 4u : 16u; }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const IpAddress&) const = default;
    auto operator<=>(const IpAddress&) const = default;

private:
    Family                         family_{Family::V4};
    std::array<std::uint8_t, 16>   bytes_{};
};

/**
 * @struct CidrNetwork
 * @brief Address prefix used by routing-policy match rules.
 */
struct CidrNetwork final {
    IpAddress    addr{};
    std::uint8_t prefix_len{32};

    /// Parse "a.b.c.d/nn", "x::y/nn" or a bare address (host prefix).
    static std::optional<CidrNetwork> parse(std::string_view text);

    /// True if @p ip is inside this prefix. Family mismatch never matches.
    [[nodiscard]] bool contains(const IpAddress& ip) const noexcept;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const CidrNetwork&) const = default;
};

/**
 * @struct SocketAddress
 * @brief IP address plus UDP port (host order).
 */
struct SocketAddress final {
    IpAddress     ip{};
    std::uint16_t port{0};

    /// Parse "a.b.c.d:port" or "[x::y]:port".
    static std::optional<SocketAddress> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const SocketAddress&) const = default;
};

} // namespace sdwan::net

template <>
struct std::hash<sdwan::net::IpAddress> {
    std::size_t operator()(const sdwan::net::IpAddress& a) const noexcept;
};
