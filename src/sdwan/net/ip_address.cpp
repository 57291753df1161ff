/**
 * @file ip_address.cpp
 * @brief Parsing/formatting for IpAddress, CidrNetwork and SocketAddress.
 */
#include "sdwan/net/ip_address.hpp"

#include <arpa/inet.h>
#include <charconv>
#include <cstring>

namespace sdwan::net {

IpAddress IpAddress::v4(std::uint32_t host_order) noexcept {
    IpAddress a;
    a.family_ = Family::V4;
    a.bytes_[0] = static_cast<std::uint8_t>(host_order >> 24);
    a.bytes_[1] = static_cast<std::uint8_t>(host_order >> 16);
    a.bytes_[2] = static_cast<std::uint8_t>(host_order >> 8);
    a.bytes_[3] = static_cast<std::uint8_t>(host_order);
    return a;
}

IpAddress IpAddress::v6(const std::array<std::uint8_t, 16>& bytes) noexcept {
    IpAddress a;
    a.family_ = Family::V6;
    a.bytes_  = bytes;
    return a;
}

std::optional<IpAddress> IpAddress::parse(std::string_view text) {
    if (text.empty() || text.size() > INET6_ADDRSTRLEN) return std::nullopt;
    const std::string s(text); // inet_pton needs a terminated string

    in_addr v4addr{};
    if (inet_pton(AF_INET, s.c_str(), &v4addr) == 1) {
        return IpAddress::v4(ntohl(v4addr.s_addr));
    }
    std::array<std::uint8_t, 16> raw{};
    if (inet_pton(AF_INET6, s.c_str(), raw.data()) == 1) {
        return IpAddress::v6(raw);
    }
    return std::nullopt;
}

std::uint32_t IpAddress::v4_bits() const noexcept {
    if (!is_v4()) return 0;
    return (std::uint32_t{bytes_[0]} << 24) | (std::uint32_t{bytes_[1]} << 16) |
           (std::uint32_t{bytes_[2]} << 8)  |  std::uint32_t{bytes_[3]};
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    const int af = is_v4() ? AF_INET : AF_INET6;
    if (!inet_ntop(af, bytes_.data(), buf, sizeof(buf))) return {};
    return buf;
}

std::optional<CidrNetwork> CidrNetwork::parse(std::string_view text) {
    const auto slash = text.find('/');
    const auto addr = IpAddress::parse(text.substr(0, slash));
    if (!addr) return std::nullopt;

    const std::uint8_t max_len = addr->is_v4() ? 32 : 128;
    if (slash == std::string_view::npos) {
        return CidrNetwork{*addr, max_len};
    }

    const auto len_text = text.substr(slash + 1);
    unsigned len = 0;
    const auto [ptr, ec] = std::from_chars(len_text.data(), len_text.data() + len_text.size(), len);
    if (ec != std::errc{} || ptr != len_text.data() + len_text.size() || len > max_len) {
        return std::nullopt;
    }
    return CidrNetwork{*addr, static_cast<std::uint8_t>(len)};
}

bool CidrNetwork::contains(const IpAddress& ip) const noexcept {
    if (ip.family() != addr.family()) return false;

    const auto& a = addr.bytes();
    const auto& b = ip.bytes();
    std::size_t bits = prefix_len;
    for (std::size_t i = 0; i < addr.width() && bits > 0; ++i) {
        const std::size_t take = bits >= 8 ? 8 : bits;
        const auto mask = static_cast<std::uint8_t>(0xFFu << (8 - take));
        if ((a[i] & mask) != (b[i] & mask)) return false;
        bits -= take;
    }
    return true;
}

std::string CidrNetwork::to_string() const {
    return addr.to_string() + "/" + std::to_string(prefix_len);
}

std::optional<SocketAddress> SocketAddress::parse(std::string_view text) {
    std::string_view host;
    std::string_view port_text;
    if (!text.empty() && text.front() == '[') {
        const auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return std::nullopt;
        }
        host = text.substr(1, close - 1);
        port_text = text.substr(close + 2);
    } else {
        const auto colon = text.rfind(':');
        if (colon == std::string_view::npos) return std::nullopt;
        host = text.substr(0, colon);
        port_text = text.substr(colon + 1);
    }

    const auto ip = IpAddress::parse(host);
    if (!ip) return std::nullopt;

    std::uint16_t port = 0;
    const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size()) return std::nullopt;
    return SocketAddress{*ip, port};
}

std::string SocketAddress::to_string() const {
    if (ip.is_v6()) return "[" + ip.to_string() + "]:" + std::to_string(port);
    return ip.to_string() + ":" + std::to_string(port);
}

} // namespace sdwan::net

std::size_t std::hash<sdwan::net::IpAddress>::operator()(const sdwan::net::IpAddress& a) const noexcept {
    // FNV-1a over the significant bytes plus the family tag
    std::uint64_t h = 0xcbf29ce484222325ULL;
    h ^= static_cast<std::uint8_t>(a.family());
    h *= 0x100000001b3ULL;
    for (std::size_t i = 0; i < a.width(); ++i) {
        h ^= a.bytes()[i];
        h *= 0x100000001b3ULL;
    }
    return static_cast<std::size_t>(h);
}
