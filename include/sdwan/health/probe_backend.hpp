#pragma once
/**
 * @file probe_backend.hpp
 * @brief One-shot round-trip probe interface and the closed set of strategies.
 * @details The Prober owns one backend per strategy and walks the fallback
 *          chain Icmp -> Udp -> Simulated when a backend reports an error.
 *          Backends must tolerate concurrent probe_once() calls.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "sdwan/compat/expected.hpp"
#include "sdwan/net/ip_address.hpp"

namespace sdwan::health {

/**
 * @enum ProbeStrategy
 * @brief Measurement strategy, ordered from most to least capable.
 */
enum class ProbeStrategy : std::uint8_t {
    Icmp = 0,   ///< Raw-socket echo request (needs CAP_NET_RAW)
    Udp,        ///< Tagged datagram; port-unreachable counts as a reply
    Simulated   ///< Synthetic latency/loss, never errors
};

constexpr std::string_view to_string(ProbeStrategy s) noexcept {
    switch (s) {
        case ProbeStrategy::Icmp:      return "icmp";
        case ProbeStrategy::Udp:       return "udp";
        case ProbeStrategy::Simulated: return "simulated";
    }
    return "simulated";
}

constexpr std::optional<ProbeStrategy> probe_strategy_from_string(std::string_view s) noexcept {
    if (s == "icmp")      return ProbeStrategy::Icmp;
    if (s == "udp")       return ProbeStrategy::Udp;
    if (s == "simulated") return ProbeStrategy::Simulated;
    return std::nullopt;
}

/// Next strategy in the fallback chain (Simulated is terminal).
constexpr ProbeStrategy next_strategy(ProbeStrategy s) noexcept {
    switch (s) {
        case ProbeStrategy::Icmp: return ProbeStrategy::Udp;
        default:                  return ProbeStrategy::Simulated;
    }
}

/**
 * @enum ProbeBackendError
 * @brief Capability failures. Never surfaced to Prober callers.
 */
enum class ProbeBackendError : std::uint8_t {
    PermissionDenied,  ///< Raw socket refused (EPERM/EACCES)
    Unavailable,       ///< Socket family/protocol not supported here
    Transport          ///< Any other send/receive failure
};

constexpr std::string_view to_string(ProbeBackendError e) noexcept {
    switch (e) {
        case ProbeBackendError::PermissionDenied: return "permission_denied";
        case ProbeBackendError::Unavailable:      return "unavailable";
        case ProbeBackendError::Transport:        return "transport";
    }
    return "transport";
}

/**
 * @brief Outcome of a single probe.
 * @details Value = RTT in ms; std::nullopt = probe lost (timeout or simulated loss);
 *          error = the strategy itself cannot work.
 */
using ProbeOutcome = sdwan_detail::expected<std::optional<double>, ProbeBackendError>;

/**
 * @class ProbeBackend
 * @brief Sends one timed probe to a target.
 */
class ProbeBackend {
public:
    virtual ~ProbeBackend() = default;

    /// Strategy implemented by this backend.
    virtual ProbeStrategy strategy() const noexcept = 0;

    /**
     * @brief Send one probe and wait at most @p timeout for the answer.
     * @param target Destination address.
     * @param timeout Reply deadline; exceeded => lost probe (not an error).
     */
    virtual ProbeOutcome probe_once(const net::IpAddress& target,
                                    std::chrono::milliseconds timeout) = 0;
};

} // namespace sdwan::health
