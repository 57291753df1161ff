#pragma once
/**
 * @file icmp_probe.hpp
 * @brief Privileged ICMP echo backend (IPv4).
 */

#include <atomic>
#include <cstdint>
#include <memory>

#include "sdwan/health/probe_backend.hpp"

namespace sdwan::health {

/**
 * @class IcmpProbe
 * @brief Echo request/reply over a raw socket, one socket per probe.
 *
 * Replies are matched on source address, identifier and sequence number so
 * concurrent probes to different targets do not steal each other's answers.
 */
class IcmpProbe final : public ProbeBackend {
public:
    /**
     * @brief Check raw-socket capability and build the backend.
     * @return PermissionDenied without CAP_NET_RAW, Unavailable if raw ICMP
     *         sockets are not supported at all.
     */
    static sdwan_detail::expected<std::unique_ptr<IcmpProbe>, ProbeBackendError> open();

    ProbeStrategy strategy() const noexcept override { return ProbeStrategy::Icmp; }

    ProbeOutcome probe_once(const net::IpAddress& target,
                            std::chrono::milliseconds timeout) override;

private:
    explicit IcmpProbe(std::uint16_t ident) noexcept : ident_(ident) {}

    std::uint16_t              ident_;
    std::atomic<std::uint16_t> seq_{0};
};

} // namespace sdwan::health
