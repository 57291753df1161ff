/**
 * @file policy.cpp
 * @brief Application classification, rule matching and the default policy set.
 */
#include "sdwan/routing/policy.hpp"

#include <algorithm>

#include "sdwan/config/constants.hpp"

namespace sdwan::routing {

using namespace sdwan::config::constants;
using net::PROTO_TCP;
using net::PROTO_UDP;

std::string_view to_string(ApplicationClass c) noexcept {
    switch (c) {
        case ApplicationClass::VoIP:            return "voip";
        case ApplicationClass::VideoConference: return "video_conference";
        case ApplicationClass::FileTransfer:    return "file_transfer";
        case ApplicationClass::Backup:          return "backup";
        case ApplicationClass::Web:             return "web";
        case ApplicationClass::Email:           return "email";
        case ApplicationClass::Database:        return "database";
        case ApplicationClass::Other:           return "other";
    }
    return "other";
}

std::string_view to_string(PreferenceKind k) noexcept {
    switch (k) {
        case PreferenceKind::LowestLatency:    return "lowest_latency";
        case PreferenceKind::HighestBandwidth: return "highest_bandwidth";
        case PreferenceKind::LowestPacketLoss: return "lowest_packet_loss";
        case PreferenceKind::LowestCost:       return "lowest_cost";
        case PreferenceKind::Balanced:         return "balanced";
        case PreferenceKind::Custom:           return "custom";
    }
    return "balanced";
}

namespace {
constexpr bool in_range(std::uint16_t p, std::uint16_t lo, std::uint16_t hi) noexcept {
    return p >= lo && p <= hi;
}
} // namespace

ApplicationClass classify_flow(std::uint8_t protocol, std::uint16_t port) noexcept {
    const bool tcp = protocol == PROTO_TCP;
    const bool udp = protocol == PROTO_UDP;
    const bool tcp_or_udp = tcp || udp;

    // Real-time media
    if (tcp_or_udp && (port == 5060 || port == 5061)) return ApplicationClass::VoIP;   // SIP
    if (udp && in_range(port, 16384, 32767))          return ApplicationClass::VoIP;   // RTP
    if (tcp_or_udp && in_range(port, 3478, 3481))     return ApplicationClass::VideoConference; // STUN/TURN
    if (tcp_or_udp && in_range(port, 8801, 8810))     return ApplicationClass::VideoConference; // Zoom
    if (tcp_or_udp && in_range(port, 19302, 19310))   return ApplicationClass::VideoConference; // Meet

    if (!tcp) return ApplicationClass::Other;

    switch (port) {
        case 80: case 443: case 8080: case 8443:
            return ApplicationClass::Web;
        case 25: case 465: case 587: case 110: case 995: case 143: case 993:
            return ApplicationClass::Email;
        case 20: case 21: case 22: case 139: case 445:
            return ApplicationClass::FileTransfer;
        case 1433: case 3306: case 5432: case 6379: case 27017:
            return ApplicationClass::Database;
        case 873:
            return ApplicationClass::Backup; // rsync
        default:
            break;
    }
    if (in_range(port, 10000, 10999)) return ApplicationClass::Backup;
    return ApplicationClass::Other;
}

bool PolicyMatcher::matches(const net::FlowKey& flow, const MatchRules& r) noexcept {
    if (r.protocol && flow.protocol != *r.protocol) return false;
    if (r.src && !r.src->contains(flow.src_ip)) return false;
    if (r.dst && !r.dst->contains(flow.dst_ip)) return false;
    if (r.src_port && flow.src_port != *r.src_port) return false;
    if (r.dst_port_range && !in_range(flow.dst_port, r.dst_port_range->first, r.dst_port_range->second)) {
        return false;
    }
    if (!r.app_classes.empty()) {
        const auto cls = classify_flow(flow.protocol, flow.dst_port);
        if (std::find(r.app_classes.begin(), r.app_classes.end(), cls) == r.app_classes.end()) return false;
    }
    return true;
}

std::vector<RoutingPolicy> default_policies() {
    std::vector<RoutingPolicy> out;

    RoutingPolicy realtime;
    realtime.id = 1;
    realtime.name = "VoIP/Video";
    realtime.priority = POLICY_PRIO_REALTIME;
    realtime.match.app_classes = {ApplicationClass::VoIP, ApplicationClass::VideoConference};
    realtime.preference = PathPreference::custom(ScoringWeights::latency_sensitive());
    out.push_back(realtime);

    // Unreal-engine style game-server range; kept clear of the RTP range
    RoutingPolicy gaming;
    gaming.id = 2;
    gaming.name = "Gaming";
    gaming.priority = POLICY_PRIO_GAMING;
    gaming.match.protocol = PROTO_UDP;
    gaming.match.dst_port_range = std::pair<std::uint16_t, std::uint16_t>{7777, 7788};
    gaming.preference = PathPreference::of(PreferenceKind::LowestLatency);
    out.push_back(gaming);

    RoutingPolicy bulk;
    bulk.id = 3;
    bulk.name = "Bulk Transfers";
    bulk.priority = POLICY_PRIO_BULK;
    bulk.match.app_classes = {ApplicationClass::FileTransfer, ApplicationClass::Backup};
    bulk.preference = PathPreference::custom(ScoringWeights::throughput_focused());
    out.push_back(bulk);

    RoutingPolicy fallback;
    fallback.id = 4;
    fallback.name = "Default";
    fallback.priority = POLICY_PRIO_CATCH_ALL;
    fallback.preference = PathPreference::of(PreferenceKind::Balanced);
    out.push_back(fallback);

    return out;
}

} // namespace sdwan::routing
