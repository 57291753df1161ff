#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the measurement, routing and forwarding planes.
 * @details These values eliminate magic numbers from the codebase. Tunables are
 *          overridden via the config Loader; scoring weights and status thresholds
 *          are fixed deployment-wide defaults and intentionally have no config key.
 */

#include <cstddef>
#include <cstdint>

namespace sdwan::config::constants {

// =====================
// Prober Defaults
// =====================
inline constexpr uint32_t PROBE_COUNT_DEFAULT        = 5;     ///< Probes per measurement round
inline constexpr uint32_t PROBE_TIMEOUT_MS_DEFAULT   = 1000;  ///< Per-probe reply timeout
inline constexpr uint32_t PROBE_INTERVAL_MS_DEFAULT  = 200;   ///< Delay between consecutive probes
inline constexpr uint16_t PROBE_UDP_PORT_DEFAULT     = 33434; ///< Traceroute base port (nothing listens)
inline constexpr std::size_t PROBE_PAYLOAD_SIZE      = 64;    ///< Datagram/echo probe payload size (bytes)
inline constexpr char     PROBE_MAGIC[]              = "SDWAN_PATH_PROBE"; ///< Datagram probe tag

// Simulated strategy (no network reachability, e.g. test harnesses)
inline constexpr double   SIM_BASE_LATENCY_MS  = 20.0;  ///< Baseline RTT
inline constexpr double   SIM_JITTER_SPAN_MS   = 10.0;  ///< Uniform jitter span (+/- 5 ms)
inline constexpr double   SIM_LOSS_PROBABILITY = 0.05;  ///< 5% simulated loss

// =====================
// Health Scoring (0..100 sub-scores, weights sum to 1.0)
// =====================
inline constexpr double HEALTH_WEIGHT_LATENCY     = 0.3; ///< Weight of latency sub-score
inline constexpr double HEALTH_WEIGHT_JITTER      = 0.2; ///< Weight of jitter sub-score
inline constexpr double HEALTH_WEIGHT_LOSS        = 0.3; ///< Weight of loss sub-score
inline constexpr double HEALTH_WEIGHT_UTILIZATION = 0.2; ///< Weight of utilization sub-score

inline constexpr double HEALTH_UP_THRESHOLD       = 80.0; ///< score >= 80 => Up
inline constexpr double HEALTH_DEGRADED_THRESHOLD = 20.0; ///< 20 <= score < 80 => Degraded

// Liveness-session mapped scores
inline constexpr double SESSION_UP_SCORE       = 100.0;
inline constexpr double SESSION_INIT_SCORE     = 50.0;
inline constexpr double SESSION_DOWN_SCORE     = 0.0;

// =====================
// Health Monitor Defaults
// =====================
inline constexpr uint32_t HEALTH_CHECK_INTERVAL_MS_DEFAULT = 10000; ///< One tick every 10 s
inline constexpr bool     HEALTH_PERSIST_DEFAULT           = true;  ///< Write snapshots to the store
inline constexpr uint32_t HEALTH_PERSIST_INTERVAL_DEFAULT  = 6;     ///< Persist every 6th check per path
inline constexpr uint32_t HEALTH_HISTORY_ROWS_DEFAULT      = 1440;  ///< Rows kept per path by the in-memory store (24 h at 1/min)

// =====================
// Path Preference Scoring (routing)
// =====================
inline constexpr double PREF_LATENCY_CEILING_MS  = 200.0;  ///< Latency at/above which score is 0
inline constexpr double PREF_JITTER_CEILING_MS   = 50.0;   ///< Jitter at/above which score is 0
inline constexpr double PREF_BANDWIDTH_FULL_MBPS = 1000.0; ///< Bandwidth scoring 100
inline constexpr double PREF_COST_SLOPE          = 500.0;  ///< Score lost per $/GB
inline constexpr double PREF_COST_UNKNOWN_SCORE  = 50.0;   ///< Neutral score when cost is unknown

// Default policy priorities (lower = matched first)
inline constexpr uint32_t POLICY_PRIO_REALTIME   = 10;
inline constexpr uint32_t POLICY_PRIO_GAMING     = 20;
inline constexpr uint32_t POLICY_PRIO_BULK       = 50;
inline constexpr uint32_t POLICY_PRIO_CATCH_ALL  = 1000;

// =====================
// Flow Hashing
// =====================
inline constexpr uint64_t FLOW_HASH_SEED_DEFAULT = 0x5D3A11F0ULL; ///< Deterministic hash salt
inline constexpr std::size_t FLOW_LOCK_STRIPES   = 64;            ///< Per-flow serialization stripes (pow2)

// =====================
// Data Plane Defaults
// =====================
inline constexpr uint16_t DATAPLANE_BIND_PORT_DEFAULT      = 51822;
inline constexpr std::size_t DATAPLANE_MTU_DEFAULT         = 1500;
inline constexpr uint32_t DATAPLANE_RX_POLL_MS_DEFAULT     = 200;   ///< Receive-loop wakeup for stop checks
inline constexpr uint32_t DATAPLANE_RX_ERROR_BACKOFF_MS    = 100;   ///< Pause after a socket receive error
inline constexpr std::size_t DATAPLANE_RX_BUFFER_SIZE      = 65536;

// =====================
// Compression Defaults
// =====================
inline constexpr bool        COMPRESSION_ENABLED_DEFAULT  = true;
inline constexpr int         COMPRESSION_LEVEL_DEFAULT    = 1;    ///< zlib fast mode
inline constexpr std::size_t COMPRESSION_MIN_SIZE_DEFAULT = 128;  ///< Skip very small packets
inline constexpr std::size_t COMPRESSION_MAX_OUTPUT       = 10u * 1024u * 1024u; ///< Decompression ceiling

// CompressedPacket frame layout: flags(1) | original_size(4, BE) | payload_size(4, BE) | payload
inline constexpr std::size_t FRAME_HEADER_SIZE = 9;
inline constexpr uint8_t     FRAME_FLAG_COMPRESSED = 0x01;

} // namespace sdwan::config::constants
