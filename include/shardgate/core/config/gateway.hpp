#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>


namespace shardgate::core::config::gateway {

/*
===============================================================================
Gateway Protocol Defaults
===============================================================================

Compile-time defaults for the gateway session layer. Runtime configuration
(GatewayConfig / ShardConfig) is initialized from these values and may
override any of them.

  - All durations are std::chrono constants
  - No magic numbers scattered across the codebase
===============================================================================
*/

// -----------------------------------------------------------------------------
// Wire protocol
// -----------------------------------------------------------------------------
inline constexpr int API_VERSION = 10;
inline constexpr std::string_view ENCODING = "json";
inline constexpr std::string_view COMPRESSION = "zlib-stream";

// Members with more than this many users are sent lazily by the service
inline constexpr std::uint32_t LARGE_THRESHOLD = 250;

// -----------------------------------------------------------------------------
// Identify rate limiting (cross-shard)
// -----------------------------------------------------------------------------
inline constexpr auto IDENTIFY_SPACING = std::chrono::milliseconds(5000);
inline constexpr std::uint32_t DEFAULT_MAX_CONCURRENCY = 1;

// -----------------------------------------------------------------------------
// Reconnection backoff (bounded exponential)
// -----------------------------------------------------------------------------
inline constexpr auto BACKOFF_BASE = std::chrono::milliseconds(1000);
inline constexpr auto BACKOFF_CAP  = std::chrono::milliseconds(60000);
inline constexpr std::uint32_t BACKOFF_FACTOR = 2;

// Attempt counter resets once Ready survived this many heartbeat intervals
inline constexpr std::uint32_t STABLE_READY_HEARTBEATS = 3;

// -----------------------------------------------------------------------------
// Liveness
// -----------------------------------------------------------------------------
// Transport open -> Hello must arrive within this window
inline constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(10);

// -----------------------------------------------------------------------------
// Outbound send budget (per connection)
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t SEND_LIMIT_PER_WINDOW    = 120;
inline constexpr auto          SEND_WINDOW              = std::chrono::seconds(60);
inline constexpr std::uint32_t SEND_RESERVED_HEARTBEATS = 3;

// -----------------------------------------------------------------------------
// Inbound limits
// -----------------------------------------------------------------------------
inline constexpr std::size_t MAX_MESSAGE_SIZE = 4u * 1024u * 1024u; // 4 MiB (decompressed)

// Upper bound of ring frames processed per poll() call
inline constexpr std::size_t MAX_FRAMES_PER_POLL = 64;

} // namespace shardgate::core::config::gateway
