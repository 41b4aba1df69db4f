#pragma once

#include <chrono>
#include <cstddef>

namespace shardgate::core::config {

/*
===============================================================================
Queue and Ring Sizes
===============================================================================

  - Frame ring: transport IO thread -> shard runner (lock-free SPSC)
  - Event queue: per-subscriber bound of the event stream (producer blocks)
===============================================================================
*/

// -----------------------------------------------------------------------------
// Transport -> shard frame ring (must be a power of two)
// -----------------------------------------------------------------------------
inline constexpr std::size_t frame_ring = 1 << 10; // 1024

// -----------------------------------------------------------------------------
// Event stream backpressure bound (per subscriber)
// -----------------------------------------------------------------------------
inline constexpr std::size_t event_queue = 1 << 8; // 256

// -----------------------------------------------------------------------------
// Shard runner idle sleep between poll() rounds
// -----------------------------------------------------------------------------
inline constexpr auto runner_idle_sleep = std::chrono::milliseconds(1);

} // namespace shardgate::core::config
