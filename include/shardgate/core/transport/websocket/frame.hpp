#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "shardgate/core/config/ring_sizes.hpp"
#include "shardgate/core/transport/error.hpp"
#include "lcr/lockfree/spsc_ring.hpp"


namespace shardgate::core::transport::websocket {

/*
===============================================================================
 websocket::Frame
===============================================================================

Unit of transfer from a transport IO thread to the shard runner.

Every frame carries the ConnectionId of the transport instance that produced
it. The consumer drops frames whose id is older than its current id, so a
transport that is being torn down can never mutate a newer connection.

A transport emits any number of Text / Binary frames followed by at most one
terminal frame (Closed or Error).
===============================================================================
*/

enum class FrameKind : std::uint8_t {
    Text,
    Binary,
    Closed,   // remote CLOSE frame (close_code valid, 0 if absent)
    Error     // transport failure without a close frame (error valid)
};

[[nodiscard]]
inline constexpr std::string_view to_string(FrameKind k) noexcept {
    switch (k) {
        case FrameKind::Text:   return "Text";
        case FrameKind::Binary: return "Binary";
        case FrameKind::Closed: return "Closed";
        case FrameKind::Error:  return "Error";
        default:                return "Unknown";
    }
}

struct Frame {
    std::uint64_t connection_id{0};
    FrameKind kind{FrameKind::Text};
    std::string payload;
    std::uint16_t close_code{0};
    transport::Error error{transport::Error::None};

    [[nodiscard]]
    inline bool is_terminal() const noexcept {
        return kind == FrameKind::Closed || kind == FrameKind::Error;
    }
};

using FrameRing = lcr::lockfree::spsc_ring<Frame, config::frame_ring>;

} // namespace shardgate::core::transport::websocket
