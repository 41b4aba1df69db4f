/*
===============================================================================
WebSocketConcept
===============================================================================

Defines the minimal transport contract required by ShardConnection.

The WebSocket implementation:

  • Is constructed with the shard's frame ring, the ConnectionId it serves
    and the log sink of its shard
  • Owns its IO thread
  • Pushes every received message into the ring, tagged with its ConnectionId
  • Pushes exactly one terminal frame (Closed / Error) when the stream ends
  • Serializes outbound writes internally (send() may be called from the
    runner thread while the IO thread is reading)
  • Lets abort() cancel an in-flight connect() from another thread, which
    then returns Error::Cancelled

No callbacks.
No dynamic dispatch.

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Producer thread:
  - WebSocket IO thread (receive loop)

Consumer thread:
  - ShardConnection::poll() caller (shard runner)

connect(), send() and close() are only called by the shard runner.
abort() may be called from any thread.

===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <concepts>

#include "shardgate/core/transport/error.hpp"
#include "shardgate/core/transport/websocket/frame.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, websocket::FrameRing&, std::uint64_t, lcr::log::Logger&> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& target,
        std::string_view msg,
        std::uint16_t code
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(host, port, target) } noexcept -> std::same_as<Error>;
    { ws.close(code) } noexcept -> std::same_as<void>;
    { ws.abort() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;
};

} // namespace shardgate::core::transport
