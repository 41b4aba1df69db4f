#pragma once

/*
================================================================================
shardgate Core - Gateway Client Composition
================================================================================

This file binds the gateway manager to its production collaborators:

    shardgate::core::GatewayManager

  - transport: Boost.Beast WebSocket over Asio TLS
  - endpoint:  StaticEndpoint (URL and sharding hints discovered elsewhere)

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

Per shard:

    [IO thread]      owned by the transport instance of the current
                     connection. Reads frames and pushes them, tagged with
                     their ConnectionId, into the shard's SPSC frame ring.
                     Never touches shard state.

    [Runner thread]  owned by the manager. Drives the shard FSM through
                     poll(): drains the ring, heartbeats, identifies,
                     reconnects and publishes dispatch events.

Shared:

    IdentifyRateLimiter   one per manager, internally synchronized
    EventStream           one per manager, producers block on a full
                          subscriber (backpressure, nothing is dropped)

Application threads consume Subscriptions and issue commands; commands are
queued on the owning shard and sent by its runner.

A different transport or endpoint source plugs in by instantiating
gateway::Manager<WS, Provider> directly. Both are checked by concepts.
================================================================================
*/

#include "shardgate/core/gateway/endpoint.hpp"
#include "shardgate/core/gateway/manager.hpp"
#include "shardgate/core/transport/beast/websocket.hpp"


namespace shardgate::core {

    using WebSocketT     = transport::beast::WebSocket;
    using GatewayManager = gateway::Manager<WebSocketT, gateway::StaticEndpoint>;

} // namespace shardgate::core
