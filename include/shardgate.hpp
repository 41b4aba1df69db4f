#pragma once

/*
===============================================================================
shardgate - Public API Entry Point
===============================================================================

Resilient, sharded gateway client.

  shardgate::core::GatewayManager      connect / disconnect / commands
  shardgate::core::gateway::*          configuration, payload schemas, state
  shardgate::core::stream::*           dispatch event stream
===============================================================================
*/

#include <shardgate/core.hpp>
#include <shardgate/core/gateway/config.hpp>
#include <shardgate/core/gateway/intents.hpp>
#include <shardgate/core/gateway/parser/bot_gateway.hpp>
#include <shardgate/core/gateway/schema/presence_update.hpp>
#include <shardgate/core/gateway/schema/request_guild_members.hpp>
#include <shardgate/core/gateway/schema/voice_state_update.hpp>
#include <shardgate/core/gateway/state.hpp>
#include <shardgate/core/stream/event_stream.hpp>
