#pragma once

#include <cstdint>
#include <string>

#include "shardgate/core/gateway/schema/dispatch.hpp"


namespace shardgate::core::gateway {
namespace schema {

// Dispatch(READY) decoded into the fields the session layer needs.
// The full payload stays available in dispatch.data.
struct Ready {
    Dispatch dispatch;

    std::int64_t version{0};          // "v"
    std::string session_id;
    std::string resume_gateway_url;   // may be empty on older API versions
    std::uint64_t user_id{0};
    std::string username;
    std::uint32_t shard_index{0};
    std::uint32_t shard_count{1};
    std::size_t guild_count{0};       // unavailable guilds announced in READY
};

} // namespace schema
} // namespace shardgate::core::gateway
