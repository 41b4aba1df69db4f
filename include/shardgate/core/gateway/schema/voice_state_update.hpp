#pragma once

#include <cstdint>
#include <string>

#include "shardgate/core/gateway/opcode.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace shardgate::core::gateway {
namespace schema {

// Join / move / leave a voice channel (op 4). An empty channel_id leaves.
// Routed to the shard owning guild_id.
struct VoiceStateUpdate {
    std::uint64_t guild_id{0};
    lcr::optional<std::uint64_t> channel_id{};
    bool self_mute{false};
    bool self_deaf{false};

    inline void write_json(std::string& out) const {
        out += "{\"op\":";
        lcr::json::append(out, static_cast<std::uint32_t>(Opcode::VoiceStateUpdate));
        out += ",\"d\":{";
        // Snowflakes travel as strings
        lcr::json::append_key(out, "guild_id");
        out += '"';
        lcr::json::append(out, guild_id);
        out += '"';
        out += ',';
        lcr::json::append_key(out, "channel_id");
        if (channel_id.has()) {
            out += '"';
            lcr::json::append(out, channel_id.value());
            out += '"';
        } else {
            out += "null";
        }
        out += ',';
        lcr::json::append_key(out, "self_mute");
        lcr::json::append(out, self_mute);
        out += ',';
        lcr::json::append_key(out, "self_deaf");
        lcr::json::append(out, self_deaf);
        out += "}}";
    }

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(128);
        write_json(out);
        return out;
    }
};

} // namespace schema
} // namespace shardgate::core::gateway
