#pragma once

#include <cstdint>
#include <string>

#include "shardgate/core/gateway/opcode.hpp"
#include "shardgate/core/gateway/schema/presence_update.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace shardgate::core::gateway {
namespace schema {

struct ConnectionProperties {
    std::string os{"linux"};
    std::string browser{"shardgate"};
    std::string device{"shardgate"};
};

// Session start (op 2)
struct Identify {
    std::string token;
    std::uint32_t intents{0};
    ConnectionProperties properties{};
    std::uint32_t shard_index{0};
    std::uint32_t shard_count{1};
    lcr::optional<PresenceUpdate> presence{};
    bool compress{false};
    std::uint32_t large_threshold{250};

    inline void write_json(std::string& out) const {
        out += "{\"op\":";
        lcr::json::append(out, static_cast<std::uint32_t>(Opcode::Identify));
        out += ",\"d\":{";

        lcr::json::append_key(out, "token");
        lcr::json::append_string(out, token);

        out += ',';
        lcr::json::append_key(out, "intents");
        lcr::json::append(out, intents);

        out += ',';
        lcr::json::append_key(out, "properties");
        out += '{';
        lcr::json::append_key(out, "os");
        lcr::json::append_string(out, properties.os);
        out += ',';
        lcr::json::append_key(out, "browser");
        lcr::json::append_string(out, properties.browser);
        out += ',';
        lcr::json::append_key(out, "device");
        lcr::json::append_string(out, properties.device);
        out += '}';

        out += ',';
        lcr::json::append_key(out, "shard");
        out += '[';
        lcr::json::append(out, shard_index);
        out += ',';
        lcr::json::append(out, shard_count);
        out += ']';

        if (presence.has()) {
            out += ',';
            lcr::json::append_key(out, "presence");
            presence.value().write_data_json(out);
        }

        out += ',';
        lcr::json::append_key(out, "compress");
        lcr::json::append(out, compress);

        out += ',';
        lcr::json::append_key(out, "large_threshold");
        lcr::json::append(out, large_threshold);

        out += "}}";
    }

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(256);
        write_json(out);
        return out;
    }
};

} // namespace schema
} // namespace shardgate::core::gateway
