#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "shardgate/core/gateway/opcode.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace shardgate::core::gateway {
namespace schema {

// Guild member chunk request (op 8). Answered by GUILD_MEMBERS_CHUNK dispatches.
// Exactly one of query / user_ids must be provided.
struct RequestGuildMembers {
    std::uint64_t guild_id{0};
    lcr::optional<std::string> query{};
    std::uint32_t limit{0};                    // 0 = no limit (query "" only)
    lcr::optional<bool> presences{};
    std::vector<std::uint64_t> user_ids;
    lcr::optional<std::string> nonce{};        // echoed in the chunk, max 32 bytes

    [[nodiscard]]
    inline bool valid() const noexcept {
        if (guild_id == 0) return false;
        if (query.has() == !user_ids.empty()) return false;
        if (nonce.has() && nonce.value().size() > 32) return false;
        return true;
    }

    inline void write_json(std::string& out) const {
        out += "{\"op\":";
        lcr::json::append(out, static_cast<std::uint32_t>(Opcode::RequestGuildMembers));
        out += ",\"d\":{";
        lcr::json::append_key(out, "guild_id");
        out += '"';
        lcr::json::append(out, guild_id);
        out += '"';

        if (query.has()) {
            out += ',';
            lcr::json::append_key(out, "query");
            lcr::json::append_string(out, query.value());
        }

        out += ',';
        lcr::json::append_key(out, "limit");
        lcr::json::append(out, limit);

        if (presences.has()) {
            out += ',';
            lcr::json::append_key(out, "presences");
            lcr::json::append(out, presences.value());
        }

        if (!user_ids.empty()) {
            out += ',';
            lcr::json::append_key(out, "user_ids");
            out += '[';
            for (std::size_t i = 0; i < user_ids.size(); ++i) {
                if (i > 0) out += ',';
                out += '"';
                lcr::json::append(out, user_ids[i]);
                out += '"';
            }
            out += ']';
        }

        if (nonce.has()) {
            out += ',';
            lcr::json::append_key(out, "nonce");
            lcr::json::append_string(out, nonce.value());
        }

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
