#pragma once

#include <cstdint>
#include <string_view>

#include "shardgate/core/gateway/schema/ready.hpp"
#include "shardgate/core/gateway/parser/helpers.hpp"
#include "shardgate/core/gateway/parser/result.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway::parser::ready {

// Decodes the READY payload. Only the session-relevant subset is extracted;
// unknown fields are ignored.
[[nodiscard]]
inline Result parse(const simdjson::dom::element& d, schema::Ready& out, lcr::log::Logger& logger) noexcept {
    using namespace simdjson;

    if (helper::require_object(d) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: payload is not an object");
        return Result::InvalidSchema;
    }
    // v (required)
    if (helper::parse_int64_required(d, "v", out.version) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: field 'v' missing or invalid");
        return Result::InvalidSchema;
    }
    // session_id (required, non-empty)
    std::string_view sv;
    if (helper::parse_string_required(d, "session_id", sv) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: field 'session_id' missing or invalid");
        return Result::InvalidSchema;
    }
    if (sv.empty()) {
        SG_LOG(logger, Warn, "[PARSER] READY: empty 'session_id'");
        return Result::InvalidValue;
    }
    out.session_id.assign(sv.data(), sv.size());
    // resume_gateway_url (optional)
    bool present = false;
    if (helper::parse_string_nullable(d, "resume_gateway_url", sv, present) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: field 'resume_gateway_url' has wrong type");
        return Result::InvalidSchema;
    }
    if (present) {
        out.resume_gateway_url.assign(sv.data(), sv.size());
    } else {
        out.resume_gateway_url.clear();
    }
    // user {id, username} (required)
    dom::element user;
    if (helper::parse_object_required(d, "user", user) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: field 'user' missing or invalid");
        return Result::InvalidSchema;
    }
    if (helper::parse_snowflake_required(user, "id", out.user_id) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: field 'user.id' missing or invalid");
        return Result::InvalidSchema;
    }
    if (helper::parse_string_required(user, "username", sv) == Result::Parsed) {
        out.username.assign(sv.data(), sv.size());
    }
    // shard [index, count] (optional)
    dom::array shard;
    if (helper::parse_array_optional(d, "shard", shard, present) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: field 'shard' has wrong type");
        return Result::InvalidSchema;
    }
    if (present) {
        std::uint64_t values[2] = {0, 1};
        std::size_t n = 0;
        for (auto v : shard) {
            if (n >= 2 || v.get(values[n])) {
                SG_LOG(logger, Warn, "[PARSER] READY: malformed 'shard' array");
                return Result::InvalidSchema;
            }
            ++n;
        }
        if (n != 2) {
            SG_LOG(logger, Warn, "[PARSER] READY: malformed 'shard' array");
            return Result::InvalidSchema;
        }
        out.shard_index = static_cast<std::uint32_t>(values[0]);
        out.shard_count = static_cast<std::uint32_t>(values[1]);
    }
    // guilds (optional)
    dom::array guilds;
    if (helper::parse_array_optional(d, "guilds", guilds, present) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] READY: field 'guilds' has wrong type");
        return Result::InvalidSchema;
    }
    out.guild_count = present ? guilds.size() : 0;
    return Result::Parsed;
}

} // namespace shardgate::core::gateway::parser::ready
