#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "simdjson.h"

#include "shardgate/core/gateway/endpoint.hpp"
#include "shardgate/core/gateway/parser/helpers.hpp"
#include "shardgate/core/gateway/parser/result.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway::parser {

// Decodes the body of GET /gateway/bot:
// {"url":"wss://...","shards":N,"session_start_limit":{"total":..,"remaining":..,
//  "reset_after":..,"max_concurrency":..}}
[[nodiscard]]
inline Result parse_bot_gateway(std::string_view json, BotGatewayInfo& out,
                                lcr::log::Logger& logger = lcr::log::Logger::instance()) noexcept {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(json.data(), json.size()).get(root)) {
        SG_LOG(logger, Warn, "[PARSER] gateway/bot: invalid JSON");
        return Result::InvalidJson;
    }
    std::string_view url;
    if (helper::parse_string_required(root, "url", url) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] gateway/bot: field 'url' missing or invalid");
        return Result::InvalidSchema;
    }
    if (url.empty()) {
        return Result::InvalidValue;
    }
    std::uint64_t shards = 0;
    if (helper::parse_uint64_required(root, "shards", shards) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] gateway/bot: field 'shards' missing or invalid");
        return Result::InvalidSchema;
    }
    if (shards == 0) {
        return Result::InvalidValue;
    }
    simdjson::dom::element limit;
    if (helper::parse_object_required(root, "session_start_limit", limit) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] gateway/bot: field 'session_start_limit' missing or invalid");
        return Result::InvalidSchema;
    }
    std::uint64_t total = 0, remaining = 0, reset_after = 0, max_concurrency = 0;
    if (helper::parse_uint64_required(limit, "total", total) != Result::Parsed ||
        helper::parse_uint64_required(limit, "remaining", remaining) != Result::Parsed ||
        helper::parse_uint64_required(limit, "reset_after", reset_after) != Result::Parsed ||
        helper::parse_uint64_required(limit, "max_concurrency", max_concurrency) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] gateway/bot: malformed 'session_start_limit'");
        return Result::InvalidSchema;
    }
    if (max_concurrency == 0) {
        return Result::InvalidValue;
    }
    out.url.assign(url.data(), url.size());
    out.shards = static_cast<std::uint32_t>(shards);
    out.session_start_limit.total = static_cast<std::uint32_t>(total);
    out.session_start_limit.remaining = static_cast<std::uint32_t>(remaining);
    out.session_start_limit.reset_after = std::chrono::milliseconds(static_cast<std::int64_t>(reset_after));
    out.session_start_limit.max_concurrency = static_cast<std::uint32_t>(max_concurrency);
    return Result::Parsed;
}

} // namespace shardgate::core::gateway::parser
