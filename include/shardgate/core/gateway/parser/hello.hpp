#pragma once

#include <chrono>
#include <cstdint>

#include "shardgate/core/gateway/schema/hello.hpp"
#include "shardgate/core/gateway/parser/helpers.hpp"
#include "shardgate/core/gateway/parser/result.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway::parser::hello {

// d = {"heartbeat_interval": <ms>}
[[nodiscard]]
inline Result parse(const simdjson::dom::element& d, schema::Hello& out, lcr::log::Logger& logger) noexcept {
    std::uint64_t interval = 0;
    if (helper::parse_uint64_required(d, "heartbeat_interval", interval) != Result::Parsed) {
        SG_LOG(logger, Warn, "[PARSER] Hello: field 'heartbeat_interval' missing or invalid");
        return Result::InvalidSchema;
    }
    if (interval == 0) {
        SG_LOG(logger, Warn, "[PARSER] Hello: heartbeat_interval must be > 0");
        return Result::InvalidValue;
    }
    out.heartbeat_interval = std::chrono::milliseconds(static_cast<std::int64_t>(interval));
    return Result::Parsed;
}

} // namespace shardgate::core::gateway::parser::hello
