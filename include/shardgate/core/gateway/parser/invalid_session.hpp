#pragma once

#include "shardgate/core/gateway/schema/control.hpp"
#include "shardgate/core/gateway/parser/result.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace shardgate::core::gateway::parser::invalid_session {

// d = true | false (null is treated as false)
[[nodiscard]]
inline Result parse(const simdjson::dom::element& d, schema::InvalidSession& out, lcr::log::Logger& logger) noexcept {
    if (d.is_null()) {
        out.resumable = false;
        return Result::Parsed;
    }
    bool resumable = false;
    if (d.get(resumable)) {
        SG_LOG(logger, Warn, "[PARSER] InvalidSession: payload is not a boolean");
        return Result::InvalidSchema;
    }
    out.resumable = resumable;
    return Result::Parsed;
}

} // namespace shardgate::core::gateway::parser::invalid_session
