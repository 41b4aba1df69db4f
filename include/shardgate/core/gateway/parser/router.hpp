#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "simdjson.h"

#include "shardgate/core/gateway/opcode.hpp"
#include "shardgate/core/gateway/schema/control.hpp"
#include "shardgate/core/gateway/schema/dispatch.hpp"
#include "shardgate/core/gateway/schema/hello.hpp"
#include "shardgate/core/gateway/schema/ready.hpp"
#include "shardgate/core/gateway/parser/result.hpp"
#include "shardgate/core/gateway/parser/helpers.hpp"
#include "shardgate/core/gateway/parser/hello.hpp"
#include "shardgate/core/gateway/parser/ready.hpp"
#include "shardgate/core/gateway/parser/invalid_session.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway::parser {

/*
================================================================================
Gateway Parsing Architecture
================================================================================

1) Router (envelope dispatch)
   Parses the {op, d, s, t} envelope and selects the payload parser by
   opcode (and by event name for dispatches). No field-level parsing.

2) Payload parsers (parser::hello, parser::ready, parser::invalid_session)
   Validate required vs optional fields, log actionable diagnostics and
   populate the typed structures.

3) Helpers (parser::helper)
   Strict, allocation-free JSON primitives. Never log, never throw.

Payloads are decoded lazily: a dispatch keeps "d" as minified JSON text and
only READY is decoded into a typed struct, because the session layer needs
its session id and resume URL.
================================================================================
*/

// Decoded gateway message. std::monostate means "nothing to act on".
using Message = std::variant<
    std::monostate,
    schema::Hello,
    schema::Ready,
    schema::Resumed,
    schema::Dispatch,
    schema::HeartbeatRequest,
    schema::HeartbeatAck,
    schema::Reconnect,
    schema::InvalidSession
>;


class Router {
public:
    explicit Router(lcr::log::Logger& logger = lcr::log::Logger::instance()) noexcept
        : logger_(logger)
    {}

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Main entry point
    [[nodiscard]]
    inline Result parse(std::string_view raw_msg, Message& out) noexcept {
        out = std::monostate{};
        // Parse JSON message
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            SG_LOG(logger_, Warn, "[PARSER] JSON parse error: " << error);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Parsed) {
            SG_LOG(logger_, Warn, "[PARSER] Envelope is not an object");
            return Result::InvalidSchema;
        }
        // op (required)
        std::int64_t op_raw = 0;
        if (helper::parse_int64_required(root, "op", op_raw) != Result::Parsed) {
            SG_LOG(logger_, Warn, "[PARSER] Envelope field 'op' missing or invalid");
            return Result::InvalidSchema;
        }
        const Opcode op = to_opcode(op_raw);
        // d (may be absent or null for control opcodes)
        simdjson::dom::element d;
        auto d_field = root["d"];
        const bool has_d = !d_field.error();
        if (has_d) {
            d = d_field.value_unsafe();
        }

        switch (op) {
            case Opcode::Dispatch:
                return parse_dispatch_(root, has_d, d, out);

            case Opcode::Hello: {
                if (!has_d) {
                    SG_LOG(logger_, Warn, "[PARSER] Hello without payload");
                    return Result::InvalidSchema;
                }
                schema::Hello hello;
                auto r = hello::parse(d, hello, logger_);
                if (r == Result::Parsed) {
                    out = hello;
                }
                return r;
            }

            case Opcode::Heartbeat:
                out = schema::HeartbeatRequest{};
                return Result::Parsed;

            case Opcode::HeartbeatAck:
                out = schema::HeartbeatAck{};
                return Result::Parsed;

            case Opcode::Reconnect:
                out = schema::Reconnect{};
                return Result::Parsed;

            case Opcode::InvalidSession: {
                schema::InvalidSession invalid;
                if (!has_d) {
                    out = invalid;
                    return Result::Parsed;
                }
                auto r = invalid_session::parse(d, invalid, logger_);
                if (r == Result::Parsed) {
                    out = invalid;
                }
                return r;
            }

            default:
                // Send-only or unknown opcodes are not expected from the service
                SG_LOG(logger_, Debug, "[PARSER] Ignoring opcode " << op_raw);
                return Result::Ignored;
        }
    }

private:
    lcr::log::Logger& logger_;

    // Underlying simdjson parser (reused across messages)
    simdjson::dom::parser parser_;

private:
    [[nodiscard]]
    inline Result parse_dispatch_(const simdjson::dom::element& root, bool has_d, const simdjson::dom::element& d, Message& out) noexcept {
        schema::Dispatch dispatch;
        // t (required for dispatches)
        std::string_view name;
        bool present = false;
        if (helper::parse_string_nullable(root, "t", name, present) != Result::Parsed || !present) {
            SG_LOG(logger_, Warn, "[PARSER] Dispatch without event name");
            return Result::InvalidSchema;
        }
        dispatch.name.assign(name.data(), name.size());
        // s (nullable)
        if (helper::parse_int64_nullable(root, "s", dispatch.sequence) != Result::Parsed) {
            SG_LOG(logger_, Warn, "[PARSER] Dispatch '" << dispatch.name << "' has invalid 's'");
            return Result::InvalidSchema;
        }
        // d kept as raw JSON text
        dispatch.data = has_d ? simdjson::minify(d) : std::string("null");

        if (dispatch.name == "READY") {
            if (!has_d) {
                SG_LOG(logger_, Warn, "[PARSER] READY without payload");
                return Result::InvalidSchema;
            }
            schema::Ready ready;
            auto r = ready::parse(d, ready, logger_);
            if (r != Result::Parsed) {
                return r;
            }
            ready.dispatch = std::move(dispatch);
            out = std::move(ready);
            return Result::Parsed;
        }
        if (dispatch.name == "RESUMED") {
            out = schema::Resumed{std::move(dispatch)};
            return Result::Parsed;
        }
        out = std::move(dispatch);
        return Result::Parsed;
    }
};

} // namespace shardgate::core::gateway::parser
