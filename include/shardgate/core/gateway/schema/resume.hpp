#pragma once

#include <cstdint>
#include <string>

#include "shardgate/core/gateway/opcode.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace shardgate::core::gateway {
namespace schema {

// Session reattach (op 6). seq is null when no dispatch was seen yet.
struct Resume {
    std::string token;
    std::string session_id;
    lcr::optional<std::int64_t> seq{};

    inline void write_json(std::string& out) const {
        out += "{\"op\":";
        lcr::json::append(out, static_cast<std::uint32_t>(Opcode::Resume));
        out += ",\"d\":{";
        lcr::json::append_key(out, "token");
        lcr::json::append_string(out, token);
        out += ',';
        lcr::json::append_key(out, "session_id");
        lcr::json::append_string(out, session_id);
        out += ',';
        lcr::json::append_key(out, "seq");
        if (seq.has()) {
            lcr::json::append(out, seq.value());
        } else {
            out += "null";
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
