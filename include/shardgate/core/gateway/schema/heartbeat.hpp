#pragma once

#include <cstdint>
#include <string>

#include "shardgate/core/gateway/opcode.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace shardgate::core::gateway {
namespace schema {

// {"op":1,"d":<last sequence or null>}
struct Heartbeat {
    lcr::optional<std::int64_t> seq{};

    inline void write_json(std::string& out) const {
        out += "{\"op\":";
        lcr::json::append(out, static_cast<std::uint32_t>(Opcode::Heartbeat));
        out += ",\"d\":";
        if (seq.has()) {
            lcr::json::append(out, seq.value());
        } else {
            out += "null";
        }
        out += '}';
    }

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(32);
        write_json(out);
        return out;
    }
};

} // namespace schema
} // namespace shardgate::core::gateway
