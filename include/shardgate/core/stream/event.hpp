#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "lcr/optional.hpp"


namespace shardgate::core::stream {

// Decoded dispatch as delivered to subscribers. data is the raw "d" JSON.
struct DispatchEvent {
    std::uint32_t shard_index{0};
    lcr::optional<std::int64_t> sequence{};
    std::string name;
    std::string data;
};

inline std::ostream& operator<<(std::ostream& os, const DispatchEvent& ev) {
    os << "[shard " << ev.shard_index << "] " << ev.name
       << " seq=" << lcr::to_string(ev.sequence)
       << " (" << ev.data.size() << " bytes)";
    return os;
}

} // namespace shardgate::core::stream
