#pragma once

#include <cstdint>
#include <string>

#include "lcr/optional.hpp"


namespace shardgate::core::gateway {
namespace schema {

// op 0. The payload is kept as raw JSON text and decoded by whoever
// understands the event type.
struct Dispatch {
    std::string name;                       // "t"
    lcr::optional<std::int64_t> sequence{}; // "s"
    std::string data;                       // "d" (minified JSON)
};

// Dispatch(RESUMED)
struct Resumed {
    Dispatch dispatch;
};

} // namespace schema
} // namespace shardgate::core::gateway
