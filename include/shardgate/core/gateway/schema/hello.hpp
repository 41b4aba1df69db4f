#pragma once

#include <chrono>


namespace shardgate::core::gateway {
namespace schema {

// op 10: first message on every connection
struct Hello {
    std::chrono::milliseconds heartbeat_interval{0};
};

} // namespace schema
} // namespace shardgate::core::gateway
