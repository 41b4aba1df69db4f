#pragma once

#include <chrono>
#include <string_view>

namespace shardgate::core::config::transport {

// TCP connect + TLS handshake + WebSocket upgrade, combined budget
inline constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(10);

// Grace period for the closing handshake before the socket is torn down
inline constexpr auto CLOSE_TIMEOUT = std::chrono::seconds(2);

inline constexpr std::string_view USER_AGENT = "shardgate/1.0";

} // namespace shardgate::core::config::transport
