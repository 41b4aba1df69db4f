#pragma once

#include <cstdint>
#include <string_view>


namespace shardgate::core::gateway {

// ===============================================================
// SHARD CONNECTION STATE
// ===============================================================
// Only Ready permits application commands. Stopped is terminal.
enum class ConnectionState : std::uint8_t {
    NoSession,
    Connecting,
    Identifying,
    Resuming,
    Ready,
    Reconnecting,
    Stopped
};

[[nodiscard]]
inline constexpr std::string_view to_string(ConnectionState s) noexcept {
    switch (s) {
        case ConnectionState::NoSession:    return "NoSession";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Identifying:  return "Identifying";
        case ConnectionState::Resuming:     return "Resuming";
        case ConnectionState::Ready:        return "Ready";
        case ConnectionState::Reconnecting: return "Reconnecting";
        case ConnectionState::Stopped:      return "Stopped";
        default:                            return "Unknown";
    }
}


// ===============================================================
// FSM EVENTS
// ===============================================================
enum class Event : std::uint8_t {
    // --- User intent ---
    ConnectRequested,
    StopRequested,

    // --- Transport lifecycle ---
    TransportConnectFailed,
    TransportClosed,

    // --- Protocol ---
    HelloReceived,
    ReadyReceived,
    ResumedReceived,
    InvalidSession,
    ReconnectRequested,
    ProtocolViolation,

    // --- Liveness ---
    HelloTimeout,
    HeartbeatAckMissed,

    // --- Retry ---
    BackoffElapsed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::ConnectRequested:       return "ConnectRequested";
        case Event::StopRequested:          return "StopRequested";
        case Event::TransportConnectFailed: return "TransportConnectFailed";
        case Event::TransportClosed:        return "TransportClosed";
        case Event::HelloReceived:          return "HelloReceived";
        case Event::ReadyReceived:          return "ReadyReceived";
        case Event::ResumedReceived:        return "ResumedReceived";
        case Event::InvalidSession:         return "InvalidSession";
        case Event::ReconnectRequested:     return "ReconnectRequested";
        case Event::ProtocolViolation:      return "ProtocolViolation";
        case Event::HelloTimeout:           return "HelloTimeout";
        case Event::HeartbeatAckMissed:     return "HeartbeatAckMissed";
        case Event::BackoffElapsed:         return "BackoffElapsed";
        default:                            return "UnknownEvent";
    }
}

} // namespace shardgate::core::gateway
