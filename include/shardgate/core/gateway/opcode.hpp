#pragma once

#include <cstdint>
#include <string_view>


namespace shardgate::core::gateway {

// ===============================================
// GATEWAY OPCODES
// ===============================================
enum class Opcode : std::uint8_t {
    Dispatch            = 0,   // receive
    Heartbeat           = 1,   // send / receive
    Identify            = 2,   // send
    PresenceUpdate      = 3,   // send
    VoiceStateUpdate    = 4,   // send
    Resume              = 6,   // send
    Reconnect           = 7,   // receive
    RequestGuildMembers = 8,   // send
    InvalidSession      = 9,   // receive
    Hello               = 10,  // receive
    HeartbeatAck        = 11,  // receive
    Unknown             = 255
};

[[nodiscard]]
inline constexpr Opcode to_opcode(std::int64_t op) noexcept {
    switch (op) {
        case 0:  return Opcode::Dispatch;
        case 1:  return Opcode::Heartbeat;
        case 2:  return Opcode::Identify;
        case 3:  return Opcode::PresenceUpdate;
        case 4:  return Opcode::VoiceStateUpdate;
        case 6:  return Opcode::Resume;
        case 7:  return Opcode::Reconnect;
        case 8:  return Opcode::RequestGuildMembers;
        case 9:  return Opcode::InvalidSession;
        case 10: return Opcode::Hello;
        case 11: return Opcode::HeartbeatAck;
        default: return Opcode::Unknown;
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(Opcode op) noexcept {
    switch (op) {
        case Opcode::Dispatch:            return "Dispatch";
        case Opcode::Heartbeat:           return "Heartbeat";
        case Opcode::Identify:            return "Identify";
        case Opcode::PresenceUpdate:      return "PresenceUpdate";
        case Opcode::VoiceStateUpdate:    return "VoiceStateUpdate";
        case Opcode::Resume:              return "Resume";
        case Opcode::Reconnect:           return "Reconnect";
        case Opcode::RequestGuildMembers: return "RequestGuildMembers";
        case Opcode::InvalidSession:      return "InvalidSession";
        case Opcode::Hello:               return "Hello";
        case Opcode::HeartbeatAck:        return "HeartbeatAck";
        default:                          return "Unknown";
    }
}

} // namespace shardgate::core::gateway
