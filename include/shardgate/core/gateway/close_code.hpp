#pragma once

#include <cstdint>
#include <string_view>


namespace shardgate::core::gateway {

/*
===============================================================================
 Close code classification
===============================================================================

Every way a connection can end is reduced to one of three dispositions:

  Resumable     reconnect and resume the preserved session
  NonResumable  reconnect with a fresh identify (session discarded)
  Fatal         stop the shard permanently, never reconnect

Unknown codes are treated as Resumable.
===============================================================================
*/

enum class CloseDisposition : std::uint8_t {
    Resumable,
    NonResumable,
    Fatal
};

[[nodiscard]]
inline constexpr std::string_view to_string(CloseDisposition d) noexcept {
    switch (d) {
        case CloseDisposition::Resumable:    return "Resumable";
        case CloseDisposition::NonResumable: return "NonResumable";
        case CloseDisposition::Fatal:        return "Fatal";
        default:                             return "Unknown";
    }
}

namespace close_code {

// WebSocket (RFC 6455)
inline constexpr std::uint16_t NORMAL             = 1000;
inline constexpr std::uint16_t GOING_AWAY         = 1001;

// Gateway
inline constexpr std::uint16_t UNKNOWN_ERROR         = 4000;
inline constexpr std::uint16_t UNKNOWN_OPCODE        = 4001;
inline constexpr std::uint16_t DECODE_ERROR          = 4002;
inline constexpr std::uint16_t NOT_AUTHENTICATED     = 4003;
inline constexpr std::uint16_t AUTHENTICATION_FAILED = 4004;
inline constexpr std::uint16_t ALREADY_AUTHENTICATED = 4005;
inline constexpr std::uint16_t INVALID_SEQ           = 4007;
inline constexpr std::uint16_t RATE_LIMITED          = 4008;
inline constexpr std::uint16_t SESSION_TIMED_OUT     = 4009;
inline constexpr std::uint16_t INVALID_SHARD         = 4010;
inline constexpr std::uint16_t SHARDING_REQUIRED     = 4011;
inline constexpr std::uint16_t INVALID_API_VERSION   = 4012;
inline constexpr std::uint16_t INVALID_INTENTS       = 4013;
inline constexpr std::uint16_t DISALLOWED_INTENTS    = 4014;

// Code sent by the client on a locally initiated reconnect. Any non-1000/1001
// code keeps the session resumable on the service side.
inline constexpr std::uint16_t CLIENT_RESUME         = 4900;

} // namespace close_code


[[nodiscard]]
inline constexpr CloseDisposition classify(std::uint16_t code) noexcept {
    switch (code) {
        case close_code::INVALID_SEQ:
        case close_code::RATE_LIMITED:
            return CloseDisposition::NonResumable;

        case close_code::AUTHENTICATION_FAILED:
        case close_code::INVALID_SHARD:
        case close_code::SHARDING_REQUIRED:
        case close_code::INVALID_API_VERSION:
        case close_code::INVALID_INTENTS:
        case close_code::DISALLOWED_INTENTS:
            return CloseDisposition::Fatal;

        // 1000, 1001, 4000-4003, 4005, 4009 and anything unrecognized
        default:
            return CloseDisposition::Resumable;
    }
}

[[nodiscard]]
inline constexpr std::string_view describe(std::uint16_t code) noexcept {
    switch (code) {
        case close_code::NORMAL:                return "normal closure";
        case close_code::GOING_AWAY:            return "going away";
        case close_code::UNKNOWN_ERROR:         return "unknown error";
        case close_code::UNKNOWN_OPCODE:        return "unknown opcode";
        case close_code::DECODE_ERROR:          return "decode error";
        case close_code::NOT_AUTHENTICATED:     return "not authenticated";
        case close_code::AUTHENTICATION_FAILED: return "authentication failed";
        case close_code::ALREADY_AUTHENTICATED: return "already authenticated";
        case close_code::INVALID_SEQ:           return "invalid seq";
        case close_code::RATE_LIMITED:          return "rate limited";
        case close_code::SESSION_TIMED_OUT:     return "session timed out";
        case close_code::INVALID_SHARD:         return "invalid shard";
        case close_code::SHARDING_REQUIRED:     return "sharding required";
        case close_code::INVALID_API_VERSION:   return "invalid API version";
        case close_code::INVALID_INTENTS:       return "invalid intent(s)";
        case close_code::DISALLOWED_INTENTS:    return "disallowed intent(s)";
        default:                                return "unrecognized";
    }
}

} // namespace shardgate::core::gateway
