#pragma once

#include <string_view>

namespace shardgate::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level failure classification, abstracted away from library-specific
error codes (Boost.Beast / Boost.Asio / OpenSSL).

The shard connection maps every value onto a close disposition:
  - transient failures reconnect and keep the session (Resumable)
  - ProtocolError discards the session (NonResumable)
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state
    Cancelled,        // Aborted by a local lifecycle decision

    // --- Expected termination -----------------------------------------------
    LocalShutdown,    // Closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint sent a CLOSE frame

    // --- Transient failures -------------------------------------------------
    Timeout,          // Connect / handshake / liveness deadline expired
    ConnectionFailed, // DNS, TCP connect or routing failure
    HandshakeFailed,  // TLS or WebSocket upgrade failure

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame, oversized message, corrupt compression

    // --- Unspecified failure -----------------------------------------------
    TransportFailure, // Unclassified read / write failure
};


/// Helper for logging / diagnostics
[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace shardgate::core
