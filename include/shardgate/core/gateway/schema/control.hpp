#pragma once


namespace shardgate::core::gateway {
namespace schema {

// op 1 received: the service asks for an immediate heartbeat
struct HeartbeatRequest {};

// op 11
struct HeartbeatAck {};

// op 7: reconnect and resume
struct Reconnect {};

// op 9: "d" tells whether the session may still be resumed
struct InvalidSession {
    bool resumable{false};
};

} // namespace schema
} // namespace shardgate::core::gateway
