#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "shardgate/core/gateway/opcode.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace shardgate::core::gateway {
namespace schema {

// Activity types accepted by bots
enum class ActivityType : std::uint8_t {
    Game      = 0,
    Streaming = 1,
    Listening = 2,
    Watching  = 3,
    Custom    = 4,
    Competing = 5
};

struct Activity {
    std::string name;
    ActivityType type{ActivityType::Game};
    lcr::optional<std::string> url{};     // Streaming only
    lcr::optional<std::string> state{};   // Custom status text

    inline void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "name");
        lcr::json::append_string(out, name);
        out += ',';
        lcr::json::append_key(out, "type");
        lcr::json::append(out, static_cast<std::uint32_t>(type));
        if (url.has()) {
            out += ',';
            lcr::json::append_key(out, "url");
            lcr::json::append_string(out, url.value());
        }
        if (state.has()) {
            out += ',';
            lcr::json::append_key(out, "state");
            lcr::json::append_string(out, state.value());
        }
        out += '}';
    }
};

enum class Status : std::uint8_t {
    Online,
    Dnd,
    Idle,
    Invisible,
    Offline
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Online:    return "online";
        case Status::Dnd:       return "dnd";
        case Status::Idle:      return "idle";
        case Status::Invisible: return "invisible";
        case Status::Offline:   return "offline";
        default:                return "online";
    }
}

// Presence payload (op 3). Also embedded in Identify.
struct PresenceUpdate {
    lcr::optional<std::int64_t> since{};   // unix ms when the client went idle
    std::vector<Activity> activities;
    Status status{Status::Online};
    bool afk{false};

    // Inner "d" object only
    inline void write_data_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "since");
        if (since.has()) {
            lcr::json::append(out, since.value());
        } else {
            out += "null";
        }
        out += ',';
        lcr::json::append_key(out, "activities");
        out += '[';
        for (std::size_t i = 0; i < activities.size(); ++i) {
            if (i > 0) out += ',';
            activities[i].write_json(out);
        }
        out += ']';
        out += ',';
        lcr::json::append_key(out, "status");
        lcr::json::append_string(out, to_string(status));
        out += ',';
        lcr::json::append_key(out, "afk");
        lcr::json::append(out, afk);
        out += '}';
    }

    inline void write_json(std::string& out) const {
        out += "{\"op\":";
        lcr::json::append(out, static_cast<std::uint32_t>(Opcode::PresenceUpdate));
        out += ",\"d\":";
        write_data_json(out);
        out += '}';
    }

    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(128);
        write_json(out);
        return out;
    }
};

} // namespace schema
} // namespace shardgate::core::gateway
