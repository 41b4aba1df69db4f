#pragma once

#include <cstdint>


namespace shardgate::core::gateway {

// Gateway intent bits (subscription filter sent with Identify)
namespace intent {

inline constexpr std::uint32_t GUILDS                        = 1u << 0;
inline constexpr std::uint32_t GUILD_MEMBERS                 = 1u << 1;  // privileged
inline constexpr std::uint32_t GUILD_MODERATION              = 1u << 2;
inline constexpr std::uint32_t GUILD_EXPRESSIONS             = 1u << 3;
inline constexpr std::uint32_t GUILD_INTEGRATIONS            = 1u << 4;
inline constexpr std::uint32_t GUILD_WEBHOOKS                = 1u << 5;
inline constexpr std::uint32_t GUILD_INVITES                 = 1u << 6;
inline constexpr std::uint32_t GUILD_VOICE_STATES            = 1u << 7;
inline constexpr std::uint32_t GUILD_PRESENCES               = 1u << 8;  // privileged
inline constexpr std::uint32_t GUILD_MESSAGES                = 1u << 9;
inline constexpr std::uint32_t GUILD_MESSAGE_REACTIONS       = 1u << 10;
inline constexpr std::uint32_t GUILD_MESSAGE_TYPING          = 1u << 11;
inline constexpr std::uint32_t DIRECT_MESSAGES               = 1u << 12;
inline constexpr std::uint32_t DIRECT_MESSAGE_REACTIONS      = 1u << 13;
inline constexpr std::uint32_t DIRECT_MESSAGE_TYPING         = 1u << 14;
inline constexpr std::uint32_t MESSAGE_CONTENT               = 1u << 15; // privileged
inline constexpr std::uint32_t GUILD_SCHEDULED_EVENTS        = 1u << 16;
inline constexpr std::uint32_t AUTO_MODERATION_CONFIGURATION = 1u << 20;
inline constexpr std::uint32_t AUTO_MODERATION_EXECUTION     = 1u << 21;

inline constexpr std::uint32_t PRIVILEGED = GUILD_MEMBERS | GUILD_PRESENCES | MESSAGE_CONTENT;

// Every non-privileged intent
inline constexpr std::uint32_t UNPRIVILEGED =
    GUILDS | GUILD_MODERATION | GUILD_EXPRESSIONS | GUILD_INTEGRATIONS |
    GUILD_WEBHOOKS | GUILD_INVITES | GUILD_VOICE_STATES | GUILD_MESSAGES |
    GUILD_MESSAGE_REACTIONS | GUILD_MESSAGE_TYPING | DIRECT_MESSAGES |
    DIRECT_MESSAGE_REACTIONS | DIRECT_MESSAGE_TYPING | GUILD_SCHEDULED_EVENTS |
    AUTO_MODERATION_CONFIGURATION | AUTO_MODERATION_EXECUTION;

} // namespace intent

} // namespace shardgate::core::gateway
