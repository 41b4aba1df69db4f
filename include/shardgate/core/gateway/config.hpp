#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "shardgate/core/config/gateway.hpp"
#include "shardgate/core/config/ring_sizes.hpp"
#include "shardgate/core/gateway/intents.hpp"
#include "shardgate/core/gateway/schema/identify.hpp"
#include "shardgate/core/gateway/schema/presence_update.hpp"
#include "lcr/optional.hpp"


namespace shardgate::core::gateway {

// ===============================================================
// SHARD DESCRIPTOR
// ===============================================================
// (index, count) with 0 <= index < count
struct ShardDescriptor {
    std::uint32_t index{0};
    std::uint32_t count{1};

    [[nodiscard]]
    inline constexpr bool valid() const noexcept {
        return count > 0 && index < count;
    }
};


// ===============================================================
// PER-SHARD SETTINGS
// ===============================================================
struct ShardConfig {
    // Identify
    std::string token;
    std::uint32_t intents{intent::UNPRIVILEGED};
    schema::ConnectionProperties properties{};
    lcr::optional<schema::PresenceUpdate> presence{};
    bool compress{true};                        // zlib-stream transport compression
    std::uint32_t large_threshold{config::gateway::LARGE_THRESHOLD};
    int api_version{config::gateway::API_VERSION};

    // Liveness
    std::chrono::milliseconds connect_timeout{config::gateway::CONNECT_TIMEOUT};

    // Reconnection backoff
    std::chrono::milliseconds backoff_base{config::gateway::BACKOFF_BASE};
    std::chrono::milliseconds backoff_cap{config::gateway::BACKOFF_CAP};
    std::uint32_t backoff_factor{config::gateway::BACKOFF_FACTOR};
    std::uint32_t stable_ready_heartbeats{config::gateway::STABLE_READY_HEARTBEATS};

    // Outbound budget
    std::uint32_t send_limit_per_window{config::gateway::SEND_LIMIT_PER_WINDOW};
    std::chrono::milliseconds send_window{config::gateway::SEND_WINDOW};
    std::uint32_t send_reserved_heartbeats{config::gateway::SEND_RESERVED_HEARTBEATS};

    // Inbound
    std::size_t max_message_size{config::gateway::MAX_MESSAGE_SIZE};
};


// ===============================================================
// MANAGER SETTINGS
// ===============================================================
struct GatewayConfig {
    ShardConfig shard{};

    // 0 = use the count suggested by the endpoint provider
    std::uint32_t shard_count{1};

    // Minimum spacing between identifies within one concurrency bucket
    std::chrono::milliseconds identify_spacing{config::gateway::IDENTIFY_SPACING};

    // Overrides the provider's max_concurrency when set
    lcr::optional<std::uint32_t> max_concurrency{};

    // Per-subscriber event queue bound (producer blocks when full)
    std::size_t event_queue_capacity{config::event_queue};
};


// ===============================================================
// VALIDATION
// ===============================================================
enum class ConfigError : std::uint8_t {
    None = 0,
    EmptyToken,
    InvalidShardDescriptor,
    InvalidMaxConcurrency,
    InvalidBackoff,
    InvalidSendBudget,
    InvalidTimeout,
    InvalidMessageSize,
    InvalidQueueCapacity
};

[[nodiscard]]
inline constexpr std::string_view to_string(ConfigError e) noexcept {
    switch (e) {
        case ConfigError::None:                   return "None";
        case ConfigError::EmptyToken:             return "EmptyToken";
        case ConfigError::InvalidShardDescriptor: return "InvalidShardDescriptor";
        case ConfigError::InvalidMaxConcurrency:  return "InvalidMaxConcurrency";
        case ConfigError::InvalidBackoff:         return "InvalidBackoff";
        case ConfigError::InvalidSendBudget:      return "InvalidSendBudget";
        case ConfigError::InvalidTimeout:         return "InvalidTimeout";
        case ConfigError::InvalidMessageSize:     return "InvalidMessageSize";
        case ConfigError::InvalidQueueCapacity:   return "InvalidQueueCapacity";
        default:                                  return "Unknown";
    }
}

[[nodiscard]]
inline ConfigError validate(const ShardDescriptor& shard) noexcept {
    return shard.valid() ? ConfigError::None : ConfigError::InvalidShardDescriptor;
}

[[nodiscard]]
inline ConfigError validate(const ShardConfig& cfg) noexcept {
    if (cfg.token.empty()) {
        return ConfigError::EmptyToken;
    }
    if (cfg.backoff_base.count() <= 0 || cfg.backoff_cap < cfg.backoff_base || cfg.backoff_factor < 1) {
        return ConfigError::InvalidBackoff;
    }
    if (cfg.send_limit_per_window == 0 ||
        cfg.send_reserved_heartbeats >= cfg.send_limit_per_window ||
        cfg.send_window.count() <= 0) {
        return ConfigError::InvalidSendBudget;
    }
    if (cfg.connect_timeout.count() <= 0) {
        return ConfigError::InvalidTimeout;
    }
    if (cfg.max_message_size == 0) {
        return ConfigError::InvalidMessageSize;
    }
    return ConfigError::None;
}

[[nodiscard]]
inline ConfigError validate(const GatewayConfig& cfg) noexcept {
    if (auto e = validate(cfg.shard); e != ConfigError::None) {
        return e;
    }
    if (cfg.max_concurrency.has() && cfg.max_concurrency.value() == 0) {
        return ConfigError::InvalidMaxConcurrency;
    }
    if (cfg.identify_spacing.count() < 0) {
        return ConfigError::InvalidTimeout;
    }
    if (cfg.event_queue_capacity == 0) {
        return ConfigError::InvalidQueueCapacity;
    }
    return ConfigError::None;
}

} // namespace shardgate::core::gateway
