#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "shardgate/core/config/ring_sizes.hpp"
#include "shardgate/core/gateway/config.hpp"
#include "shardgate/core/gateway/endpoint.hpp"
#include "shardgate/core/gateway/identify_limiter.hpp"
#include "shardgate/core/gateway/schema/presence_update.hpp"
#include "shardgate/core/gateway/schema/request_guild_members.hpp"
#include "shardgate/core/gateway/schema/voice_state_update.hpp"
#include "shardgate/core/gateway/shard.hpp"
#include "shardgate/core/gateway/state.hpp"
#include "shardgate/core/stream/event_stream.hpp"
#include "shardgate/core/transport/concepts.hpp"
#include "shardgate/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway {

/*
===============================================================================
 shardgate::core::gateway::Manager
===============================================================================

Owns every shard of one bot session and the identify limiter they share.

  connect()
    - discovers the endpoint through the provider
    - resolves the shard count (configured, or the provider's suggestion)
    - registers every shard with the limiter in index order, so the first
      identify wave runs in shard order within each bucket
    - starts one runner thread per shard

  disconnect()
    - stops every shard (from any state, including mid-backoff), aborts
      transport handshakes in flight, wakes whatever they block on and joins
      the runners
    - finishes the event stream

Commands are routed to the shard that owns the guild,
(guild_id >> 22) % shard_count. Presence updates go to every shard.

The event stream is finite: it ends when the manager is disconnected, or
when every shard has stopped fatally.

Backpressure: a full subscriber blocks the publishing shard's runner. While
it is blocked that shard neither reads frames nor sends heartbeats, so a
subscriber that stalls for longer than one heartbeat interval gets the
session closed by the service as a zombie (the shard then resumes). Drain
the stream at least as fast as the busiest shard produces.

The log sink given to the constructor is handed to every component the
manager builds (limiter, shards, and through them parser, codec and
transport).

A manager is single-use: once stopped it cannot be connected again.
===============================================================================
*/

template <transport::WebSocketConcept WS, EndpointProviderConcept Provider>
class Manager {
public:
    using Shard = ShardConnection<WS>;

    Manager(GatewayConfig cfg,
            Provider provider,
            lcr::log::Logger& logger = lcr::log::Logger::instance())
        : cfg_(std::move(cfg))
        , provider_(std::move(provider))
        , logger_(logger)
        , events_(cfg_.event_queue_capacity)
    {}

    ~Manager() {
        disconnect();
    }

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    [[nodiscard]]
    inline bool connect() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (stopped_.load(std::memory_order_acquire)) {
            SG_LOG(logger_, Warn, "[GATEWAY] connect() called on a stopped manager. Ignoring.");
            return false;
        }
        if (started_) {
            return true; // idempotent
        }
        // 1) Configuration
        if (auto err = validate(cfg_); err != ConfigError::None) {
            SG_LOG(logger_, Error, "[GATEWAY] invalid configuration (" << to_string(err) << ")");
            return false;
        }
        // 2) Endpoint discovery
        auto discovered = provider_.get_bot_gateway();
        if (!discovered.has()) {
            SG_LOG(logger_, Error, "[GATEWAY] gateway endpoint discovery failed");
            return false;
        }
        const BotGatewayInfo& info = discovered.value();
        transport::ParsedUrl parsed;
        if (transport::parse_url(info.url, parsed) != transport::Error::None) {
            SG_LOG(logger_, Error, "[GATEWAY] discovered gateway URL is invalid: '" << info.url << "'");
            return false;
        }
        if (!parsed.secure) {
            SG_LOG(logger_, Error, "[GATEWAY] discovered gateway URL is not wss://: '" << info.url << "'");
            return false;
        }
        // 3) Sharding
        const std::uint32_t count = (cfg_.shard_count == 0) ? info.shards : cfg_.shard_count;
        for (std::uint32_t i = 0; i < count; ++i) {
            if (validate(ShardDescriptor{i, count}) != ConfigError::None) {
                SG_LOG(logger_, Error, "[GATEWAY] invalid shard descriptor (" << i << ", " << count << ")");
                return false;
            }
        }
        if (count == 0) {
            SG_LOG(logger_, Error, "[GATEWAY] shard count resolved to 0");
            return false;
        }
        if (info.session_start_limit.remaining < count) {
            SG_LOG(logger_, Warn, "[GATEWAY] only " << info.session_start_limit.remaining
                   << " session starts remaining for " << count << " shards (resets in "
                   << info.session_start_limit.reset_after.count() << " ms)");
        }
        const std::uint32_t max_concurrency = cfg_.max_concurrency.has()
            ? cfg_.max_concurrency.value()
            : std::max<std::uint32_t>(info.session_start_limit.max_concurrency, 1);
        // 4) Shared limiter and shards
        limiter_ = std::make_unique<IdentifyRateLimiter>(max_concurrency, cfg_.identify_spacing, logger_);
        shards_.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            auto shard = std::make_unique<Shard>(ShardDescriptor{i, count}, cfg_.shard, *limiter_, events_, logger_);
            shard->set_gateway_url(info.url);
            shards_.push_back(std::move(shard));
        }
        for (std::uint32_t i = 0; i < count; ++i) {
            limiter_->enqueue(i);
        }
        // 5) Runners
        live_shards_.store(count, std::memory_order_release);
        started_.store(true, std::memory_order_release);
        runners_.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            runners_.emplace_back([this, i] { run_shard_(*shards_[i]); });
        }
        SG_LOG(logger_, Info, "[GATEWAY] started " << count << " shard(s), max_concurrency "
               << max_concurrency << ", gateway " << info.url);
        return true;
    }

    // Stops every shard and finishes the event stream. Idempotent.
    inline void disconnect() noexcept {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (stopped_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& shard : shards_) {
            shard->request_stop();
        }
        if (limiter_) {
            limiter_->wake_all();
        }
        events_.wake_producers();
        for (auto& t : runners_) {
            if (t.joinable()) {
                t.join();
            }
        }
        events_.close();
        if (started_) {
            SG_LOG(logger_, Info, "[GATEWAY] disconnected");
        }
    }

    // Decoded dispatch events from every shard. Subscribe before connect()
    // to observe READY.
    [[nodiscard]]
    inline stream::Subscription make_events_stream() {
        return events_.subscribe();
    }

    // op 8, routed to the shard owning the guild
    [[nodiscard]]
    inline bool request_guild_members(const schema::RequestGuildMembers& payload) {
        if (!payload.valid()) {
            SG_LOG(logger_, Warn, "[GATEWAY] request_guild_members: payload needs either a query or user ids");
            return false;
        }
        Shard* shard = shard_for_guild_(payload.guild_id);
        return shard && shard->enqueue_command(payload.to_json());
    }

    // op 3, broadcast to every shard
    [[nodiscard]]
    inline bool update_presence(const schema::PresenceUpdate& payload) {
        if (!running_()) {
            SG_LOG(logger_, Warn, "[GATEWAY] update_presence() called while not running. Ignoring.");
            return false;
        }
        const std::string json = payload.to_json();
        bool all = true;
        for (auto& shard : shards_) {
            all = shard->enqueue_command(json) && all;
        }
        return all;
    }

    // op 4, routed to the shard owning the guild
    [[nodiscard]]
    inline bool update_voice_state(const schema::VoiceStateUpdate& payload) {
        Shard* shard = shard_for_guild_(payload.guild_id);
        return shard && shard->enqueue_command(payload.to_json());
    }

    // Accessors (safe from any thread). shards_ is only read once started_
    // is published; connect() builds it before that.
    [[nodiscard]]
    inline std::uint32_t shard_count() const noexcept {
        return started_.load(std::memory_order_acquire) ? static_cast<std::uint32_t>(shards_.size()) : 0;
    }

    // NoSession for an unknown shard index
    [[nodiscard]]
    inline ConnectionState state(std::uint32_t shard) const noexcept {
        return shard < shard_count() ? shards_[shard]->state() : ConnectionState::NoSession;
    }

    // 0 for an unknown shard index
    [[nodiscard]]
    inline std::uint64_t connection_id(std::uint32_t shard) const noexcept {
        return shard < shard_count() ? shards_[shard]->connection_id() : 0;
    }

    [[nodiscard]]
    inline bool is_stopped() const noexcept {
        return stopped_.load(std::memory_order_acquire) || (started_ && live_shards_.load(std::memory_order_acquire) == 0);
    }

    [[nodiscard]]
    inline std::uint32_t shard_for_guild(std::uint64_t guild_id) const noexcept {
        const std::uint32_t count = shard_count();
        return count == 0 ? 0 : static_cast<std::uint32_t>((guild_id >> 22) % count);
    }

    [[nodiscard]]
    inline const IdentifyRateLimiter* limiter() const noexcept {
        return limiter_.get();
    }

    [[nodiscard]]
    inline const stream::EventStream& events() const noexcept {
        return events_;
    }

private:
    GatewayConfig cfg_;
    Provider provider_;
    lcr::log::Logger& logger_;

    stream::EventStream events_;
    std::unique_ptr<IdentifyRateLimiter> limiter_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::vector<std::thread> runners_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint32_t> live_shards_{0};

private:
    [[nodiscard]]
    inline bool running_() const noexcept {
        return started_.load(std::memory_order_acquire) && !stopped_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline Shard* shard_for_guild_(std::uint64_t guild_id) noexcept {
        if (!running_()) {
            SG_LOG(logger_, Warn, "[GATEWAY] command issued while not running. Ignoring.");
            return nullptr;
        }
        return shards_[shard_for_guild(guild_id)].get();
    }

    // Shard runner: drives one shard until it stops (disconnect or fatal close)
    inline void run_shard_(Shard& shard) noexcept {
        (void)shard.connect();
        while (shard.state() != ConnectionState::Stopped) {
            shard.poll();
            if (shard.is_idle()) {
                std::this_thread::sleep_for(config::runner_idle_sleep);
            }
        }
        // The last shard to stop finishes the stream
        if (live_shards_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            SG_LOG(logger_, Info, "[GATEWAY] all shards stopped");
            events_.close();
        }
    }
};

} // namespace shardgate::core::gateway
