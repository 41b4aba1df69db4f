#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "shardgate/core/config/gateway.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway {

/*
===============================================================================
 IdentifyRateLimiter
===============================================================================

Cross-shard quota on session starts.

  - Shard i belongs to bucket (i mod max_concurrency)
  - A bucket grants at most one identify per spacing window
  - The slot frees itself when the window elapses (quota, not mutex)
  - Within a bucket, shards are served in registration (FIFO) order

Shared by reference by every shard of one manager. Internally synchronized.

Two acquisition forms:
  try_acquire(i)   non-blocking, used by poll-driven shards so heartbeats keep
                   flowing while an identify is pending
  acquire(i, stop) blocks until granted or stop becomes true

A shard that is not yet queued is appended to its bucket on the first call.
cancel() withdraws a pending request.
===============================================================================
*/
class IdentifyRateLimiter {
public:
    using clock = std::chrono::steady_clock;

    struct Grant {
        std::uint32_t shard;
        clock::time_point at;
    };

    explicit IdentifyRateLimiter(std::uint32_t max_concurrency = config::gateway::DEFAULT_MAX_CONCURRENCY,
                                 std::chrono::milliseconds spacing = config::gateway::IDENTIFY_SPACING,
                                 lcr::log::Logger& logger = lcr::log::Logger::instance())
        : spacing_(spacing)
        , buckets_(std::max<std::uint32_t>(max_concurrency, 1))
        , logger_(logger)
    {}

    IdentifyRateLimiter(const IdentifyRateLimiter&) = delete;
    IdentifyRateLimiter& operator=(const IdentifyRateLimiter&) = delete;

    [[nodiscard]]
    inline std::uint32_t max_concurrency() const noexcept {
        return static_cast<std::uint32_t>(buckets_.size());
    }

    [[nodiscard]]
    inline std::chrono::milliseconds spacing() const noexcept {
        return spacing_;
    }

    [[nodiscard]]
    inline std::uint32_t bucket_of(std::uint32_t shard) const noexcept {
        return shard % max_concurrency();
    }

    // Register a future identify request (no-op if already queued)
    inline void enqueue(std::uint32_t shard) {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue_locked_(shard);
    }

    [[nodiscard]]
    inline bool try_acquire(std::uint32_t shard) {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue_locked_(shard);
        return grant_locked_(shard, clock::now());
    }

    // Blocks until the slot is granted (true) or stop is raised (false).
    // A stopped request is withdrawn from its bucket.
    [[nodiscard]]
    inline bool acquire(std::uint32_t shard, const std::atomic<bool>& stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        enqueue_locked_(shard);
        while (!stop.load(std::memory_order_acquire)) {
            const auto now = clock::now();
            if (grant_locked_(shard, now)) {
                return true;
            }
            // Wake at the earliest possible grant time, but re-check stop regularly
            auto wake = std::min(earliest_grant_locked_(shard, now), now + STOP_CHECK_PERIOD);
            cv_.wait_until(lock, wake);
        }
        cancel_locked_(shard);
        return false;
    }

    inline void cancel(std::uint32_t shard) {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_locked_(shard);
    }

    // Wakes every blocked acquire() so it re-evaluates its stop flag
    inline void wake_all() noexcept {
        cv_.notify_all();
    }

    [[nodiscard]]
    inline std::size_t pending(std::uint32_t bucket) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bucket < buckets_.size() ? buckets_[bucket].queue.size() : 0;
    }

    // Every grant in the order it was handed out
    [[nodiscard]]
    inline std::vector<Grant> history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_;
    }

private:
    static constexpr auto STOP_CHECK_PERIOD = std::chrono::milliseconds(50);

    struct Bucket {
        std::deque<std::uint32_t> queue;
        clock::time_point last_grant{};
        bool granted_once{false};
    };

    std::chrono::milliseconds spacing_;
    std::vector<Bucket> buckets_;
    lcr::log::Logger& logger_;
    std::vector<Grant> history_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

private:
    inline void enqueue_locked_(std::uint32_t shard) {
        auto& q = buckets_[bucket_of(shard)].queue;
        if (std::find(q.begin(), q.end(), shard) == q.end()) {
            q.push_back(shard);
        }
    }

    inline void cancel_locked_(std::uint32_t shard) {
        auto& q = buckets_[bucket_of(shard)].queue;
        auto it = std::find(q.begin(), q.end(), shard);
        if (it != q.end()) {
            const bool was_front = (it == q.begin());
            q.erase(it);
            if (was_front) {
                cv_.notify_all(); // next in line may be eligible now
            }
        }
    }

    [[nodiscard]]
    inline bool grant_locked_(std::uint32_t shard, clock::time_point now) {
        auto& b = buckets_[bucket_of(shard)];
        if (b.queue.empty() || b.queue.front() != shard) {
            return false;
        }
        if (b.granted_once && now - b.last_grant < spacing_) {
            return false;
        }
        b.queue.pop_front();
        b.last_grant = now;
        b.granted_once = true;
        history_.push_back(Grant{shard, now});
        SG_LOG(logger_, Debug, "[LIMITER] identify slot granted to shard " << shard << " (bucket " << bucket_of(shard) << ")");
        cv_.notify_all();
        return true;
    }

    [[nodiscard]]
    inline clock::time_point earliest_grant_locked_(std::uint32_t shard, clock::time_point now) const {
        const auto& b = buckets_[bucket_of(shard)];
        if (!b.granted_once) {
            return now + STOP_CHECK_PERIOD;
        }
        return std::max(now, b.last_grant + spacing_);
    }
};

} // namespace shardgate::core::gateway
