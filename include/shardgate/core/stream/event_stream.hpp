#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "shardgate/core/config/ring_sizes.hpp"
#include "shardgate/core/stream/event.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::stream {

/*
===============================================================================
 EventStream / Subscription
===============================================================================

Multi-subscriber fan-out of dispatch events with producer-blocking
backpressure.

  - Every subscriber owns a bounded FIFO (capacity fixed at construction)
  - publish() delivers one copy to every subscriber registered at that time
  - publish() blocks while ANY subscriber queue is full: the slowest
    consumer gates all producers, nothing is dropped
  - close() ends the stream: blocked producers return false, subscribers
    drain what is queued and then observe the end

Order is preserved per producer (per shard); events of different producers
interleave in publish order.

Threading:
  - publish() may be called concurrently by any number of producers
  - each Subscription is consumed by one thread
  - a Subscription may outlive the EventStream that created it
===============================================================================
*/

namespace detail {

class Hub {
public:
    explicit Hub(std::size_t capacity) noexcept
        : capacity_(capacity == 0 ? 1 : capacity)
    {}

    [[nodiscard]]
    inline std::uint64_t subscribe() {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::uint64_t id = ++last_id_;
        subscribers_.emplace(id, std::deque<DispatchEvent>{});
        return id;
    }

    inline void unsubscribe(std::uint64_t id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscribers_.erase(id);
        }
        not_full_.notify_all();
    }

    [[nodiscard]]
    inline bool publish(const DispatchEvent& ev, const std::atomic<bool>* cancel) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!closed_ && !has_space_locked_()) {
            if (cancel && cancel->load(std::memory_order_acquire)) {
                return false;
            }
            ++blocked_publishes_;
            // Periodic wake-up lets a cancel flag raised without notification be observed
            not_full_.wait_for(lock, CANCEL_CHECK_PERIOD);
        }
        if (closed_) {
            return false;
        }
        for (auto& [id, queue] : subscribers_) {
            queue.push_back(ev);
        }
        ++published_;
        lock.unlock();
        not_empty_.notify_all();
        return true;
    }

    // Blocks until an event is available (true) or the stream ended and the
    // subscriber queue is drained (false).
    [[nodiscard]]
    inline bool next(std::uint64_t id, DispatchEvent& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [&] { return closed_ || !queue_locked_(id).empty(); });
        return pop_locked_(id, out, lock);
    }

    [[nodiscard]]
    inline bool next_for(std::uint64_t id, DispatchEvent& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [&] { return closed_ || !queue_locked_(id).empty(); });
        return pop_locked_(id, out, lock);
    }

    [[nodiscard]]
    inline bool try_next(std::uint64_t id, DispatchEvent& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        return pop_locked_(id, out, lock);
    }

    // True once the stream is closed and this subscriber saw everything
    [[nodiscard]]
    inline bool finished(std::uint64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        return closed_ && (it == subscribers_.end() || it->second.empty());
    }

    inline void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    inline void wake_producers() noexcept {
        not_full_.notify_all();
    }

    [[nodiscard]] inline bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] inline std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

    [[nodiscard]] inline std::size_t queued(std::uint64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        return it == subscribers_.end() ? 0 : it->second.size();
    }

    [[nodiscard]] inline std::uint64_t published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    [[nodiscard]] inline std::uint64_t blocked_publishes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return blocked_publishes_;
    }

    [[nodiscard]] inline std::size_t capacity() const noexcept {
        return capacity_;
    }

private:
    static constexpr auto CANCEL_CHECK_PERIOD = std::chrono::milliseconds(20);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::map<std::uint64_t, std::deque<DispatchEvent>> subscribers_;
    std::uint64_t last_id_{0};
    std::uint64_t published_{0};
    std::uint64_t blocked_publishes_{0};
    bool closed_{false};

    inline static const std::deque<DispatchEvent> empty_queue_{};

private:
    [[nodiscard]]
    inline bool has_space_locked_() const noexcept {
        for (const auto& [id, queue] : subscribers_) {
            if (queue.size() >= capacity_) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]]
    inline const std::deque<DispatchEvent>& queue_locked_(std::uint64_t id) const {
        auto it = subscribers_.find(id);
        return it == subscribers_.end() ? empty_queue_ : it->second;
    }

    [[nodiscard]]
    inline bool pop_locked_(std::uint64_t id, DispatchEvent& out, std::unique_lock<std::mutex>& lock) {
        auto it = subscribers_.find(id);
        if (it == subscribers_.end() || it->second.empty()) {
            return false;
        }
        out = std::move(it->second.front());
        it->second.pop_front();
        lock.unlock();
        not_full_.notify_all();
        return true;
    }
};

} // namespace detail


// Consumer handle. Movable, not copyable. Unregisters on destruction.
class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::shared_ptr<detail::Hub> hub)
        : hub_(std::move(hub))
        , id_(hub_ ? hub_->subscribe() : 0)
    {}

    ~Subscription() {
        reset_();
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : hub_(std::move(other.hub_))
        , id_(std::exchange(other.id_, 0))
    {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset_();
            hub_ = std::move(other.hub_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    // Blocks until the next event; false once the stream has ended
    [[nodiscard]]
    inline bool next(DispatchEvent& out) {
        return hub_ && hub_->next(id_, out);
    }

    // false on timeout or end of stream (see finished())
    [[nodiscard]]
    inline bool next_for(DispatchEvent& out, std::chrono::milliseconds timeout) {
        return hub_ && hub_->next_for(id_, out, timeout);
    }

    [[nodiscard]]
    inline bool try_next(DispatchEvent& out) {
        return hub_ && hub_->try_next(id_, out);
    }

    [[nodiscard]]
    inline bool finished() const {
        return !hub_ || hub_->finished(id_);
    }

    [[nodiscard]]
    inline std::size_t queued() const {
        return hub_ ? hub_->queued(id_) : 0;
    }

    [[nodiscard]]
    inline bool valid() const noexcept {
        return static_cast<bool>(hub_);
    }

private:
    std::shared_ptr<detail::Hub> hub_;
    std::uint64_t id_{0};

    inline void reset_() noexcept {
        if (hub_) {
            hub_->unsubscribe(id_);
            hub_.reset();
        }
    }
};


// Producer side
class EventStream {
public:
    explicit EventStream(std::size_t capacity = config::event_queue)
        : hub_(std::make_shared<detail::Hub>(capacity))
    {}

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    ~EventStream() {
        hub_->close();
    }

    [[nodiscard]]
    inline Subscription subscribe() {
        return Subscription(hub_);
    }

    // Blocks while any subscriber is full. Returns false if the stream was
    // closed or cancel was raised before the event could be delivered.
    [[nodiscard]]
    inline bool publish(const DispatchEvent& ev, const std::atomic<bool>* cancel = nullptr) {
        return hub_->publish(ev, cancel);
    }

    inline void close() {
        hub_->close();
    }

    inline void wake_producers() noexcept {
        hub_->wake_producers();
    }

    [[nodiscard]] inline bool closed() const { return hub_->closed(); }
    [[nodiscard]] inline std::size_t subscriber_count() const { return hub_->subscriber_count(); }
    [[nodiscard]] inline std::uint64_t published() const { return hub_->published(); }
    [[nodiscard]] inline std::uint64_t blocked_publishes() const { return hub_->blocked_publishes(); }
    [[nodiscard]] inline std::size_t capacity() const noexcept { return hub_->capacity(); }

private:
    std::shared_ptr<detail::Hub> hub_;
};

} // namespace shardgate::core::stream
