#pragma once

#include <chrono>
#include <cstdint>


namespace shardgate::core::gateway {

/*
===============================================================================
 HeartbeatTimer
===============================================================================

Tracks the heartbeat schedule of one connection.

  - start() arms the first beat after an initial jitter
  - on_sent() re-arms the timer one interval ahead and clears the ack flag
  - on_ack() sets the ack flag (the only place it becomes true again)

A tick that finds the ack flag still false means the previous heartbeat was
never acknowledged within one interval: the connection is a zombie.

Poll-driven, single-threaded (owned by the shard runner).
===============================================================================
*/
class HeartbeatTimer {
public:
    using clock = std::chrono::steady_clock;

    inline void start(std::chrono::milliseconds interval,
                      std::chrono::milliseconds initial_delay,
                      clock::time_point now) noexcept {
        interval_ = interval;
        next_due_ = now + initial_delay;
        ack_received_ = true;
        missed_acks_ = 0;
        active_ = true;
    }

    inline void stop() noexcept {
        active_ = false;
    }

    [[nodiscard]]
    inline bool active() const noexcept {
        return active_;
    }

    [[nodiscard]]
    inline bool due(clock::time_point now) const noexcept {
        return active_ && now >= next_due_;
    }

    inline void on_sent(clock::time_point now) noexcept {
        ack_received_ = false;
        last_sent_ = now;
        next_due_ = now + interval_;
    }

    inline void on_ack(clock::time_point now) noexcept {
        ack_received_ = true;
        missed_acks_ = 0;
        latency_ = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_sent_);
    }

    inline void on_missed() noexcept {
        ++missed_acks_;
    }

    // Accessors
    [[nodiscard]] inline bool ack_received() const noexcept { return ack_received_; }
    [[nodiscard]] inline std::uint32_t missed_acks() const noexcept { return missed_acks_; }
    [[nodiscard]] inline std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] inline clock::time_point next_due() const noexcept { return next_due_; }
    [[nodiscard]] inline std::chrono::milliseconds latency() const noexcept { return latency_; }

#ifdef SG_UNIT_TEST
    inline void force_due() noexcept {
        next_due_ = clock::time_point{};
    }
#endif // SG_UNIT_TEST

private:
    std::chrono::milliseconds interval_{0};
    clock::time_point next_due_{};
    clock::time_point last_sent_{};
    std::chrono::milliseconds latency_{0};
    bool ack_received_{true};
    std::uint32_t missed_acks_{0};
    bool active_{false};
};

} // namespace shardgate::core::gateway
