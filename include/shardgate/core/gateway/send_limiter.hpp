#pragma once

#include <chrono>
#include <cstdint>

#include "shardgate/core/config/gateway.hpp"


namespace shardgate::core::gateway {

/*
===============================================================================
 SendLimiter
===============================================================================

Per-connection outbound budget: at most `limit` frames per fixed `window`.
`reserved` frames of every window can only be consumed by control traffic
(heartbeat, identify, resume), so application commands can never starve
the heartbeat.

The window opens at the first send after reset() and rolls over once it has
fully elapsed.
===============================================================================
*/
class SendLimiter {
public:
    using clock = std::chrono::steady_clock;

    enum class Lane : std::uint8_t {
        Control,   // may use the whole budget
        Command    // limited to limit - reserved
    };

    SendLimiter(std::uint32_t limit = config::gateway::SEND_LIMIT_PER_WINDOW,
                std::chrono::milliseconds window = config::gateway::SEND_WINDOW,
                std::uint32_t reserved = config::gateway::SEND_RESERVED_HEARTBEATS) noexcept
        : limit_(limit)
        , window_(window)
        , reserved_(reserved < limit ? reserved : 0)
    {}

    [[nodiscard]]
    inline bool try_acquire(Lane lane, clock::time_point now) noexcept {
        roll_(now);
        const std::uint32_t ceiling = (lane == Lane::Control) ? limit_ : limit_ - reserved_;
        if (used_ >= ceiling) {
            return false;
        }
        if (used_ == 0) {
            window_start_ = now;
        }
        ++used_;
        return true;
    }

    // Budget still available to the given lane in the current window
    [[nodiscard]]
    inline std::uint32_t remaining(Lane lane, clock::time_point now) noexcept {
        roll_(now);
        const std::uint32_t ceiling = (lane == Lane::Control) ? limit_ : limit_ - reserved_;
        return used_ >= ceiling ? 0 : ceiling - used_;
    }

    inline void reset() noexcept {
        used_ = 0;
        window_start_ = clock::time_point{};
    }

    [[nodiscard]] inline std::uint32_t used() const noexcept { return used_; }

private:
    inline void roll_(clock::time_point now) noexcept {
        if (used_ > 0 && now - window_start_ >= window_) {
            used_ = 0;
        }
    }

private:
    std::uint32_t limit_;
    std::chrono::milliseconds window_;
    std::uint32_t reserved_;
    std::uint32_t used_{0};
    clock::time_point window_start_{};
};

} // namespace shardgate::core::gateway
