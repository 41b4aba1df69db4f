#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

#include "shardgate/core/config/gateway.hpp"


namespace shardgate::core::gateway {

// Bounded exponential backoff: base * factor^attempt, capped.
// attempt() is the number of delays handed out since the last reset().
class Backoff {
public:
    Backoff(std::chrono::milliseconds base = config::gateway::BACKOFF_BASE,
            std::chrono::milliseconds cap = config::gateway::BACKOFF_CAP,
            std::uint32_t factor = config::gateway::BACKOFF_FACTOR) noexcept
        : base_(base)
        , cap_(cap)
        , factor_(std::max<std::uint32_t>(factor, 1))
    {}

    [[nodiscard]]
    inline std::chrono::milliseconds next_delay() noexcept {
        std::chrono::milliseconds delay = base_;
        for (std::uint32_t i = 0; i < attempt_ && delay < cap_; ++i) {
            delay *= factor_;
        }
        ++attempt_;
        return std::min(delay, cap_);
    }

    inline void reset() noexcept {
        attempt_ = 0;
    }

    [[nodiscard]]
    inline std::uint32_t attempt() const noexcept {
        return attempt_;
    }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds cap_;
    std::uint32_t factor_;
    std::uint32_t attempt_{0};
};

} // namespace shardgate::core::gateway
