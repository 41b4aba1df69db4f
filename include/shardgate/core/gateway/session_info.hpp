#pragma once

#include <cstdint>
#include <string>

#include "lcr/optional.hpp"


namespace shardgate::core::gateway {

// Resumable session state. Owned by one ShardConnection.
struct SessionInfo {
    std::string session_id;
    lcr::optional<std::int64_t> last_sequence{};
    std::string resume_url;   // empty -> reconnect to the discovered URL

    [[nodiscard]]
    inline bool valid() const noexcept {
        return !session_id.empty();
    }

    inline void clear() noexcept {
        session_id.clear();
        last_sequence.reset();
        resume_url.clear();
    }
};

} // namespace shardgate::core::gateway
