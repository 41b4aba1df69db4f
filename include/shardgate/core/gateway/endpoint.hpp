#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <string>
#include <utility>

#include "lcr/optional.hpp"


namespace shardgate::core::gateway {

// Session start quota as reported by the REST "get bot gateway" call
struct SessionStartLimit {
    std::uint32_t total{1000};
    std::uint32_t remaining{1000};
    std::chrono::milliseconds reset_after{0};
    std::uint32_t max_concurrency{1};
};

struct BotGatewayInfo {
    std::string url;
    std::uint32_t shards{1};    // suggested shard count
    SessionStartLimit session_start_limit{};
};


/*
===============================================================================
EndpointProviderConcept
===============================================================================

Source of the gateway URL and sharding hints. The REST client that backs it
in production lives outside this library; any type with a
get_bot_gateway() returning lcr::optional<BotGatewayInfo> fits.

An empty optional means the endpoint could not be discovered and
Manager::connect() fails.
===============================================================================
*/
template<class P>
concept EndpointProviderConcept =
    requires(P p) {
        { p.get_bot_gateway() } -> std::same_as<lcr::optional<BotGatewayInfo>>;
    };


// Serves a fixed, pre-discovered endpoint
class StaticEndpoint {
public:
    explicit StaticEndpoint(BotGatewayInfo info)
        : info_(std::move(info))
    {}

    explicit StaticEndpoint(std::string url, std::uint32_t shards = 1, std::uint32_t max_concurrency = 1) {
        info_.url = std::move(url);
        info_.shards = shards;
        info_.session_start_limit.max_concurrency = max_concurrency;
    }

    [[nodiscard]]
    inline lcr::optional<BotGatewayInfo> get_bot_gateway() const {
        return info_;
    }

private:
    BotGatewayInfo info_;
};

static_assert(EndpointProviderConcept<StaticEndpoint>);

} // namespace shardgate::core::gateway
