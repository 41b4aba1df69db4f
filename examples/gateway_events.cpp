#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>

#include "shardgate.hpp"

#include "common/cli/gateway_params.hpp"

namespace cli = shardgate::examples::cli;
using namespace shardgate::core;
using namespace shardgate::core::gateway;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::gateway::configure(argc, argv, "shardgate - Gateway Events Example\n"
        "Connects every shard of a bot to the gateway and prints the dispatch events it receives.\n"
    );
    params.dump("=== Gateway Example Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Manager setup
    // -------------------------------------------------------------
    GatewayConfig cfg;
    cfg.shard.token = params.token;
    cfg.shard.intents = params.intents;
    cfg.shard.compress = params.compress;
    cfg.shard_count = params.shards;
    cfg.max_concurrency = params.max_concurrency;

    GatewayManager manager(cfg, StaticEndpoint(params.url, std::max<std::uint32_t>(params.shards, 1), params.max_concurrency));

    // Subscribe before connecting so READY is observed
    auto events = manager.make_events_stream();

    if (!manager.connect()) {
        return -1;
    }

    // -------------------------------------------------------------------------
    // Main loop (runs until Ctrl+C, --max-events, or every shard stopped)
    // -------------------------------------------------------------------------
    std::uint64_t received = 0;
    bool presence_sent = params.activity.empty();
    stream::DispatchEvent ev;
    while (running.load(std::memory_order_relaxed)) {
        if (!events.next_for(ev, std::chrono::milliseconds(100))) {
            if (events.finished()) {
                SG_WARN("[EXAMPLE] event stream ended (every shard stopped)");
                break;
            }
            continue;
        }
        std::cout << " -> " << ev << std::endl;
        ++received;

        if (!presence_sent && ev.name == "READY") {
            schema::PresenceUpdate presence;
            presence.activities.push_back(schema::Activity{params.activity, schema::ActivityType::Game, {}, {}});
            presence_sent = manager.update_presence(presence);
        }
        if (params.max_events != 0 && received >= params.max_events) {
            break;
        }
    }

    // -------------------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------------------
    manager.disconnect();

    for (std::uint32_t i = 0; i < manager.shard_count(); ++i) {
        std::cout << "[shard " << i << "] state=" << to_string(manager.state(i))
                  << " connection_id=" << manager.connection_id(i) << std::endl;
    }
    std::cout << "\n[shardgate] Events received: " << received << std::endl;
    std::cout << "=== Done ===\n";
    return 0;
}
