#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "shardgate/core/gateway/intents.hpp"
#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace shardgate::examples::cli::gateway {

    // -------------------------------------------------------------
    // Gateway example parameters
    // -------------------------------------------------------------
    struct Params {
        std::string url                 = "wss://gateway.discord.gg";
        std::string token;
        std::uint32_t shards            = 1;   // 0 = as suggested by the endpoint
        std::uint32_t max_concurrency   = 1;
        std::uint32_t intents           = core::gateway::intent::UNPRIVILEGED;
        bool compress                   = true;
        std::uint64_t max_events        = 0;   // 0 = run until interrupted
        std::string activity;
        std::string log_level           = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  URL             : " << url << "\n"
               << "  Token           : " << (token.empty() ? "<missing>" : "<set>") << "\n"
               << "  Shards          : " << shards << (shards == 0 ? " (auto)" : "") << "\n"
               << "  Max concurrency : " << max_concurrency << "\n"
               << "  Intents         : " << intents << "\n"
               << "  Compression     : " << (compress ? "zlib-stream" : "none") << "\n"
               << "  Max events      : " << max_events << "\n"
               << "  Log Level       : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI for the gateway examples
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("--url", params.url, "Gateway WebSocket URL")->check(wss_url_validator)->default_val(params.url);
        app.add_option("-t,--token", params.token, "Bot token")->envname("SHARDGATE_TOKEN")->required();
        app.add_option("-n,--shards", params.shards, "Shard count (0 = auto)")->default_val(params.shards);
        app.add_option("-c,--max-concurrency", params.max_concurrency, "Identify buckets")->check(CLI::PositiveNumber)->default_val(params.max_concurrency);
        app.add_option("-i,--intents", params.intents, "Gateway intents bitmask")->default_val(params.intents);
        app.add_flag("--compress,!--no-compress", params.compress, "zlib-stream transport compression");
        app.add_option("-e,--max-events", params.max_events, "Exit after this many events (0 = never)")->default_val(params.max_events);
        app.add_option("-a,--activity", params.activity, "Set a 'Playing' activity once connected");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | critical")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "This example runs until interrupted or until --max-events is reached.\n"
            "Press Ctrl+C to disconnect every shard and exit cleanly."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);
        return params;
    }

} // namespace shardgate::examples::cli::gateway
