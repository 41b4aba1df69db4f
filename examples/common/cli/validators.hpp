#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace shardgate::examples::cli {

// -------------------------------------------------------------
// Gateway URL validator
// -------------------------------------------------------------
// Only wss:// is accepted: the transport always negotiates TLS
inline auto wss_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with wss://";
    },
    "Gateway URL validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "trace" || value == "debug" || value == "info" ||
            value == "warn" || value == "error" || value == "critical") {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, critical";
    },
    "Log level validator"
);

} // namespace shardgate::examples::cli
