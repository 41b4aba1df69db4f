#pragma once

#include <cstdint>
#include <string_view>


namespace shardgate::core::gateway::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ignored        = 0,   // Well-formed but not applicable (unknown opcode)
    InvalidJson    = 1,   // Structural failure
    InvalidSchema  = 2,   // Missing required field, type mismatch, etc.
    InvalidValue   = 3,   // Field present but semantically invalid
    Parsed         = 4    // Parsed successfully
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

} // namespace shardgate::core::gateway::parser
