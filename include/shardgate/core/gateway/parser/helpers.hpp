#pragma once

#include <charconv>
#include <cstdint>
#include <string_view>

#include "shardgate/core/gateway/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
Gateway JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Allocation-free helpers used by the gateway parsers to extract primitive values
from simdjson DOM elements.

  • Enforce structural rules (object presence, type correctness)
  • Parse primitive field types (bool, integer, string, snowflake)
  • Distinguish absent / null / present for nullable fields

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

================================================================================
*/


namespace shardgate::core::gateway::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED FIELD (any type)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_field_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = parent[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    out = field.value_unsafe();
    return Result::Parsed;
}

// ------------------------------------------------------------
// REQUIRED OBJECT FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (parse_field_required(parent, key, out) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    return require_object(out);
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    simdjson::dom::element field;
    if (parse_field_required(obj, key, field) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_required(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    simdjson::dom::element field;
    if (parse_field_required(obj, key, field) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    simdjson::dom::element field;
    if (parse_field_required(obj, key, field) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    simdjson::dom::element field;
    if (parse_field_required(obj, key, field) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// Snowflake ids travel as decimal strings; bare integers are accepted too.
[[nodiscard]]
inline Result parse_snowflake_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    simdjson::dom::element field;
    if (parse_field_required(obj, key, field) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (!field.get(sv)) {
        if (sv.empty()) {
            return Result::InvalidValue;
        }
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
        if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
            return Result::InvalidValue;
        }
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL / NULLABLE FIELD PARSERS
// ============================================================================

// Absent or null -> out.reset()
[[nodiscard]]
inline Result parse_int64_nullable(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Parsed;
    }
    std::int64_t tmp{};
    if (field.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

// Absent or null -> present == false
[[nodiscard]]
inline Result parse_string_nullable(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    present = false;
    out = std::string_view{};
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& obj, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

} // namespace shardgate::core::gateway::parser::helper
