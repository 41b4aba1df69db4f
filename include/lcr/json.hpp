#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

/*
===============================================================================
 lcr::json - append-only JSON text writer primitives
===============================================================================

Schemas serialize themselves by appending into a caller-owned std::string.
No DOM, no intermediate allocations beyond the output buffer growth.

All helpers append; none of them clear the output.
===============================================================================
*/

// Appends s with JSON string escaping applied (no surrounding quotes).
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
                break;
        }
    }
}

// Allocating convenience overload (logging / tests)
inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    escape(out, s);
    return out;
}

// "s" with escaping
inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    escape(out, s);
    out += '"';
}

// Fast integer -> string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, static_cast<std::size_t>(buf + sizeof(buf) - p));
}

inline void append(std::string& out, std::int64_t value) {
    if (value < 0) {
        out += '-';
        // two's complement safe negation
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

inline void append(std::string& out, std::uint32_t value) {
    append(out, static_cast<std::uint64_t>(value));
}

inline void append(std::string& out, int value) {
    append(out, static_cast<std::int64_t>(value));
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}

// "key":
inline void append_key(std::string& out, std::string_view key) {
    out += '"';
    out += key;
    out += "\":";
}

} // namespace json
} // namespace lcr
