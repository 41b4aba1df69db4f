#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "shardgate/core/transport/error.hpp"


namespace shardgate::core::transport {

    // Parsed URL components
    struct ParsedUrl {
        bool secure{true};    // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;     // always starts with '/'
        std::string query;    // without the leading '?', may be empty

        // HTTP request target for the upgrade request
        [[nodiscard]]
        inline std::string target() const {
            return query.empty() ? path : path + "?" + query;
        }
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws:// and wss:// with an optional query.
    // Rejects malformed inputs without attempting full RFC compliance.
    //
    // Example inputs:
    //   wss://gateway.example.com
    //   wss://gateway.example.com/?v=10&encoding=json
    //   ws://127.0.0.1:8080/gateway
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Split off query and authority
        std::string_view rest = url.substr(pos);
        std::string_view query;
        const std::size_t qmark = rest.find('?');
        if (qmark != std::string_view::npos) {
            query = rest.substr(qmark + 1);
            rest  = rest.substr(0, qmark);
        }
        const std::size_t slash = rest.find('/');
        std::string_view hostport = (slash == std::string_view::npos) ? rest : rest.substr(0, slash);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) host[:port]
        const std::size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = out.secure ? "443" : "80";
        }
        // 4) Path (default "/")
        out.path  = (slash == std::string_view::npos) ? std::string("/") : std::string(rest.substr(slash));
        out.query = std::string(query);

        // Invariants check --------------------------------
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

    // Replaces the query component of a ws/wss URL.
    // "wss://host/x?old=1" + "v=10" -> "wss://host/x?v=10"
    [[nodiscard]]
    inline std::string with_query(std::string_view url, std::string_view query) {
        const std::size_t qmark = url.find('?');
        std::string out(url.substr(0, qmark));
        const std::size_t scheme_end = out.find("://");
        const std::size_t authority = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
        if (out.find('/', authority) == std::string::npos) {
            out += '/';
        }
        if (!query.empty()) {
            out += '?';
            out += query;
        }
        return out;
    }

} // namespace shardgate::core::transport
