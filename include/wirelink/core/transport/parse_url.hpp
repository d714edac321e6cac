#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "wirelink/core/transport/error.hpp"


namespace wirelink::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;     // without IPv6 brackets
        std::string port;
        std::string target;   // path + optional query, always starts with '/'
    };


    // ---------------------------------------------------------------------
    // Minimal WebSocket URL parser supporting ws:// and wss://
    //
    // Accepts the URL shapes used by WebSocket servers and rejects malformed
    // inputs without attempting full RFC 3986 compliance. User info and
    // fragments are not supported.
    //
    // Example inputs:
    //   ws://127.0.0.1:9001
    //   wss://echo.example.org/socket?v=2
    //   ws://[::1]:8080/stream
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract authority (host[:port]) up to path or query
        std::size_t end = url.find_first_of("/?", pos);
        std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty() || hostport.find('@') != std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port (bracketed IPv6 literals allowed)
        std::string_view host;
        std::string_view port;
        if (hostport.front() == '[') {
            std::size_t close = hostport.find(']');
            if (close == std::string_view::npos) {
                return Error::InvalidUrl;
            }
            host = hostport.substr(1, close - 1);
            std::string_view rest = hostport.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') {
                    return Error::InvalidUrl;
                }
                port = rest.substr(1);
                if (port.empty()) {
                    return Error::InvalidUrl;
                }
            }
        }
        else {
            std::size_t colon = hostport.find(':');
            host = hostport.substr(0, colon);
            if (colon != std::string_view::npos) {
                port = hostport.substr(colon + 1);
                if (port.empty()) {
                    return Error::InvalidUrl;
                }
            }
        }
        out.host = std::string(host);
        out.port = port.empty() ? std::string(out.secure ? "443" : "80") : std::string(port);
        // 4) Target (default "/" if missing, "?q" becomes "/?q")
        if (end == std::string_view::npos) {
            out.target = "/";
        }
        else if (url[end] == '?') {
            out.target = "/" + std::string(url.substr(end));
        }
        else {
            out.target = std::string(url.substr(end));
        }
        if (out.target.find('#') != std::string::npos) {
            return Error::InvalidUrl;
        }

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.host) {
            if (c == ' ' || c == '/' || c == '\\') {
                return Error::InvalidUrl;
            }
        }
        // Validate port - must be numeric and in range
        if (out.port.size() > 5) {
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

} // namespace wirelink::core::transport
