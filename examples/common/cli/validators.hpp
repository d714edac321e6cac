#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "wirelink/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace wirelink::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::transport::ParsedUrl url;
        if (core::transport::parse_url(value, url) == core::transport::Error::None) {
            return {};
        }
        return "URL must be ws://host[:port][/path] or wss://host[:port][/path]";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Probe interval validator (milliseconds, 0 is rejected)
// -------------------------------------------------------------
inline auto probe_interval_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            if (std::stoull(value) > 0) {
                return {};
            }
            return "Probe interval must be greater than zero";
        } catch (...) {
            return "Probe interval must be a valid integer";
        }
    },
    "Probe interval validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace | debug | info | warn | error | fatal | off";
    },
    "Log level validator"
);

} // namespace wirelink::examples::cli
