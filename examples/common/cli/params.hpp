#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "wirelink/core/config/defaults.hpp"
#include "wirelink/core/session/config.hpp"

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace wirelink::examples::cli {

struct Params {
    std::string url              = "ws://127.0.0.1:9001";
    std::uint32_t retries        = core::config::DEFAULT_MAX_RETRIES;
    std::uint64_t base_delay_ms  = core::config::DEFAULT_BASE_DELAY.count();
    std::uint64_t max_delay_ms   = core::config::DEFAULT_MAX_DELAY.count();
    std::uint64_t probe_interval = core::config::DEFAULT_PROBE_INTERVAL.count();
    std::uint64_t run_seconds    = 30;
    std::string log_level        = "info";

    [[nodiscard]]
    core::session::Config to_config() const {
        core::session::Config cfg;
        cfg.address = url;
        cfg.max_retries = retries;
        cfg.base_delay = std::chrono::milliseconds(base_delay_ms);
        cfg.max_delay = std::chrono::milliseconds(max_delay_ms);
        cfg.liveness = core::liveness::Config{std::chrono::milliseconds(probe_interval)};
        return cfg;
    }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL            : " << url << "\n"
           << "  Retries        : " << retries << "\n"
           << "  Base delay     : " << base_delay_ms << " ms\n"
           << "  Max delay      : " << max_delay_ms << " ms\n"
           << "  Probe interval : " << probe_interval << " ms\n"
           << "  Run time       : " << run_seconds << " s\n"
           << "  Log Level      : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "WebSocket endpoint")->check(ws_url_validator)->default_val(params.url);
    app.add_option("-r,--retries", params.retries, "Reconnect attempts after a failure (0 = none)")->default_val(params.retries);
    app.add_option("--base-delay-ms", params.base_delay_ms, "First backoff step in milliseconds")->check(CLI::PositiveNumber)->default_val(params.base_delay_ms);
    app.add_option("--max-delay-ms", params.max_delay_ms, "Backoff ceiling in milliseconds")->check(CLI::PositiveNumber)->default_val(params.max_delay_ms);
    app.add_option("-p,--probe-interval", params.probe_interval, "Liveness probe interval in milliseconds")->check(probe_interval_validator)->default_val(params.probe_interval);
    app.add_option("-t,--run-seconds", params.run_seconds, "How long to keep the session alive")->default_val(params.run_seconds);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Behavior is observable via logs.\n"
        "Point --url at any WebSocket echo server."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace wirelink::examples::cli
