#pragma once

#include <chrono>

#include "wirelink/core/config/defaults.hpp"


namespace wirelink::core::liveness {

// Probe cadence for the liveness scheduler. A zero interval is rejected by
// session::Config::validate().
struct Config {
    std::chrono::milliseconds probe_interval{config::DEFAULT_PROBE_INTERVAL};

    [[nodiscard]]
    bool valid() const noexcept {
        return probe_interval > std::chrono::milliseconds::zero();
    }
};

} // namespace wirelink::core::liveness
