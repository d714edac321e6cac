#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "wirelink/core/config/defaults.hpp"
#include "wirelink/core/liveness/config.hpp"
#include "wirelink/core/session/endpoint.hpp"
#include "wirelink/core/session/error.hpp"
#include "wirelink/core/transport/parse_url.hpp"


namespace wirelink::core::session {

/*
===============================================================================
 session::Config
===============================================================================

Construction parameters of a session Controller.

  address         ws:// or wss:// URL of the peer
  max_retries     reconnect attempts after a failed connection (0 = none)
  base_delay      first backoff step
  max_delay       backoff ceiling
  liveness        probe cadence; std::nullopt disables the scheduler

validate() must succeed before a Controller accepts the configuration.
===============================================================================
*/

struct Config {
    std::string address;
    std::uint32_t max_retries{config::DEFAULT_MAX_RETRIES};
    std::chrono::milliseconds base_delay{config::DEFAULT_BASE_DELAY};
    std::chrono::milliseconds max_delay{config::DEFAULT_MAX_DELAY};
    std::optional<liveness::Config> liveness{};

    [[nodiscard]]
    Endpoint endpoint() const {
        return Endpoint{address, max_retries};
    }

    [[nodiscard]]
    Error validate() const {
        if (address.empty()) {
            return Error::make(ErrorCode::InvalidConfig, "address is empty");
        }
        transport::ParsedUrl url;
        if (transport::parse_url(address, url) != transport::Error::None) {
            return Error{ErrorCode::InvalidConfig, transport::Error::InvalidUrl, 0, "malformed address: " + address};
        }
        if (base_delay <= std::chrono::milliseconds::zero()) {
            return Error::make(ErrorCode::InvalidConfig, "base_delay must be positive");
        }
        if (max_delay < base_delay) {
            return Error::make(ErrorCode::InvalidConfig, "max_delay must not be below base_delay");
        }
        if (liveness && !liveness->valid()) {
            return Error::make(ErrorCode::InvalidConfig, "probe_interval must be positive");
        }
        return Error::none();
    }
};

} // namespace wirelink::core::session
