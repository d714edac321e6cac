#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>


namespace wirelink::core::config {

/*
===============================================================================
Session Defaults
===============================================================================

Compile-time defaults applied when a session::Config leaves a field unset.

All values are constants; runtime overrides go through session::Config and
are checked by Config::validate().
===============================================================================
*/

// -----------------------------------------------------------------------------
// Reconnect backoff
// -----------------------------------------------------------------------------
inline constexpr std::chrono::milliseconds DEFAULT_BASE_DELAY{2000};   // first backoff step
inline constexpr std::chrono::milliseconds DEFAULT_MAX_DELAY{60000};   // backoff ceiling
inline constexpr std::uint32_t DEFAULT_MAX_RETRIES = 3;

// -----------------------------------------------------------------------------
// Liveness
// -----------------------------------------------------------------------------
inline constexpr std::chrono::milliseconds DEFAULT_PROBE_INTERVAL{15000};

// -----------------------------------------------------------------------------
// Codec
// -----------------------------------------------------------------------------
inline constexpr std::size_t MAX_JSON_DEPTH = 512; // nesting limit for the JSON parser

} // namespace wirelink::core::config
