#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace wirelink::core::session::telemetry {

// ============================================================================
// Controller Telemetry
//
// Observes session-level transitions and decisions.
// Mechanical facts only. Counters are bumped through WL_TL1 and stay at zero
// unless WIRELINK_ENABLE_TELEMETRY_L1 is defined.
// ============================================================================

struct alignas(64) Controller final {
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // connect() invoked by user
    lcr::metrics::atomic::counter32 connect_calls_total;

    // Transport open() succeeded (initial connect or retry)
    lcr::metrics::atomic::counter32 connect_success_total;

    // Initial transport open() failed
    lcr::metrics::atomic::counter32 connect_failure_total;

    // disconnect() invoked (explicitly or by destruction)
    lcr::metrics::atomic::counter32 disconnect_calls_total;

    // ---------------------------------------------------------------------
    // Retry mechanics
    // ---------------------------------------------------------------------

    // Reconnect attempt initiated
    lcr::metrics::atomic::counter32 retry_attempts_total;

    // Reconnect cycle ended Connected
    lcr::metrics::atomic::counter32 retry_success_total;

    // Reconnect cycle ended with the budget consumed
    lcr::metrics::atomic::counter32 retry_exhausted_total;

    // ---------------------------------------------------------------------
    // Liveness
    // ---------------------------------------------------------------------

    // Ping frames written (scheduler and send_ping())
    lcr::metrics::atomic::counter64 probes_sent_total;

    // Ping writes that failed
    lcr::metrics::atomic::counter32 probe_failures_total;

    // ---------------------------------------------------------------------
    // Traffic
    // ---------------------------------------------------------------------

    // Data frames written
    lcr::metrics::atomic::counter64 send_calls_total;

    // send() rejected (not connected, encode or write failure)
    lcr::metrics::atomic::counter64 send_rejected_total;

    // Data frames handed to the caller
    lcr::metrics::atomic::counter64 frames_received_total;

    // Ping / pong frames consumed by receive()
    lcr::metrics::atomic::counter64 control_frames_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Session Telemetry ===\n";
        os << "Lifecycle\n";
        os << "  Connect calls         : " << lcr::format_number_exact(connect_calls_total.load()) << '\n';
        os << "  Connect success       : " << lcr::format_number_exact(connect_success_total.load()) << '\n';
        os << "  Connect failure       : " << lcr::format_number_exact(connect_failure_total.load()) << '\n';
        os << "  Disconnect calls      : " << lcr::format_number_exact(disconnect_calls_total.load()) << '\n';
        os << "\nRetry\n";
        os << "  Retry attempts        : " << lcr::format_number_exact(retry_attempts_total.load()) << '\n';
        os << "  Retry success         : " << lcr::format_number_exact(retry_success_total.load()) << '\n';
        os << "  Retry exhausted       : " << lcr::format_number_exact(retry_exhausted_total.load()) << '\n';
        os << "\nLiveness\n";
        os << "  Probes sent           : " << lcr::format_number_exact(probes_sent_total.load()) << '\n';
        os << "  Probe failures        : " << lcr::format_number_exact(probe_failures_total.load()) << '\n';
        os << "\nTraffic\n";
        os << "  Sends                 : " << lcr::format_number_exact(send_calls_total.load()) << '\n';
        os << "  Sends rejected        : " << lcr::format_number_exact(send_rejected_total.load()) << '\n';
        os << "  Frames received       : " << lcr::format_number_exact(frames_received_total.load()) << '\n';
        os << "  Control frames        : " << lcr::format_number_exact(control_frames_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Controller>, "telemetry::Controller must be standard layout");
static_assert(!std::is_polymorphic_v<Controller>, "telemetry::Controller must not be polymorphic");
static_assert(alignof(Controller) == 64, "telemetry::Controller must be cache-line aligned");

} // namespace wirelink::core::session::telemetry
