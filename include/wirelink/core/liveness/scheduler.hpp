#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "wirelink/core/liveness/config.hpp"
#include "wirelink/core/transport/error.hpp"
#include "lcr/sync/cancellation.hpp"
#include "lcr/log/logger.hpp"


namespace wirelink::core::liveness {

/*
===============================================================================
 wirelink::core::liveness::Scheduler
===============================================================================

Periodic liveness prober.

run() blocks the calling thread and invokes probe() once per probe_interval
on a fixed cadence (tick N is due at start + N * interval, so a slow probe
does not shift later ticks). It returns only when:

  • probe() reports an error   -> that error is returned immediately
  • cancellation is requested  -> Error::Cancelled

The scheduler owns no handle. The probe closure is expected to borrow the
current handle for exactly one ping write under the caller's write lock.
It never retries and never reconnects: recovery belongs to the caller.
===============================================================================
*/

class Scheduler {
public:
    explicit Scheduler(Config cfg) noexcept
        : cfg_(cfg)
    {}

    [[nodiscard]]
    const Config& config() const noexcept { return cfg_; }

    // Probes sent successfully since construction
    [[nodiscard]]
    std::uint64_t probes_sent() const noexcept {
        return probes_sent_.load(std::memory_order_relaxed);
    }

    template <typename ProbeFn>
    [[nodiscard]]
    transport::Error run(ProbeFn&& probe, const lcr::sync::Cancellation& cancel) {
        using clock = std::chrono::steady_clock;
        auto next_tick = clock::now() + cfg_.probe_interval;
        WL_DEBUG("[LIVE] Scheduler started (interval=" << cfg_.probe_interval.count() << " ms)");
        for (;;) {
            const auto now = clock::now();
            if (next_tick > now) {
                if (cancel.wait_for(next_tick - now)) {
                    break;
                }
            }
            if (cancel.requested()) [[unlikely]] {
                break;
            }
            const transport::Error err = probe();
            if (err != transport::Error::None) {
                WL_WARN("[LIVE] Probe failed (" << err << ")");
                return err;
            }
            probes_sent_.fetch_add(1, std::memory_order_relaxed);
            WL_TRACE("[LIVE] Probe sent");
            next_tick += cfg_.probe_interval;
            // Skip ticks missed while the probe was blocked rather than bursting
            const auto after = clock::now();
            while (next_tick <= after) {
                next_tick += cfg_.probe_interval;
            }
        }
        WL_DEBUG("[LIVE] Scheduler cancelled");
        return transport::Error::Cancelled;
    }

private:
    Config cfg_;
    std::atomic<std::uint64_t> probes_sent_{0};
};

} // namespace wirelink::core::liveness
