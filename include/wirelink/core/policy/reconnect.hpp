#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>

#include "wirelink/core/transport/error.hpp"
#include "wirelink/core/config/defaults.hpp"
#include "lcr/sync/cancellation.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/format.hpp"


namespace wirelink::core::policy {

/*
===============================================================================
 wirelink::core::policy::Reconnect
===============================================================================

Bounded retry schedule for re-establishing a transport connection.

Backoff law (exponential, capped):

    next_delay(k) = min(base_delay * 2^(k-1), max_delay)      k >= 1

The delay is monotonically non-decreasing in k. Attempt ordinals are 1-based;
is_exhausted(k) reports whether ordinal k is beyond the budget.

reconnect() sequences attempts and delays only. It keeps no transport state
between attempts: whatever connect_fn produces on success is captured by the
caller's closure, not by the policy.

The policy is immutable after construction and may be shared between threads.
===============================================================================
*/

enum class Result : std::uint8_t {
    Connected,   // connect_fn succeeded
    Exhausted,   // budget consumed without success
    Cancelled    // cancellation observed between attempts
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Connected: return "Connected";
        case Result::Exhausted: return "Exhausted";
        case Result::Cancelled: return "Cancelled";
        default:                return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Result r) {
    return os << to_string(r);
}

// Outcome of one reconnect cycle
struct Outcome {
    Result result{Result::Exhausted};
    std::uint32_t attempts{0};                         // connect_fn invocations in this cycle
    transport::Error last_error{transport::Error::None}; // error of the last failed attempt
    std::chrono::milliseconds waited{0};               // backoff time actually slept

    [[nodiscard]]
    bool connected() const noexcept { return result == Result::Connected; }
};

class Reconnect {
public:
    Reconnect(std::uint32_t max_attempts,
              std::chrono::milliseconds base_delay,
              std::chrono::milliseconds max_delay = config::DEFAULT_MAX_DELAY) noexcept
        : max_attempts_(max_attempts)
        , base_delay_(std::max(base_delay, std::chrono::milliseconds{0}))
        , max_delay_(std::max(max_delay, base_delay_))
    {}

    [[nodiscard]]
    std::uint32_t max_attempts() const noexcept { return max_attempts_; }

    [[nodiscard]]
    std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }

    [[nodiscard]]
    std::chrono::milliseconds max_delay() const noexcept { return max_delay_; }

    // Delay to wait after failed attempt `attempt` before the next one
    [[nodiscard]]
    std::chrono::milliseconds next_delay(std::uint32_t attempt) const noexcept {
        attempt = std::max<std::uint32_t>(attempt, 1);
        const auto base = base_delay_.count();
        if (base == 0) {
            return std::chrono::milliseconds{0};
        }
        // Saturate before shifting: 2^62 ms is far beyond any sane cap
        const std::uint32_t exponent = std::min<std::uint32_t>(attempt - 1, 62);
        const auto limit = max_delay_.count();
        if (exponent >= 62 || base > (limit >> exponent)) {
            return max_delay_;
        }
        return std::chrono::milliseconds{std::min<std::int64_t>(base << exponent, limit)};
    }

    [[nodiscard]]
    bool is_exhausted(std::uint32_t attempt) const noexcept {
        return attempt > max_attempts_;
    }

    // -------------------------------------------------------------------------
    // Drives one retry cycle.
    //
    //   connect_fn()       -> transport::Error   (None on success)
    //   on_attempt(k)      called before attempt k is made
    //
    // The first attempt runs immediately. After a failed attempt k, if k+1 is
    // within budget, the loop waits next_delay(k) on `cancel` and retries.
    // Cancellation is checked before every attempt and during every wait.
    // -------------------------------------------------------------------------
    template <typename ConnectFn, typename OnAttempt>
    [[nodiscard]]
    Outcome reconnect(ConnectFn&& connect_fn, const lcr::sync::Cancellation& cancel, OnAttempt&& on_attempt) const {
        Outcome outcome;
        for (std::uint32_t attempt = 1; !is_exhausted(attempt); ++attempt) {
            if (cancel.requested()) {
                WL_DEBUG("[RETRY] Cancelled before attempt " << attempt);
                outcome.result = Result::Cancelled;
                return outcome;
            }
            on_attempt(attempt);
            WL_INFO("[RETRY] Attempt " << attempt << " of " << max_attempts_);
            ++outcome.attempts;
            const transport::Error err = connect_fn();
            if (err == transport::Error::None) {
                WL_INFO("[RETRY] Attempt " << attempt << " succeeded");
                outcome.result = Result::Connected;
                outcome.last_error = transport::Error::None;
                return outcome;
            }
            outcome.last_error = err;
            WL_WARN("[RETRY] Attempt " << attempt << " failed (" << err << ")");
            if (is_exhausted(attempt + 1)) {
                break;
            }
            const auto delay = next_delay(attempt);
            WL_INFO("[RETRY] Next attempt in " << lcr::format_delay(delay));
            const auto started = std::chrono::steady_clock::now();
            const bool cancelled = cancel.wait_for(delay);
            outcome.waited += std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            if (cancelled) {
                WL_DEBUG("[RETRY] Cancelled during backoff after attempt " << attempt);
                outcome.result = Result::Cancelled;
                return outcome;
            }
        }
        WL_ERROR("[RETRY] Exceeded maximum reconnection attempts (" << max_attempts_ << ")");
        outcome.result = Result::Exhausted;
        return outcome;
    }

    template <typename ConnectFn>
    [[nodiscard]]
    Outcome reconnect(ConnectFn&& connect_fn, const lcr::sync::Cancellation& cancel) const {
        return reconnect(std::forward<ConnectFn>(connect_fn), cancel, [](std::uint32_t) {});
    }

private:
    std::uint32_t max_attempts_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
};

} // namespace wirelink::core::policy
