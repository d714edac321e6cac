#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <condition_variable>


namespace lcr {
namespace sync {

// ---------------------------------------------------------------------------
// Cancellation - cooperative stop signal with interruptible waits
// ---------------------------------------------------------------------------
//
// request() wakes every thread blocked in wait_for(). Once requested, the
// token stays signalled until rearm() is called by the owner.
// ---------------------------------------------------------------------------
class Cancellation {
public:
    Cancellation() = default;

    Cancellation(const Cancellation&) = delete;
    Cancellation& operator=(const Cancellation&) = delete;

    void request() noexcept {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            requested_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    void rearm() noexcept {
        std::lock_guard<std::mutex> lk(mtx_);
        requested_.store(false, std::memory_order_release);
    }

    [[nodiscard]]
    bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

    // Sleeps for `timeout` unless cancelled first.
    // Returns true if the wait ended because of cancellation.
    template <typename Rep, typename Period>
    [[nodiscard]]
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [this] {
            return requested_.load(std::memory_order_acquire);
        });
    }

private:
    std::atomic<bool> requested_{false};
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
};

} // namespace sync
} // namespace lcr
