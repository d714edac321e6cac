#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing counter, safe to bump from any thread
// ---------------------------------------------------------------------------
//
// Relaxed ordering only: values are observational and never used to publish
// other memory.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    static_assert(std::is_unsigned_v<T>, "counter requires an unsigned type");

    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    [[nodiscard]]
    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }

    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }

    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<uint32_t>;
using counter64 = counter<uint64_t>;

} // namespace atomic
} // namespace metrics
} // namespace lcr
