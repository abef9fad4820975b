#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing cumulative metric
// ---------------------------------------------------------------------------
//
// Safe to increment from any thread. Relaxed ordering: counters carry no
// synchronization meaning, they are observed for diagnostics only.
// ---------------------------------------------------------------------------
template<typename T = std::uint64_t>
struct alignas(64) counter {
    static_assert(std::is_unsigned_v<T>, "counter requires an unsigned type");

    counter() = default;

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;
    counter(counter&&) noexcept = delete;
    counter& operator=(counter&&) noexcept = delete;

    [[nodiscard]]
    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }

    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};

using counter64 = counter<std::uint64_t>;

} // namespace atomic
} // namespace metrics
} // namespace lcr
