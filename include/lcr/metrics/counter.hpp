#pragma once

#include <atomic>
#include <cstdint>
#include <type_traits>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// Cumulative counters for telemetry structs.
//
//   metrics::counter           owned by a single thread (the reactor)
//   metrics::atomic::counter   written by a backend I/O thread, read by the
//                              reactor; relaxed ordering, values are
//                              independent facts
//
// Neither is copyable: a telemetry struct copies its fields one by one through
// copy_to() so that snapshots are always explicit.
// ---------------------------------------------------------------------------
template<typename T = std::uint64_t>
struct counter {
    static_assert(std::is_unsigned_v<T>, "counters only count up");

    constexpr counter() noexcept = default;
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    [[nodiscard]] constexpr T load() const noexcept { return value_; }
    constexpr void inc(T n = 1) noexcept { value_ += n; }
    constexpr void reset() noexcept { value_ = 0; }

    constexpr void copy_to(counter& dst) const noexcept { dst.value_ = value_; }

private:
    T value_{0};
};

using counter32 = counter<std::uint32_t>;
using counter64 = counter<std::uint64_t>;


namespace atomic {

// One cache line per counter: backend threads bump them on every frame
template<typename T = std::uint64_t>
struct alignas(64) counter {
    static_assert(std::is_unsigned_v<T>, "counters only count up");

    counter() noexcept = default;
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    [[nodiscard]] T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

    void copy_to(counter& dst) const noexcept {
        dst.value_.store(load(), std::memory_order_relaxed);
    }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<std::uint32_t>;
using counter64 = counter<std::uint64_t>;

} // namespace atomic

} // namespace metrics
} // namespace lcr
