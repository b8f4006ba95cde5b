#pragma once

#include <chrono>
#include <concepts>


namespace bandlink::core {

/*
===============================================================================
 Clock policy
===============================================================================

Every time-dependent component (Connection, health::Probe, RateEstimator,
ConnectionMonitor, Supervisor) reads time through a Clock policy instead of
calling std::chrono::steady_clock directly. Production code uses SteadyClock;
tests plug in a manually advanced clock so multi-second scenarios run
deterministically and instantly.

A Clock is any type with a static now() returning a steady_clock time point.
===============================================================================
*/

using TimePoint = std::chrono::steady_clock::time_point;

template<class C>
concept ClockConcept = requires {
    { C::now() } -> std::same_as<TimePoint>;
};

struct SteadyClock {
    [[nodiscard]]
    static TimePoint now() noexcept {
        return std::chrono::steady_clock::now();
    }
};
static_assert(ClockConcept<SteadyClock>);


// Milliseconds elapsed between two time points (negative if `to` precedes `from`)
[[nodiscard]]
inline std::chrono::milliseconds elapsed_ms(TimePoint from, TimePoint to) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

} // namespace bandlink::core
