#pragma once

#include <cstdint>

namespace lcr::control {

/*
================================================================================
BinaryHysteresis
================================================================================

Debounces a boolean observation into a stable on/off output.

  - Inactive -> Active after `activate_threshold` consecutive active samples
  - Active -> Inactive after `deactivate_threshold` consecutive inactive samples
  - any opposite sample restarts the pending streak

While Active with a non-zero inactive streak the output is "holding": still
Active, but the input has been off for holding_streak() samples. The streaming
detector reports that window as Degrading.

Each stable change is reported exactly once, as the Transition returned by the
observation that caused it. Single-threaded; thresholds of 0 behave as 1.

    BinaryHysteresis h{1, 2};
    auto t = h.observe(rate >= threshold);
================================================================================
*/

class BinaryHysteresis {
public:
    enum class State : std::uint8_t { Inactive, Active };
    enum class Transition : std::uint8_t { None, Activated, Deactivated };

    constexpr BinaryHysteresis(std::uint32_t activate_threshold, std::uint32_t deactivate_threshold) noexcept
        : on_after_(activate_threshold > 0 ? activate_threshold : 1)
        , off_after_(deactivate_threshold > 0 ? deactivate_threshold : 1)
    {}

    [[nodiscard]]
    constexpr Transition observe(bool active) noexcept {
        const bool agrees = (active == is_active());
        if (agrees) {
            streak_ = 0;
            return Transition::None;
        }
        if (++streak_ < (is_active() ? off_after_ : on_after_)) {
            return Transition::None;
        }
        streak_ = 0;
        state_ = active ? State::Active : State::Inactive;
        return active ? Transition::Activated : Transition::Deactivated;
    }

    [[nodiscard]] constexpr Transition on_active_signal() noexcept { return observe(true); }
    [[nodiscard]] constexpr Transition on_inactive_signal() noexcept { return observe(false); }

    [[nodiscard]] constexpr State state() const noexcept { return state_; }
    [[nodiscard]] constexpr bool is_active() const noexcept { return state_ == State::Active; }

    [[nodiscard]] constexpr bool is_holding() const noexcept { return is_active() && streak_ > 0; }

    // Consecutive inactive samples absorbed while Active
    [[nodiscard]] constexpr std::uint32_t holding_streak() const noexcept { return is_active() ? streak_ : 0; }

    [[nodiscard]] constexpr std::uint32_t activate_threshold() const noexcept { return on_after_; }
    [[nodiscard]] constexpr std::uint32_t deactivate_threshold() const noexcept { return off_after_; }

    constexpr void reset() noexcept {
        state_ = State::Inactive;
        streak_ = 0;
    }

private:
    std::uint32_t on_after_;
    std::uint32_t off_after_;
    State state_{State::Inactive};
    std::uint32_t streak_{0};   // samples disagreeing with state_
};

} // namespace lcr::control
