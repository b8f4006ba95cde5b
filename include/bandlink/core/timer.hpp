#pragma once

#include <chrono>

#include "bandlink/core/clock.hpp"


namespace bandlink::core {

// -----------------------------------------------------------------------------
// Deadline
// -----------------------------------------------------------------------------
//
// A one-shot timer owned by the reactor. There is no timer thread: the owner
// checks expired(now) from its poll loop, so disarm() takes effect
// synchronously and an expired deadline can never fire after teardown.
//
class Deadline {
public:
    inline void arm(TimePoint at) noexcept {
        at_ = at;
        armed_ = true;
    }

    inline void arm_after(TimePoint now, std::chrono::milliseconds delay) noexcept {
        arm(now + delay);
    }

    inline void disarm() noexcept {
        armed_ = false;
        at_ = TimePoint{};
    }

    [[nodiscard]]
    inline bool armed() const noexcept {
        return armed_;
    }

    [[nodiscard]]
    inline bool expired(TimePoint now) const noexcept {
        return armed_ && now >= at_;
    }

    [[nodiscard]]
    inline TimePoint at() const noexcept {
        return at_;
    }

    // Zero when disarmed or already expired
    [[nodiscard]]
    inline std::chrono::milliseconds remaining(TimePoint now) const noexcept {
        if (!armed_ || now >= at_) {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(at_ - now);
    }

private:
    TimePoint at_{};
    bool armed_{false};
};

} // namespace bandlink::core
