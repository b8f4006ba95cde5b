#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <deque>
#include <span>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/stream/state.hpp"
#include "bandlink/core/sensor.hpp"
#include "bandlink/core/clock.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core::stream {

/*
===============================================================================
 stream::RateEstimator
===============================================================================

Per-sensor sampling rate from raw sample timestamps (device clock, seconds).

For each sensor the estimator keeps the timestamps of the samples inside the
window (default 1000 ms) ending at the newest sample:

    rate = |{ t : newest - window < t <= newest }| / window

Bursty or irregular delivery does not matter, only how many samples carry a
timestamp inside the window.

Idle decay: tick() re-evaluates every sensor against an extrapolated device
time, newest + (local_now - arrival_of_newest). A stalled stream therefore
reaches 0 within one window instead of freezing at its last value.

Buffers are bounded by the window, never by sample count.
===============================================================================
*/

template<ClockConcept Clock = SteadyClock>
class RateEstimator {
    struct Buffer {
        std::deque<double> timestamps;      // ascending
        double newest{0.0};
        TimePoint newest_arrival{};
        bool seen{false};
        double rate{0.0};
    };

public:
    explicit RateEstimator(const config::Rate& cfg = {}) noexcept
        : window_s_(std::chrono::duration<double>(cfg.window).count())
    {}

    inline void record_batch(SensorType sensor, std::span<const double> timestamps) {
        if (timestamps.empty()) {
            return;
        }
        Buffer& b = buffers_[index_of(sensor)];
        const TimePoint now = Clock::now();

        for (double ts : timestamps) {
            if (!std::isfinite(ts)) {
                continue;
            }
            ++samples_total_;
            if (b.timestamps.empty() || ts >= b.timestamps.back()) {
                b.timestamps.push_back(ts);
            } else {
                // Late sample within a batch or across frames: keep order
                b.timestamps.insert(std::upper_bound(b.timestamps.begin(), b.timestamps.end(), ts), ts);
            }
        }
        if (b.timestamps.empty()) {
            return;
        }
        if (!b.seen || b.timestamps.back() >= b.newest) {
            b.newest = b.timestamps.back();
            b.newest_arrival = now;
            b.seen = true;
        }
        recompute_(b, b.newest);
    }

    // Idle decay, called from the owner's periodic tick
    inline void tick() {
        const TimePoint now = Clock::now();
        for (SensorType s : ALL_SENSOR_TYPES) {
            Buffer& b = buffers_[index_of(s)];
            if (!b.seen) {
                continue;
            }
            const double idle_s = std::chrono::duration<double>(now - b.newest_arrival).count();
            const double before = b.rate;
            recompute_(b, b.newest + std::max(idle_s, 0.0));
            if (before > 0.0 && b.rate == 0.0) {
                BL_DEBUG("[RATE] " << to_string(s) << " stream stalled, rate decayed to 0");
            }
        }
    }

    [[nodiscard]]
    inline double current_rate(SensorType sensor) const noexcept {
        return buffers_[index_of(sensor)].rate;
    }

    [[nodiscard]]
    inline Rates rates() const noexcept {
        Rates out{};
        for (SensorType s : ALL_SENSOR_TYPES) {
            out[index_of(s)] = buffers_[index_of(s)].rate;
        }
        return out;
    }

    // Samples currently retained for `sensor` (bounded by the window)
    [[nodiscard]]
    inline std::size_t buffered(SensorType sensor) const noexcept {
        return buffers_[index_of(sensor)].timestamps.size();
    }

    [[nodiscard]]
    inline std::uint64_t samples_total() const noexcept {
        return samples_total_;
    }

    inline void reset() {
        for (Buffer& b : buffers_) {
            b = Buffer{};
        }
    }

private:
    double window_s_;
    PerSensor<Buffer> buffers_{};
    std::uint64_t samples_total_{0};

private:
    // Keeps only (end - window, end] and derives the rate from it
    inline void recompute_(Buffer& b, double end) {
        const double cutoff = end - window_s_;
        while (!b.timestamps.empty() && b.timestamps.front() <= cutoff) {
            b.timestamps.pop_front();
        }
        b.rate = static_cast<double>(b.timestamps.size()) / window_s_;
    }
};

} // namespace bandlink::core::stream
