#pragma once

#include <array>
#include <string>
#include <cstdint>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/stream/state.hpp"
#include "bandlink/core/sensor.hpp"
#include "lcr/control/binary_hysteresis.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core::stream {

/*
===============================================================================
 stream::StateDetector
===============================================================================

Turns per-sensor rates into the debounced StreamingState. It is the only
authority on "is streaming".

An evaluation is *above* when every required sensor is at or above its
threshold. The result goes through a BinaryHysteresis (default: on after 1
above evaluation, off after 2 consecutive below evaluations):

    Idle      ──above──►  Active
    Active    ──below──►  Degrading (1 below, still streaming)
    Degrading ──above──►  Active
    Degrading ──below──►  Idle      (deactivate_after reached)

With the default 1s tick a single dropped second is absorbed and a stream
that stops flips to Idle after ~2s.
===============================================================================
*/

class StateDetector {
public:
    explicit StateDetector(const config::Streaming& cfg = {}) noexcept
        : cfg_(cfg)
        , hysteresis_(cfg.activate_after, cfg.deactivate_after)
    {}

    inline const StreamingState& update(const Rates& rates) {
        const bool above = above_threshold(rates);
        const auto transition = above ? hysteresis_.on_active_signal() : hysteresis_.on_inactive_signal();

        const Phase before = phase_of(state_);
        if (!hysteresis_.is_active()) {
            state_ = Idle{};
        }
        else if (hysteresis_.is_holding()) {
            state_ = Degrading{rates, hysteresis_.holding_streak()};
        }
        else {
            state_ = Active{rates};
        }
        const Phase after = phase_of(state_);

        if (transition == lcr::control::BinaryHysteresis::Transition::Activated) {
            BL_INFO("[STREAM] Data stream active (eeg " << rates[index_of(SensorType::Eeg)]
                    << "/s, ppg " << rates[index_of(SensorType::Ppg)]
                    << "/s, acc " << rates[index_of(SensorType::Acc)] << "/s)");
        }
        else if (transition == lcr::control::BinaryHysteresis::Transition::Deactivated) {
            BL_WARN("[STREAM] Data stream stopped" << describe_shortfall_(rates));
        }
        else if (before != after) {
            BL_DEBUG("[STREAM] " << to_string(before) << " -> " << to_string(after) << describe_shortfall_(rates));
        }
        return state_;
    }

    // Every required sensor at or above its threshold
    [[nodiscard]]
    inline bool above_threshold(const Rates& rates) const noexcept {
        for (SensorType s : ALL_SENSOR_TYPES) {
            const std::size_t i = index_of(s);
            if (cfg_.required[i] && rates[i] < cfg_.thresholds[i]) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]]
    inline std::array<SensorRate, SENSOR_TYPE_COUNT> sensor_rates(const Rates& rates) const noexcept {
        std::array<SensorRate, SENSOR_TYPE_COUNT> out{};
        for (SensorType s : ALL_SENSOR_TYPES) {
            const std::size_t i = index_of(s);
            out[i] = SensorRate{s, rates[i], cfg_.thresholds[i]};
        }
        return out;
    }

    [[nodiscard]]
    inline const StreamingState& state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline const config::Streaming& config() const noexcept {
        return cfg_;
    }

    inline void reset() noexcept {
        hysteresis_.reset();
        state_ = Idle{};
    }

private:
    config::Streaming cfg_;
    lcr::control::BinaryHysteresis hysteresis_;
    StreamingState state_{Idle{}};

private:
    // " (ppg 12/40)" for every required sensor below its threshold
    [[nodiscard]]
    inline std::string describe_shortfall_(const Rates& rates) const {
        std::string out;
        for (SensorType s : ALL_SENSOR_TYPES) {
            const std::size_t i = index_of(s);
            if (cfg_.required[i] && rates[i] < cfg_.thresholds[i]) {
                out += out.empty() ? " (" : ", ";
                out += std::string(to_string(s)) + " " + std::to_string(static_cast<long long>(rates[i]))
                     + "/" + std::to_string(static_cast<long long>(cfg_.thresholds[i]));
            }
        }
        if (!out.empty()) {
            out += ')';
        }
        return out;
    }
};

} // namespace bandlink::core::stream
