#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "bandlink/core/config/error.hpp"
#include "bandlink/core/transport/parse_url.hpp"
#include "bandlink/core/sensor.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core::config {

/*
===============================================================================
 Supervisor configuration
===============================================================================

Plain aggregate, grouped by the component that consumes each section. All
defaults are the production values; every field can be overridden by a JSON
config file (config/loader.hpp) or by the command line of the examples.

validate() is the single gate: Supervisor::start() calls it and refuses to run
on anything but Error::None.
===============================================================================
*/

using namespace std::chrono_literals;

inline constexpr const char* DEFAULT_BRIDGE_URL = "ws://127.0.0.1:18765";

// Liveness request cadence (health::Probe)
struct Health {
    std::chrono::milliseconds interval{1000};    // one health_check per interval
    std::chrono::milliseconds timeout{2000};     // ack deadline per request
    std::uint32_t max_missed{2};                 // consecutive misses => transport failure
};

// Reconnect policy (policy::Backoff)
struct Reconnect {
    std::chrono::milliseconds base_delay{1000};
    double multiplier{2.0};
    std::chrono::milliseconds max_delay{30000};
    double jitter{0.2};                          // ±20% of the nominal delay
    std::uint32_t max_attempts{0};               // 0 = retry forever
};

// Sampling-rate estimation (stream::RateEstimator)
struct Rate {
    std::chrono::milliseconds window{1000};
};

// Streaming detection (stream::StateDetector)
struct Streaming {
    // samples/second at or above which a sensor counts as flowing
    PerSensor<double> thresholds{200.0, 40.0, 25.0, 0.0};
    // sensors that must all be flowing for the session to be Active
    PerSensor<bool> required{true, true, true, false};
    std::uint32_t activate_after{1};             // consecutive above evaluations
    std::uint32_t deactivate_after{2};           // consecutive below evaluations
};

// Aggregation, history and alerting (monitor::ConnectionMonitor)
struct Monitor {
    std::chrono::milliseconds history_max_age{24h};
    std::size_t vote_window{5};
    std::size_t vote_healthy_quorum{3};
    std::size_t vote_partial_quorum{2};
    std::size_t instability_window{5};
    std::size_t instability_threshold{3};
    std::size_t error_window{100};
    double error_rate_threshold{0.3};
    double latency_ema_weight{0.1};
};

struct Supervisor {
    std::string url{DEFAULT_BRIDGE_URL};
    std::chrono::milliseconds tick_interval{1000};
    Health health{};
    Reconnect reconnect{};
    Rate rate{};
    Streaming streaming{};
    Monitor monitor{};
};


namespace detail {

[[nodiscard]]
inline bool in_range(std::chrono::milliseconds v, std::chrono::milliseconds lo, std::chrono::milliseconds hi) noexcept {
    return v >= lo && v <= hi;
}

[[nodiscard]]
inline bool is_ratio(double v) noexcept {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

} // namespace detail


// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------
[[nodiscard]]
inline Error validate(const Supervisor& cfg) {
    transport::ParsedUrl url;
    if (transport::parse_url(cfg.url, url) != transport::Error::None || url.secure) {
        BL_ERROR("[CONFIG] Invalid bridge url: '" << cfg.url << "'");
        return Error::InvalidUrl;
    }

    if (!detail::in_range(cfg.tick_interval, 10ms, 60s)) {
        BL_ERROR("[CONFIG] tick_interval out of range: " << cfg.tick_interval.count() << " ms");
        return Error::InvalidInterval;
    }

    // Health
    if (!detail::in_range(cfg.health.interval, 10ms, 60s)) {
        BL_ERROR("[CONFIG] health.interval out of range: " << cfg.health.interval.count() << " ms");
        return Error::InvalidInterval;
    }
    if (!detail::in_range(cfg.health.timeout, cfg.health.interval, 5min)) {
        BL_ERROR("[CONFIG] health.timeout must be within [interval, 5min]: " << cfg.health.timeout.count() << " ms");
        return Error::InvalidTimeout;
    }
    if (cfg.health.max_missed == 0) {
        BL_ERROR("[CONFIG] health.max_missed must be > 0");
        return Error::InvalidTimeout;
    }

    // Reconnect
    const auto& rc = cfg.reconnect;
    if (rc.base_delay <= 0ms || rc.max_delay < rc.base_delay ||
        !std::isfinite(rc.multiplier) || rc.multiplier < 1.0 ||
        !std::isfinite(rc.jitter) || rc.jitter < 0.0 || rc.jitter >= 1.0) {
        BL_ERROR("[CONFIG] Invalid reconnect policy (base " << rc.base_delay.count()
                 << " ms, multiplier " << rc.multiplier << ", cap " << rc.max_delay.count()
                 << " ms, jitter " << rc.jitter << ")");
        return Error::InvalidBackoff;
    }

    // Rate
    if (!detail::in_range(cfg.rate.window, 100ms, 60s)) {
        BL_ERROR("[CONFIG] rate.window out of range: " << cfg.rate.window.count() << " ms");
        return Error::InvalidInterval;
    }

    // Streaming
    bool any_required = false;
    for (SensorType s : ALL_SENSOR_TYPES) {
        const double t = cfg.streaming.thresholds[index_of(s)];
        if (!std::isfinite(t) || t < 0.0) {
            BL_ERROR("[CONFIG] Invalid rate threshold for " << to_string(s) << ": " << t);
            return Error::InvalidThreshold;
        }
        any_required = any_required || cfg.streaming.required[index_of(s)];
    }
    if (!any_required) {
        BL_ERROR("[CONFIG] At least one sensor must be required for streaming detection");
        return Error::NoRequiredSensors;
    }
    if (cfg.streaming.activate_after == 0 || cfg.streaming.deactivate_after == 0) {
        BL_ERROR("[CONFIG] Hysteresis counts must be > 0 (activate " << cfg.streaming.activate_after
                 << ", deactivate " << cfg.streaming.deactivate_after << ")");
        return Error::InvalidHysteresis;
    }

    // Monitor
    const auto& m = cfg.monitor;
    if (m.history_max_age < cfg.tick_interval ||
        m.vote_window == 0 || m.vote_window > 100 ||
        m.vote_healthy_quorum == 0 || m.vote_healthy_quorum > m.vote_window ||
        m.vote_partial_quorum == 0 || m.vote_partial_quorum > m.vote_window ||
        m.instability_window == 0 || m.instability_window > 100 ||
        m.instability_threshold == 0 || m.instability_threshold > m.instability_window ||
        m.error_window == 0 || m.error_window > 100 ||
        !detail::is_ratio(m.error_rate_threshold) ||
        !detail::is_ratio(m.latency_ema_weight) || m.latency_ema_weight == 0.0) {
        BL_ERROR("[CONFIG] Invalid monitor section");
        return Error::InvalidMonitor;
    }

    return Error::None;
}


inline void dump(const Supervisor& cfg, std::ostream& os) {
    os << "Supervisor configuration:\n"
       << "  url              : " << cfg.url << '\n'
       << "  tick interval    : " << cfg.tick_interval.count() << " ms\n"
       << "  health           : every " << cfg.health.interval.count() << " ms, timeout "
                                 << cfg.health.timeout.count() << " ms, max missed " << cfg.health.max_missed << '\n'
       << "  reconnect        : base " << cfg.reconnect.base_delay.count() << " ms x" << cfg.reconnect.multiplier
                                 << ", cap " << cfg.reconnect.max_delay.count() << " ms, jitter "
                                 << cfg.reconnect.jitter << ", max attempts "
                                 << (cfg.reconnect.max_attempts == 0 ? std::string("unbounded") : std::to_string(cfg.reconnect.max_attempts)) << '\n'
       << "  rate window      : " << cfg.rate.window.count() << " ms\n"
       << "  hysteresis       : on after " << cfg.streaming.activate_after << ", off after "
                                 << cfg.streaming.deactivate_after << '\n';
    for (SensorType s : ALL_SENSOR_TYPES) {
        os << "  threshold " << to_string(s) << "    : " << cfg.streaming.thresholds[index_of(s)] << " /s"
           << (cfg.streaming.required[index_of(s)] ? " (required)" : "") << '\n';
    }
}

} // namespace bandlink::core::config
