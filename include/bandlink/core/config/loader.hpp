#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/config/error.hpp"
#include "bandlink/core/protocol/bridge/parser/helpers.hpp"
#include "bandlink/core/sensor.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
===============================================================================
 JSON configuration loader
===============================================================================

Overlays a JSON document onto an existing config::Supervisor. Every key is
optional; absent keys keep their current value, so a file only lists what it
changes. Unknown keys are ignored. A known key with the wrong type is
Error::InvalidSchema. Durations are integer milliseconds ("*_ms").

{
  "url": "ws://127.0.0.1:18765",
  "tick_interval_ms": 1000,
  "health":    { "interval_ms": 1000, "timeout_ms": 2000, "max_missed": 2 },
  "reconnect": { "base_delay_ms": 1000, "multiplier": 2.0, "max_delay_ms": 30000,
                 "jitter": 0.2, "max_attempts": 0 },
  "rate":      { "window_ms": 1000 },
  "streaming": { "thresholds": { "eeg": 200, "ppg": 40, "acc": 25 },
                 "required": ["eeg", "ppg", "acc"],
                 "activate_after": 1, "deactivate_after": 2 },
  "monitor":   { "history_max_age_ms": 86400000, "vote_window": 5,
                 "error_window": 100, "error_rate_threshold": 0.3, ... }
}

Loading does not validate ranges: call validate() on the result.
===============================================================================
*/

namespace bandlink::core::config {

namespace detail {

using protocol::bridge::parser::Result;
namespace helper = protocol::bridge::parser::helper;

[[nodiscard]]
inline bool overlay_ms(const simdjson::dom::element& obj, const char* key, std::chrono::milliseconds& out) noexcept {
    lcr::optional<std::uint64_t> v;
    if (helper::parse_uint64_optional(obj, key, v) != Result::Parsed) {
        return false;
    }
    if (v.has()) {
        out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v.value()));
    }
    return true;
}

template<class Int>
[[nodiscard]]
inline bool overlay_uint(const simdjson::dom::element& obj, const char* key, Int& out) noexcept {
    lcr::optional<std::uint64_t> v;
    if (helper::parse_uint64_optional(obj, key, v) != Result::Parsed) {
        return false;
    }
    if (v.has()) {
        out = static_cast<Int>(v.value());
    }
    return true;
}

[[nodiscard]]
inline bool overlay_double(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    lcr::optional<double> v;
    if (helper::parse_double_optional(obj, key, v) != Result::Parsed) {
        return false;
    }
    if (v.has()) {
        out = v.value();
    }
    return true;
}

[[nodiscard]]
inline bool overlay_section(const simdjson::dom::element& root, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    return helper::parse_object_optional(root, key, out, present) == Result::Parsed;
}

[[nodiscard]]
inline bool overlay_streaming(const simdjson::dom::element& obj, Streaming& out) {
    simdjson::dom::element thresholds;
    bool present = false;
    if (!overlay_section(obj, "thresholds", thresholds, present)) {
        return false;
    }
    if (present) {
        simdjson::dom::object entries;
        if (thresholds.get(entries)) {
            return false;
        }
        for (auto field : entries) {
            SensorType sensor;
            if (!sensor_from_string(field.key, sensor)) {
                BL_ERROR("[CONFIG] Unknown sensor in streaming.thresholds: '" << field.key << "'");
                return false;
            }
            double t;
            if (field.value.get(t)) {
                return false;
            }
            out.thresholds[index_of(sensor)] = t;
        }
    }

    simdjson::dom::array required;
    if (helper::parse_array_optional(obj, "required", required, present) != Result::Parsed) {
        return false;
    }
    if (present) {
        PerSensor<bool> req{false, false, false, false};
        for (auto item : required) {
            std::string_view name;
            SensorType sensor;
            if (item.get(name) || !sensor_from_string(name, sensor)) {
                BL_ERROR("[CONFIG] Invalid entry in streaming.required");
                return false;
            }
            req[index_of(sensor)] = true;
        }
        out.required = req;
    }

    return overlay_uint(obj, "activate_after", out.activate_after)
        && overlay_uint(obj, "deactivate_after", out.deactivate_after);
}

[[nodiscard]]
inline Error overlay(const simdjson::dom::element& root, Supervisor& cfg) {
    if (helper::require_object(root) != Result::Parsed) {
        BL_ERROR("[CONFIG] Root must be a JSON object");
        return Error::InvalidSchema;
    }

    std::string_view url;
    bool present = false;
    if (helper::parse_string_optional(root, "url", url, present) != Result::Parsed) {
        BL_ERROR("[CONFIG] Field 'url' must be a string");
        return Error::InvalidSchema;
    }
    if (present) {
        cfg.url = std::string(url);
    }
    if (!overlay_ms(root, "tick_interval_ms", cfg.tick_interval)) {
        BL_ERROR("[CONFIG] Field 'tick_interval_ms' must be an unsigned integer");
        return Error::InvalidSchema;
    }

    simdjson::dom::element section;

    if (!overlay_section(root, "health", section, present)) return Error::InvalidSchema;
    if (present) {
        if (!overlay_ms(section, "interval_ms", cfg.health.interval) ||
            !overlay_ms(section, "timeout_ms", cfg.health.timeout) ||
            !overlay_uint(section, "max_missed", cfg.health.max_missed)) {
            BL_ERROR("[CONFIG] Invalid field type in 'health'");
            return Error::InvalidSchema;
        }
    }

    if (!overlay_section(root, "reconnect", section, present)) return Error::InvalidSchema;
    if (present) {
        if (!overlay_ms(section, "base_delay_ms", cfg.reconnect.base_delay) ||
            !overlay_double(section, "multiplier", cfg.reconnect.multiplier) ||
            !overlay_ms(section, "max_delay_ms", cfg.reconnect.max_delay) ||
            !overlay_double(section, "jitter", cfg.reconnect.jitter) ||
            !overlay_uint(section, "max_attempts", cfg.reconnect.max_attempts)) {
            BL_ERROR("[CONFIG] Invalid field type in 'reconnect'");
            return Error::InvalidSchema;
        }
    }

    if (!overlay_section(root, "rate", section, present)) return Error::InvalidSchema;
    if (present) {
        if (!overlay_ms(section, "window_ms", cfg.rate.window)) {
            BL_ERROR("[CONFIG] Invalid field type in 'rate'");
            return Error::InvalidSchema;
        }
    }

    if (!overlay_section(root, "streaming", section, present)) return Error::InvalidSchema;
    if (present) {
        if (!overlay_streaming(section, cfg.streaming)) {
            BL_ERROR("[CONFIG] Invalid 'streaming' section");
            return Error::InvalidSchema;
        }
    }

    if (!overlay_section(root, "monitor", section, present)) return Error::InvalidSchema;
    if (present) {
        auto& m = cfg.monitor;
        if (!overlay_ms(section, "history_max_age_ms", m.history_max_age) ||
            !overlay_uint(section, "vote_window", m.vote_window) ||
            !overlay_uint(section, "vote_healthy_quorum", m.vote_healthy_quorum) ||
            !overlay_uint(section, "vote_partial_quorum", m.vote_partial_quorum) ||
            !overlay_uint(section, "instability_window", m.instability_window) ||
            !overlay_uint(section, "instability_threshold", m.instability_threshold) ||
            !overlay_uint(section, "error_window", m.error_window) ||
            !overlay_double(section, "error_rate_threshold", m.error_rate_threshold) ||
            !overlay_double(section, "latency_ema_weight", m.latency_ema_weight)) {
            BL_ERROR("[CONFIG] Invalid field type in 'monitor'");
            return Error::InvalidSchema;
        }
    }

    return Error::None;
}

} // namespace detail


// Overlay a JSON document held in memory
[[nodiscard]]
inline Error load_json(std::string_view json, Supervisor& cfg) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(json.data(), json.size()).get(root);
    if (error) {
        BL_ERROR("[CONFIG] JSON parse error: " << simdjson::error_message(error));
        return Error::InvalidJson;
    }
    return detail::overlay(root, cfg);
}

// Overlay a JSON file
[[nodiscard]]
inline Error load_file(const std::string& path, Supervisor& cfg) {
    simdjson::padded_string json;
    auto io_error = simdjson::padded_string::load(path).get(json);
    if (io_error) {
        BL_ERROR("[CONFIG] Cannot read config file '" << path << "': " << simdjson::error_message(io_error));
        return Error::FileNotFound;
    }
    BL_INFO("[CONFIG] Loading configuration from '" << path << "'");
    return load_json(std::string_view(json.data(), json.size()), cfg);
}

} // namespace bandlink::core::config
