#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/monitor/status.hpp"
#include "bandlink/core/monitor/metrics.hpp"
#include "bandlink/core/monitor/alert.hpp"
#include "bandlink/core/clock.hpp"
#include "lcr/local/history_ring.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core::monitor {

/*
===============================================================================
 monitor::ConnectionMonitor
===============================================================================

Aggregates the three health inputs (bridge socket, REST API, data streaming)
into one authoritative status.

  record_status(ws, api, streaming)   one check; derives the raw status,
                                      updates metrics, raises alerts
  record_response_time(ms)            latency EMA
  record_error()                      transport / health error
  overall_status()                    status reported to the application,
                                      voted over the last checks
  current_status()                    raw status of the last check

Voting smooths single-check flaps: a status is only reported when enough of
the recent checks agree with it (see vote_()).

Alerts are edge-triggered. Each condition fires once when it is entered and
must clear before it can fire again. Ids are monotonic and never reused; the
alert list keeps the newest ALERT_CAPACITY entries while alert_count() keeps
counting.

Single-threaded: owned and driven by the Supervisor's reactor.
===============================================================================
*/

struct DebugInfo {
    bool running{false};
    std::chrono::milliseconds check_interval{0};
    ConnectionMetrics metrics{};
    ConnectionStatus current_status{};
    OverallStatus reported_overall{OverallStatus::Offline};
    std::uint64_t alert_count{0};
    std::size_t history_size{0};
};

inline std::ostream& operator<<(std::ostream& os, const DebugInfo& d) {
    os << "\n=== Connection Monitor ===\n"
       << "  Running               : " << (d.running ? "yes" : "no") << '\n'
       << "  Check interval        : " << d.check_interval.count() << " ms\n"
       << "  Current status        : " << d.current_status << '\n'
       << "  Reported overall      : " << to_string(d.reported_overall) << '\n'
       << "  Alerts raised         : " << lcr::format_number_exact(d.alert_count) << '\n'
       << "  History size          : " << d.history_size << '\n'
       << d.metrics;
    return os;
}


template<ClockConcept Clock = SteadyClock>
class ConnectionMonitor {
public:
    static constexpr std::size_t HISTORY_CAPACITY = 100;
    static constexpr std::size_t ALERT_CAPACITY = 100;

    using StatusChangeHandler = std::function<void(const ConnectionStatus& current, const ConnectionStatus& previous)>;
    using AlertHandler        = std::function<void(const Alert&)>;

public:
    explicit ConnectionMonitor(const config::Monitor& cfg = {},
                               std::chrono::milliseconds check_interval = std::chrono::milliseconds{1000}) noexcept
        : cfg_(cfg)
        , check_interval_(check_interval)
    {}

    inline void start() noexcept {
        running_ = true;
        BL_DEBUG("[MONITOR] Started (check every " << check_interval_.count() << " ms)");
    }

    inline void stop() noexcept {
        running_ = false;
        BL_DEBUG("[MONITOR] Stopped");
    }

    inline void on_status_change(StatusChangeHandler handler) {
        on_status_change_ = std::move(handler);
    }

    inline void on_alert(AlertHandler handler) {
        on_alert_ = std::move(handler);
    }

    // -------------------------------------------------------------------------
    // Inputs
    // -------------------------------------------------------------------------

    inline const ConnectionStatus& record_status(bool websocket, bool api, bool streaming) {
        const TimePoint now = Clock::now();
        const ConnectionStatus status{websocket, api, streaming, now};

        const bool first = history_.empty();
        const ConnectionStatus previous = first ? ConnectionStatus{} : history_.back();

        // === Metrics ===
        ++metrics_.total_checks;
        if (status.overall() != OverallStatus::Offline) {
            ++metrics_.successful_checks;
            metrics_.last_successful_check = now;
            if (!first) {
                const auto delta = elapsed_ms(previous.last_check(), now);
                if (delta.count() > 0) {
                    metrics_.uptime_ms += static_cast<std::uint64_t>(delta.count());
                }
            }
        }
        else {
            ++metrics_.failed_checks;
        }

        (void)history_.push(status);
        metrics_.error_rate = compute_error_rate_();

        // === Notify ===
        if (first || !status.same_state(previous)) {
            BL_DEBUG("[MONITOR] Status " << status);
            if (on_status_change_) {
                on_status_change_(status, previous);
            }
        }

        evaluate_alerts_(now);
        return history_.back();
    }

    inline void record_response_time(double ms) noexcept {
        if (ms < 0.0) {
            return;
        }
        if (!latency_seeded_) {
            metrics_.average_latency_ms = ms;
            latency_seeded_ = true;
            return;
        }
        const double w = cfg_.latency_ema_weight;
        metrics_.average_latency_ms = metrics_.average_latency_ms * (1.0 - w) + ms * w;
    }

    inline void record_error() {
        ++metrics_.errors_total;
        metrics_.error_rate = compute_error_rate_();
        BL_DEBUG("[MONITOR] Error recorded (total " << metrics_.errors_total
                 << ", error rate " << lcr::format_percent(metrics_.error_rate) << ")");
        evaluate_error_rate_(Clock::now());
    }

    // External critical condition (e.g. reconnect policy gave up)
    inline void raise(AlertLevel level, AlertKind kind, std::string message) {
        push_alert_(level, kind, std::move(message), Clock::now());
    }

    // Prune history entries older than history_max_age
    inline std::size_t maintain() {
        const TimePoint now = Clock::now();
        std::size_t pruned = 0;
        while (!history_.empty() && now - history_.front().last_check() > cfg_.history_max_age) {
            (void)history_.pop_front();
            ++pruned;
        }
        if (pruned > 0) {
            BL_DEBUG("[MONITOR] Pruned " << pruned << " stale history entries");
        }
        return pruned;
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline OverallStatus overall_status() const {
        return vote_();
    }

    [[nodiscard]]
    inline ConnectionStatus current_status() const noexcept {
        return history_.empty() ? ConnectionStatus{} : history_.back();
    }

    [[nodiscard]]
    inline ConnectionMetrics metrics() const noexcept {
        return metrics_;
    }

    // Newest `limit` checks, oldest first
    [[nodiscard]]
    inline std::vector<ConnectionStatus> history(std::size_t limit = HISTORY_CAPACITY) const {
        const std::size_t n = limit < history_.size() ? limit : history_.size();
        std::vector<ConnectionStatus> out;
        out.reserve(n);
        for (std::size_t i = history_.size() - n; i < history_.size(); ++i) {
            out.push_back(history_.at(i));
        }
        return out;
    }

    [[nodiscard]]
    inline std::vector<Alert> alerts() const {
        std::vector<Alert> out;
        out.reserve(alerts_.size());
        for (std::size_t i = 0; i < alerts_.size(); ++i) {
            out.push_back(alerts_.at(i));
        }
        return out;
    }

    [[nodiscard]]
    inline std::uint64_t alert_count() const noexcept {
        return next_alert_id_ - 1;
    }

    [[nodiscard]]
    inline std::size_t history_size() const noexcept {
        return history_.size();
    }

    [[nodiscard]]
    inline DebugInfo debug_info() const {
        DebugInfo d;
        d.running = running_;
        d.check_interval = check_interval_;
        d.metrics = metrics_;
        d.current_status = current_status();
        d.reported_overall = vote_();
        d.alert_count = alert_count();
        d.history_size = history_.size();
        return d;
    }

    [[nodiscard]]
    inline const config::Monitor& config() const noexcept {
        return cfg_;
    }

private:
    config::Monitor cfg_;
    std::chrono::milliseconds check_interval_;
    bool running_{false};

    lcr::local::history_ring<ConnectionStatus, HISTORY_CAPACITY> history_;
    ConnectionMetrics metrics_{};
    bool latency_seeded_{false};

    lcr::local::history_ring<Alert, ALERT_CAPACITY> alerts_;
    std::uint64_t next_alert_id_{1};

    // Edge-trigger latches, one per condition
    bool offline_latched_{false};
    bool unstable_latched_{false};
    bool error_rate_latched_{false};

    StatusChangeHandler on_status_change_;
    AlertHandler on_alert_;

private:
    [[nodiscard]]
    inline OverallStatus vote_() const {
        if (history_.empty()) {
            return OverallStatus::Offline;
        }
        const std::size_t window = cfg_.vote_window;
        const std::size_t healthy = history_.count_recent(window, [](const ConnectionStatus& s) {
            return s.overall() == OverallStatus::Healthy;
        });
        if (healthy >= cfg_.vote_healthy_quorum) {
            return OverallStatus::Healthy;
        }
        const std::size_t both = history_.count_recent(window, [](const ConnectionStatus& s) {
            return s.websocket() && s.api();
        });
        if (both >= cfg_.vote_healthy_quorum) {
            return OverallStatus::Ready;
        }
        const std::size_t either = history_.count_recent(window, [](const ConnectionStatus& s) {
            return s.websocket() || s.api();
        });
        if (either >= cfg_.vote_partial_quorum) {
            return OverallStatus::Degraded;
        }
        return OverallStatus::Offline;
    }

    [[nodiscard]]
    inline double compute_error_rate_() const {
        const std::size_t n = cfg_.error_window < history_.size() ? cfg_.error_window : history_.size();
        if (n == 0) {
            return 0.0;
        }
        const std::size_t offline = history_.count_recent(n, [](const ConnectionStatus& s) {
            return s.overall() == OverallStatus::Offline;
        });
        return static_cast<double>(offline) / static_cast<double>(n);
    }

    inline void evaluate_alerts_(TimePoint now) {
        // Offline
        const bool offline = history_.back().overall() == OverallStatus::Offline;
        if (offline && !offline_latched_) {
            push_alert_(AlertLevel::Critical, AlertKind::Offline, "Connection lost", now);
        }
        offline_latched_ = offline;

        // Instability
        const std::size_t degraded = history_.count_recent(cfg_.instability_window, [](const ConnectionStatus& s) {
            return s.overall() == OverallStatus::Degraded;
        });
        const bool unstable = degraded >= cfg_.instability_threshold;
        if (unstable && !unstable_latched_) {
            push_alert_(AlertLevel::Warning, AlertKind::Instability, "Connection unstable", now);
        }
        unstable_latched_ = unstable;

        evaluate_error_rate_(now);
    }

    inline void evaluate_error_rate_(TimePoint now) {
        const bool high = metrics_.error_rate > cfg_.error_rate_threshold;
        if (high && !error_rate_latched_) {
            push_alert_(AlertLevel::Warning, AlertKind::HighErrorRate,
                        "High error rate: " + lcr::format_percent(metrics_.error_rate), now);
        }
        error_rate_latched_ = high;
    }

    inline void push_alert_(AlertLevel level, AlertKind kind, std::string message, TimePoint now) {
        Alert alert{next_alert_id_++, level, kind, std::move(message), now};
        if (level == AlertLevel::Critical) {
            BL_ERROR("[MONITOR] Alert #" << alert.id << " " << to_string(level) << ": " << alert.message);
        }
        else {
            BL_WARN("[MONITOR] Alert #" << alert.id << " " << to_string(level) << ": " << alert.message);
        }
        (void)alerts_.push(alert);
        if (on_alert_) {
            on_alert_(alert);
        }
    }
};

} // namespace bandlink::core::monitor
