#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/config/error.hpp"
#include "bandlink/core/monitor/status.hpp"
#include "bandlink/core/monitor/metrics.hpp"
#include "bandlink/core/monitor/alert.hpp"
#include "bandlink/core/gate/recording_gate.hpp"
#include "bandlink/core/stream/state.hpp"
#include "bandlink/core/sensor.hpp"


namespace bandlink::lite {

/*
===============================================================================
Bandlink Lite Supervisor
===============================================================================

Non-template façade over core::Supervisor bound to the platform WebSocket
backend (Boost.Beast, WinHTTP on Windows) and the steady clock. Compiled once
in src/lite/supervisor.cpp so that applications do not pull simdjson or the
backend headers into their own translation units.

Execution stays poll-driven: no callback runs outside start(), poll(),
run_for() or the host-input setters, and all of them must be called from one
thread. A callback may call stop(); start() must not be called from one.
===============================================================================
*/
class Supervisor {
public:
    using status_handler    = std::function<void(const core::monitor::ConnectionStatus& current,
                                                 const core::monitor::ConnectionStatus& previous)>;
    using overall_handler   = std::function<void(core::monitor::OverallStatus current,
                                                 core::monitor::OverallStatus previous)>;
    using streaming_handler = std::function<void(const core::stream::StreamingState&)>;
    using gate_handler      = std::function<void(const core::gate::GateDecision&)>;
    using alert_handler     = std::function<void(const core::monitor::Alert&)>;
    using event_handler     = std::function<void(std::string_view event_type, std::string_view data)>;

    Supervisor();
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // lifecycle
    [[nodiscard]] core::config::Error start(const core::config::Supervisor& cfg = {});
    void stop();
    void poll();
    [[nodiscard]] bool is_running() const;

    // Drives poll() for `duration` (or until stop()), sleeping `tick`
    // between polls.
    void run_for(std::chrono::milliseconds duration, std::chrono::milliseconds tick = std::chrono::milliseconds{10});

    template<class StopFn>
    void run_until(StopFn&& should_stop, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        const bool cooperative = (tick.count() > 0);
        while (is_running() && !should_stop()) [[likely]] {
            poll();
            if (cooperative) [[likely]] {
                std::this_thread::sleep_for(tick);
            }
        }
    }

    // host inputs
    void set_api_reachable(bool reachable);
    void record_api_latency(double ms);
    void set_engine_initialized(bool initialized);

    // bridge commands
    bool check_device_connection();
    bool check_bluetooth_status();
    bool scan_devices();
    bool connect_device(std::string_view address);
    bool disconnect_device();
    bool request_streaming(bool on);

    // observers
    void on_status_change(status_handler cb);
    void on_overall_change(overall_handler cb);
    void on_streaming_change(streaming_handler cb);
    void on_gate_change(gate_handler cb);
    void on_alert(alert_handler cb);
    void on_bridge_event(event_handler cb);

    // queries
    [[nodiscard]] core::gate::GateDecision can_record() const;
    [[nodiscard]] core::monitor::OverallStatus overall_status() const;
    [[nodiscard]] core::monitor::ConnectionStatus current_status() const;
    [[nodiscard]] core::stream::StreamingState streaming_state() const;
    [[nodiscard]] double current_rate(core::SensorType sensor) const;
    [[nodiscard]] core::monitor::ConnectionMetrics metrics() const;

    void debug_dump(std::ostream& os) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bandlink::lite
