/*
===============================================================================
Bandlink Supervisor
===============================================================================

The Supervisor is the single reactor of the bridge client. It owns, for the
duration of one start()/stop() cycle, exactly one instance of each runtime
component:

  - transport::Connection      → self-healing WebSocket link to the bridge
  - health::Probe              → application-level liveness (health_check)
  - stream::RateEstimator      → per-sensor sampling rates from raw frames
  - stream::StateDetector      → debounced StreamingState
  - monitor::ConnectionMonitor → voted overall status, metrics, alerts
  - gate::RecordingGate        → "can I start recording now?"

Data flows one way:

  Connection ─► Router ─► RateEstimator ─► StateDetector ─► Monitor ─► Gate

and control flows HealthProbe ─► Connection ─► Monitor.

poll() is the only place where state changes. Per call, in order:
  1. backend events and frames (arrival order), routed synchronously
  2. connection signals (resync on Connected, probe disarm on Disconnected)
  3. health probe deadlines
  4. the periodic tick (default 1s):
        rate decay → detector → monitor record → maintenance → gate

Observers registered on the Supervisor are invoked from poll() (or from
start() and the host-input setters), on the caller's thread. There is no
global state: a host may run as many independent Supervisors as it likes.

An observer may call stop(). The runtime is still on the stack at that
point, so the teardown is deferred until the outermost poll() / start() /
setter returns; in between no further observer runs and is_running() is
already false. start() must not be called from an observer.

The requested streaming state (request_streaming) and the bridge-reported
flags (ack is_streaming, stream_started / stream_stopped) are kept as facts
for diagnostics only. The observed StreamingState comes exclusively from the
StateDetector.
===============================================================================
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/transport/connection.hpp"
#include "bandlink/core/transport/websocket_concept.hpp"
#include "bandlink/core/protocol/bridge/enums.hpp"
#include "bandlink/core/protocol/bridge/schema/command.hpp"
#include "bandlink/core/protocol/bridge/parser/router.hpp"
#include "bandlink/core/health/probe.hpp"
#include "bandlink/core/stream/rate_estimator.hpp"
#include "bandlink/core/stream/state_detector.hpp"
#include "bandlink/core/monitor/connection_monitor.hpp"
#include "bandlink/core/gate/recording_gate.hpp"
#include "bandlink/core/telemetry/supervisor.hpp"
#include "bandlink/core/policy/backoff.hpp"
#include "bandlink/core/clock.hpp"
#include "bandlink/core/timer.hpp"
#include "bandlink/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core {

// Facts reported by the bridge itself; diagnostics only
struct BridgeFacts {
    bool device_connected{false};
    bool bridge_streaming{false};                 // ack is_streaming / stream_started
    bool requested_streaming{false};              // last start/stop command sent by us
    std::uint64_t clients_connected{0};
    lcr::optional<double> battery_level{};
    lcr::optional<std::chrono::milliseconds> last_health_rtt{};
};

inline std::ostream& operator<<(std::ostream& os, const BridgeFacts& f) {
    os << "\n=== Bridge ===\n"
       << "  Device connected      : " << (f.device_connected ? "yes" : "no") << '\n'
       << "  Streaming (bridge)    : " << (f.bridge_streaming ? "yes" : "no") << '\n'
       << "  Streaming (requested) : " << (f.requested_streaming ? "yes" : "no") << '\n'
       << "  Clients connected     : " << f.clients_connected << '\n'
       << "  Battery               : ";
    if (f.battery_level.has()) {
        os << f.battery_level.value() << " %\n";
    } else {
        os << "n/a\n";
    }
    os << "  Health RTT            : ";
    if (f.last_health_rtt.has()) {
        os << f.last_health_rtt.value().count() << " ms\n";
    } else {
        os << "n/a\n";
    }
    return os;
}


template <
    transport::WebSocketConcept WS,
    ClockConcept Clock = SteadyClock
>
class Supervisor {
public:
    using StatusChangeHandler    = typename monitor::ConnectionMonitor<Clock>::StatusChangeHandler;
    using OverallChangeHandler   = std::function<void(monitor::OverallStatus current, monitor::OverallStatus previous)>;
    using StreamingChangeHandler = std::function<void(const stream::StreamingState&)>;
    using GateChangeHandler      = std::function<void(const gate::GateDecision&)>;
    using AlertHandler           = std::function<void(const monitor::Alert&)>;
    using BridgeEventHandler     = std::function<void(protocol::bridge::EventType, std::string_view data)>;

public:
    Supervisor() = default;

    ~Supervisor() {
        stop();
    }

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Validates the configuration, creates the runtime components and opens
    // the bridge connection. Nothing is created unless the configuration is
    // valid.
    [[nodiscard]]
    inline config::Error start(const config::Supervisor& cfg) {
        const config::Error err = config::validate(cfg);
        if (err != config::Error::None) {
            BL_ERROR("[SUPERVISOR] Refusing to start: " << config::to_string(err));
            return err;
        }
        if (rt_) {
            BL_WARN("[SUPERVISOR] start() while running, restarting");
            stop();
        }

        rt_ = std::make_unique<Runtime>(cfg, telemetry_.connection);
        stop_requested_ = false;
        install_handlers_();
        facts_ = BridgeFacts{};
        last_overall_ = monitor::OverallStatus::Offline;
        last_phase_ = stream::Phase::Idle;
        last_gate_ = gate::GateDecision{};
        gate_evaluated_ = false;

        BL_INFO("[SUPERVISOR] Starting (bridge " << cfg.url << ", tick " << cfg.tick_interval.count() << " ms)");
        const DispatchScope scope{*this};
        rt_->monitor.start();
        const TimePoint now = Clock::now();
        rt_->tick_timer.arm_after(now, cfg.tick_interval);

        // A failed first attempt is already on the backoff path
        const transport::Error open_err = rt_->connection.open(cfg.url);
        if (open_err != transport::Error::None) {
            BL_WARN("[SUPERVISOR] Initial connect failed (" << transport::to_string(open_err) << ")");
        }
        drain_signals_();
        evaluate_gate_();
        return config::Error::None;
    }

    // Disarms every timer and releases the socket before the runtime
    // components are discarded. Called from an observer, only marks the
    // runtime for teardown (see above).
    inline void stop() noexcept {
        if (!rt_) {
            return;
        }
        if (dispatch_depth_ > 0) {
            if (!stop_requested_) {
                BL_DEBUG("[SUPERVISOR] stop() from an observer, teardown deferred");
            }
            stop_requested_ = true;
            return;
        }
        teardown_();
    }

    [[nodiscard]]
    inline bool is_running() const noexcept {
        return rt_ != nullptr && !stop_requested_;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    inline void poll() {
        if (!is_running()) {
            return;
        }
        const DispatchScope scope{*this};

        // === Transport: backend events, frames, reconnect timer ===
        rt_->connection.poll();
        drain_signals_();

        // === Liveness ===
        service_probe_(Clock::now());

        // === Periodic evaluation ===
        const TimePoint now = Clock::now();
        if (!stop_requested_ && rt_->tick_timer.expired(now)) {
            rt_->tick_timer.arm_after(now, rt_->config.tick_interval);
            tick_();
        }
    }

    // -------------------------------------------------------------------------
    // Host application inputs (REST collaborator, engine)
    // -------------------------------------------------------------------------

    inline void set_api_reachable(bool reachable) noexcept {
        if (api_reachable_ != reachable) {
            BL_DEBUG("[SUPERVISOR] REST api " << (reachable ? "reachable" : "unreachable"));
        }
        api_reachable_ = reachable;
    }

    inline void record_api_latency(double ms) noexcept {
        if (rt_) {
            rt_->monitor.record_response_time(ms);
        }
    }

    inline void set_engine_initialized(bool initialized) {
        if (engine_initialized_ == initialized) {
            return;
        }
        engine_initialized_ = initialized;
        BL_DEBUG("[SUPERVISOR] Engine " << (initialized ? "initialized" : "not initialized"));
        const DispatchScope scope{*this};
        evaluate_gate_();
    }

    // -------------------------------------------------------------------------
    // Bridge commands (false when the bridge is not connected)
    // -------------------------------------------------------------------------

    inline bool check_device_connection() { return send_command_(protocol::bridge::Command::CheckDeviceConnection); }
    inline bool check_bluetooth_status()  { return send_command_(protocol::bridge::Command::CheckBluetoothStatus); }
    inline bool scan_devices()            { return send_command_(protocol::bridge::Command::ScanDevices); }
    inline bool disconnect_device()       { return send_command_(protocol::bridge::Command::DisconnectDevice); }

    inline bool connect_device(std::string_view address) {
        return send_(protocol::bridge::schema::Command::connect_device(address));
    }

    // Records what the user asked for. Never touches the observed
    // StreamingState.
    inline bool request_streaming(bool on) {
        const bool sent = send_command_(on ? protocol::bridge::Command::StartStreaming
                                           : protocol::bridge::Command::StopStreaming);
        if (sent) {
            facts_.requested_streaming = on;
            BL_INFO("[SUPERVISOR] Streaming " << (on ? "start" : "stop") << " requested");
        }
        return sent;
    }

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------

    inline void on_status_change(StatusChangeHandler handler) {
        on_status_change_ = std::move(handler);
    }

    inline void on_overall_change(OverallChangeHandler handler) { on_overall_change_ = std::move(handler); }
    inline void on_streaming_change(StreamingChangeHandler handler) { on_streaming_change_ = std::move(handler); }
    inline void on_gate_change(GateChangeHandler handler) { on_gate_change_ = std::move(handler); }
    inline void on_alert(AlertHandler handler) { on_alert_ = std::move(handler); }
    inline void on_bridge_event(BridgeEventHandler handler) { on_bridge_event_ = std::move(handler); }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline gate::GateDecision can_record() const {
        return gate::RecordingGate::can_record(gate_inputs_());
    }

    // Voted status reported to the application
    [[nodiscard]]
    inline monitor::OverallStatus overall_status() const {
        return rt_ ? rt_->monitor.overall_status() : monitor::OverallStatus::Offline;
    }

    // Raw status of the last check
    [[nodiscard]]
    inline monitor::ConnectionStatus current_status() const noexcept {
        return rt_ ? rt_->monitor.current_status() : monitor::ConnectionStatus{};
    }

    [[nodiscard]]
    inline stream::StreamingState streaming_state() const {
        return rt_ ? rt_->detector.state() : stream::StreamingState{stream::Idle{}};
    }

    [[nodiscard]]
    inline double current_rate(SensorType sensor) const noexcept {
        return rt_ ? rt_->rate.current_rate(sensor) : 0.0;
    }

    [[nodiscard]]
    inline monitor::ConnectionMetrics metrics() const noexcept {
        return rt_ ? rt_->monitor.metrics() : monitor::ConnectionMetrics{};
    }

    [[nodiscard]]
    inline const BridgeFacts& bridge_facts() const noexcept {
        return facts_;
    }

    [[nodiscard]]
    inline transport::State connection_state() const noexcept {
        return rt_ ? rt_->connection.state() : transport::State::Disconnected;
    }

    [[nodiscard]]
    inline std::uint64_t transport_epoch() const noexcept {
        return rt_ ? rt_->connection.epoch() : 0;
    }

    // Reconnect, health and tick deadlines currently armed (0 when stopped)
    [[nodiscard]]
    inline std::size_t pending_timers() const noexcept {
        if (!rt_) {
            return 0;
        }
        return rt_->connection.pending_timers() + rt_->probe.pending_timers() + (rt_->tick_timer.armed() ? 1 : 0);
    }

    [[nodiscard]]
    inline const telemetry::Supervisor& telemetry() const noexcept {
        return telemetry_;
    }

    inline void debug_dump(std::ostream& os) const {
        if (rt_) {
            os << rt_->monitor.debug_info();
            os << "  Streaming state       : " << stream::to_string(rt_->detector.state()) << '\n';
        } else {
            os << "\n=== Connection Monitor ===\n  Running               : no\n";
        }
        os << facts_;
        os << "  Recording             : " << can_record() << '\n';
    }

#ifdef BL_UNIT_TEST
public:
    transport::Connection<WS, Clock>& connection() {
        return rt_->connection;
    }

    WS* ws() {
        return rt_ ? rt_->connection.ws() : nullptr;
    }

    const health::Probe<Clock>& probe() const {
        return rt_->probe;
    }

    const monitor::ConnectionMonitor<Clock>& monitor() const {
        return rt_->monitor;
    }
#endif // BL_UNIT_TEST

private:
    // Router handler: forwards typed messages to the owning Supervisor
    struct Inbound {
        Supervisor& owner;

        inline void on_health_check_response(const protocol::bridge::schema::HealthCheckResponse& msg) {
            owner.handle_health_ack_(msg);
        }
        inline void on_event(const protocol::bridge::schema::Event& msg) {
            owner.handle_event_(msg);
        }
        inline void on_sensor_frame(const protocol::bridge::schema::SensorFrame& msg) {
            owner.handle_frame_(msg);
        }
    };

    // Everything that exists only between start() and stop()
    struct Runtime {
        Runtime(const config::Supervisor& cfg, transport::telemetry::Connection& conn_telemetry)
            : config(cfg)
            , connection(conn_telemetry, policy::Backoff{cfg.reconnect})
            , probe(cfg.health)
            , rate(cfg.rate)
            , detector(cfg.streaming)
            , monitor(cfg.monitor, cfg.tick_interval)
        {}

        config::Supervisor config;
        transport::Connection<WS, Clock> connection;
        health::Probe<Clock> probe;
        stream::RateEstimator<Clock> rate;
        stream::StateDetector detector;
        monitor::ConnectionMonitor<Clock> monitor;
        Deadline tick_timer;
    };

    telemetry::Supervisor telemetry_;

    Inbound inbound_{*this};
    protocol::bridge::parser::Router<Inbound> router_{inbound_};

    std::unique_ptr<Runtime> rt_;

    // Nesting of poll() / start() / setters currently on the stack
    std::uint32_t dispatch_depth_{0};
    bool stop_requested_{false};

    // Host facts survive restarts
    bool api_reachable_{false};
    bool engine_initialized_{false};

    BridgeFacts facts_{};
    std::string cmd_buffer_;                      // reused for every outbound command

    // Last values handed to observers
    monitor::OverallStatus last_overall_{monitor::OverallStatus::Offline};
    stream::Phase last_phase_{stream::Phase::Idle};
    gate::GateDecision last_gate_{};
    bool gate_evaluated_{false};

    StatusChangeHandler on_status_change_;
    OverallChangeHandler on_overall_change_;
    StreamingChangeHandler on_streaming_change_;
    GateChangeHandler on_gate_change_;
    AlertHandler on_alert_;
    BridgeEventHandler on_bridge_event_;

private:
    // Defers a stop() issued by an observer until the outermost dispatch
    // unwinds
    struct DispatchScope {
        Supervisor& owner;

        explicit DispatchScope(Supervisor& s) noexcept
            : owner(s)
        {
            ++owner.dispatch_depth_;
        }

        ~DispatchScope() {
            if (--owner.dispatch_depth_ == 0 && owner.stop_requested_) {
                owner.teardown_();
            }
        }

        DispatchScope(const DispatchScope&) = delete;
        DispatchScope& operator=(const DispatchScope&) = delete;
    };

    inline void teardown_() noexcept {
        stop_requested_ = false;
        if (!rt_) {
            return;
        }
        BL_INFO("[SUPERVISOR] Stopping");
        rt_->tick_timer.disarm();
        rt_->probe.disarm();
        rt_->monitor.stop();
        rt_->connection.close();
        rt_.reset();
    }

    inline void install_handlers_() {
        rt_->connection.on_message([this](std::string_view msg) {
            handle_message_(msg);
        });
        rt_->monitor.on_status_change([this](const monitor::ConnectionStatus& current, const monitor::ConnectionStatus& previous) {
            if (!stop_requested_ && on_status_change_) {
                on_status_change_(current, previous);
            }
        });
        rt_->monitor.on_alert([this](const monitor::Alert& alert) {
            BL_TL1( telemetry_.alerts_total.inc() );
            if (!stop_requested_ && on_alert_) {
                on_alert_(alert);
            }
        });
    }

    // -------------------------------------------------------------------------
    // Connection signals
    // -------------------------------------------------------------------------

    inline void drain_signals_() {
        if (!rt_) {
            return;
        }
        transport::connection::Signal sig;
        while (!stop_requested_ && rt_->connection.poll_signal(sig)) {
            handle_connection_signal_(sig);
        }
    }

    inline void handle_connection_signal_(transport::connection::Signal sig) {
        switch (sig) {
        case transport::connection::Signal::Connected:
            handle_connect_();
            break;
        case transport::connection::Signal::Disconnected:
            handle_disconnect_();
            break;
        case transport::connection::Signal::RetryScheduled:
            BL_DEBUG("[SUPERVISOR] Reconnect in " << rt_->connection.next_retry_in().count() << " ms");
            break;
        case transport::connection::Signal::RetryExhausted:
            rt_->monitor.raise(monitor::AlertLevel::Critical, monitor::AlertKind::ReconnectExhausted,
                               "Reconnect attempts exhausted");
            break;
        default:
            break;
        }
    }

    // Resync: the bridge may have changed while we were away
    inline void handle_connect_() {
        BL_TRACE("[SUPERVISOR] handle connect (transport_epoch = " << rt_->connection.epoch() << ")");
        rt_->probe.arm(Clock::now());
        BL_TL1( telemetry_.resyncs_total.inc() );
        if (!check_device_connection()) {
            BL_WARN("[SUPERVISOR] Resync request could not be sent");
        }
    }

    inline void handle_disconnect_() {
        BL_TRACE("[SUPERVISOR] handle disconnect (reason = " << transport::to_string(rt_->connection.disconnect_reason()) << ")");
        rt_->probe.disarm();
        set_device_connected_(false);
    }

    // -------------------------------------------------------------------------
    // Liveness
    // -------------------------------------------------------------------------

    inline void service_probe_(TimePoint now) {
        if (stop_requested_ || !rt_->probe.is_armed()) {
            return;
        }
        const std::uint64_t misses_before = rt_->probe.misses_total();
        rt_->probe.tick(now, [this]() {
            BL_TL1( telemetry_.health_requests_total.inc() );
            return send_command_(protocol::bridge::Command::HealthCheck);
        });
        BL_TL1( telemetry_.probe_misses_total.inc(static_cast<std::uint32_t>(rt_->probe.misses_total() - misses_before)) );

        if (rt_->probe.verdict() == health::Verdict::Unresponsive) {
            BL_WARN("[SUPERVISOR] Bridge unresponsive (" << rt_->probe.consecutive_misses()
                    << " missed health acks), forcing reconnect");
            BL_TL1( telemetry_.health_timeouts_total.inc() );
            rt_->monitor.record_error();
            rt_->probe.disarm();
            rt_->connection.force_reconnect(transport::DisconnectReason::HealthTimeout);
            drain_signals_();
        }
    }

    // -------------------------------------------------------------------------
    // Periodic evaluation
    // -------------------------------------------------------------------------

    inline void tick_() {
        BL_TL1( telemetry_.ticks_total.inc() );

        // === Rates ===
        rt_->rate.tick();

        // === Streaming state ===
        const stream::StreamingState& state = rt_->detector.update(rt_->rate.rates());
        const stream::Phase phase = stream::phase_of(state);
        if (phase != last_phase_) {
            last_phase_ = phase;
            if (on_streaming_change_) {
                on_streaming_change_(state);
            }
            if (stop_requested_) {
                return;
            }
        }

        // === Status ===
        const bool websocket_up = rt_->connection.is_connected() &&
                                  rt_->probe.verdict() != health::Verdict::Unresponsive;
        (void)rt_->monitor.record_status(websocket_up, api_reachable_, stream::is_streaming(state));
        if (stop_requested_) {
            return;
        }

        const monitor::OverallStatus overall = rt_->monitor.overall_status();
        if (overall != last_overall_) {
            const monitor::OverallStatus previous = last_overall_;
            last_overall_ = overall;
            BL_INFO("[SUPERVISOR] Overall status: " << monitor::to_string(previous) << " -> " << monitor::to_string(overall));
            if (on_overall_change_) {
                on_overall_change_(overall, previous);
            }
            if (stop_requested_) {
                return;
            }
        }

        // === Maintenance ===
        (void)rt_->monitor.maintain();

        // === Gate ===
        evaluate_gate_();
    }

    [[nodiscard]]
    inline gate::GateInputs gate_inputs_() const {
        gate::GateInputs in;
        in.engine_initialized = engine_initialized_;
        in.device_connected = facts_.device_connected;
        if (rt_) {
            in.streaming = rt_->detector.state();
            in.overall = rt_->monitor.current_status().overall();
        }
        return in;
    }

    inline void evaluate_gate_() {
        if (stop_requested_) {
            return;
        }
        const gate::GateDecision decision = gate::RecordingGate::can_record(gate_inputs_());
        if (gate_evaluated_ && decision == last_gate_) {
            return;
        }
        gate_evaluated_ = true;
        last_gate_ = decision;
        BL_TL1( telemetry_.gate_changes_total.inc() );
        BL_DEBUG("[GATE] Recording " << decision);
        if (on_gate_change_) {
            on_gate_change_(decision);
        }
    }

    // -------------------------------------------------------------------------
    // Inbound messages
    // -------------------------------------------------------------------------

    // Frames still queued behind a deferred stop() are dropped
    inline void handle_message_(std::string_view msg) {
        if (stop_requested_) {
            return;
        }
        const protocol::bridge::parser::Result r = router_.parse_and_route(msg);
        if (protocol::bridge::parser::is_protocol_error(r)) {
            BL_TL1( telemetry_.protocol_errors_total.inc() );
            BL_DEBUG("[SUPERVISOR] Dropped malformed message (" << protocol::bridge::parser::to_string(r) << ")");
        }
    }

    inline void handle_health_ack_(const protocol::bridge::schema::HealthCheckResponse& msg) {
        BL_TL1( telemetry_.health_acks_total.inc() );
        const health::Ack ack{msg.clients_connected, msg.is_streaming, msg.device_connected};
        const auto rtt = rt_->probe.acknowledge(Clock::now(), ack);
        if (rtt.has()) {
            facts_.last_health_rtt = rtt.value();
        }
        facts_.clients_connected = msg.clients_connected;
        facts_.bridge_streaming = msg.is_streaming;
        set_device_connected_(msg.device_connected);
    }

    inline void handle_event_(const protocol::bridge::schema::Event& msg) {
        using protocol::bridge::EventType;
        BL_TL1( telemetry_.events_total.inc() );

        switch (msg.type) {
        case EventType::DeviceConnected:
            set_device_connected_(true);
            break;
        case EventType::DeviceDisconnected:
        case EventType::DeviceConnectionFailed:
            set_device_connected_(false);
            break;
        case EventType::DeviceInfo:
            if (msg.connected.has()) {
                set_device_connected_(msg.connected.value());
            }
            break;
        case EventType::StreamStarted:
            facts_.bridge_streaming = true;
            break;
        case EventType::StreamStopped:
            facts_.bridge_streaming = false;
            break;
        case EventType::BatteryStatus:
            if (msg.battery_level.has()) {
                facts_.battery_level = msg.battery_level.value();
            }
            break;
        case EventType::Error:
            BL_WARN("[SUPERVISOR] Bridge reported an error: " << msg.data);
            break;
        default:
            break;
        }

        if (!stop_requested_ && on_bridge_event_) {
            on_bridge_event_(msg.type, msg.data);
        }
    }

    inline void handle_frame_(const protocol::bridge::schema::SensorFrame& frame) {
        if (!protocol::bridge::is_counted_frame(frame.type)) {
            BL_TL1( telemetry_.frames_ignored_total.inc() );
            return;
        }
        BL_TL1( telemetry_.frames_total.inc() );
        BL_TL2( telemetry_.samples_total.inc(frame.sample_timestamps.size()) );
        rt_->rate.record_batch(frame.sensor, frame.sample_timestamps);
        if (frame.battery_level.has()) {
            facts_.battery_level = frame.battery_level.value();
        }
    }

    inline void set_device_connected_(bool connected) {
        if (facts_.device_connected == connected) {
            return;
        }
        facts_.device_connected = connected;
        BL_INFO("[SUPERVISOR] Device " << (connected ? "connected" : "disconnected"));
        evaluate_gate_();
    }

    // -------------------------------------------------------------------------
    // Outbound commands
    // -------------------------------------------------------------------------

    inline bool send_command_(protocol::bridge::Command command) {
        return send_(protocol::bridge::schema::Command::make(command));
    }

    inline bool send_(const protocol::bridge::schema::Command& cmd) {
        if (!rt_ || !rt_->connection.is_connected()) {
            BL_DEBUG("[SUPERVISOR] Command '" << protocol::bridge::to_string(cmd.command) << "' not sent: bridge not connected");
            BL_TL1( telemetry_.commands_rejected_total.inc() );
            return false;
        }
        cmd_buffer_.clear();
        cmd.write_json(cmd_buffer_);
        BL_TRACE("[SUPERVISOR] Sending: " << cmd_buffer_);
        if (!rt_->connection.send(cmd_buffer_)) {
            BL_ERROR("[SUPERVISOR] Failed to send command: " << cmd_buffer_);
            return false;
        }
        return true;
    }
};

} // namespace bandlink::core
