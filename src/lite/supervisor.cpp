#include <thread>
#include <utility>

#include "bandlink/lite/supervisor.hpp"

// ---- Core includes (PRIVATE) ----
#include "bandlink/core/supervisor.hpp"
#if defined(_WIN32)
#include "bandlink/core/transport/winhttp/websocket.hpp"
#else
#include "bandlink/core/transport/beast/websocket.hpp"
#endif


namespace bandlink::lite {

namespace core = bandlink::core;

#if defined(_WIN32)
using WS = core::transport::winhttp::WebSocket;
#else
using WS = core::transport::beast::WebSocket;
#endif

// -----------------------------
// Impl
// -----------------------------

struct Supervisor::Impl {
    core::Supervisor<WS> supervisor;
};

// -----------------------------
// Supervisor methods
// -----------------------------

Supervisor::Supervisor()
    : impl_(std::make_unique<Impl>()) {}

Supervisor::~Supervisor() = default;

core::config::Error Supervisor::start(const core::config::Supervisor& cfg) {
    return impl_->supervisor.start(cfg);
}

void Supervisor::stop() {
    impl_->supervisor.stop();
}

void Supervisor::poll() {
    impl_->supervisor.poll();
}

bool Supervisor::is_running() const {
    return impl_->supervisor.is_running();
}

void Supervisor::run_for(std::chrono::milliseconds duration, std::chrono::milliseconds tick) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    run_until([deadline]() { return std::chrono::steady_clock::now() >= deadline; }, tick);
}

void Supervisor::set_api_reachable(bool reachable) {
    impl_->supervisor.set_api_reachable(reachable);
}

void Supervisor::record_api_latency(double ms) {
    impl_->supervisor.record_api_latency(ms);
}

void Supervisor::set_engine_initialized(bool initialized) {
    impl_->supervisor.set_engine_initialized(initialized);
}

bool Supervisor::check_device_connection() {
    return impl_->supervisor.check_device_connection();
}

bool Supervisor::check_bluetooth_status() {
    return impl_->supervisor.check_bluetooth_status();
}

bool Supervisor::scan_devices() {
    return impl_->supervisor.scan_devices();
}

bool Supervisor::connect_device(std::string_view address) {
    return impl_->supervisor.connect_device(address);
}

bool Supervisor::disconnect_device() {
    return impl_->supervisor.disconnect_device();
}

bool Supervisor::request_streaming(bool on) {
    return impl_->supervisor.request_streaming(on);
}

void Supervisor::on_status_change(status_handler cb) {
    impl_->supervisor.on_status_change(std::move(cb));
}

void Supervisor::on_overall_change(overall_handler cb) {
    impl_->supervisor.on_overall_change(std::move(cb));
}

void Supervisor::on_streaming_change(streaming_handler cb) {
    impl_->supervisor.on_streaming_change(std::move(cb));
}

void Supervisor::on_gate_change(gate_handler cb) {
    impl_->supervisor.on_gate_change(std::move(cb));
}

void Supervisor::on_alert(alert_handler cb) {
    impl_->supervisor.on_alert(std::move(cb));
}

void Supervisor::on_bridge_event(event_handler cb) {
    if (!cb) {
        impl_->supervisor.on_bridge_event(nullptr);
        return;
    }
    impl_->supervisor.on_bridge_event(
        [cb = std::move(cb)](core::protocol::bridge::EventType type, std::string_view data) {
            cb(core::protocol::bridge::to_string(type), data);
        });
}

core::gate::GateDecision Supervisor::can_record() const {
    return impl_->supervisor.can_record();
}

core::monitor::OverallStatus Supervisor::overall_status() const {
    return impl_->supervisor.overall_status();
}

core::monitor::ConnectionStatus Supervisor::current_status() const {
    return impl_->supervisor.current_status();
}

core::stream::StreamingState Supervisor::streaming_state() const {
    return impl_->supervisor.streaming_state();
}

double Supervisor::current_rate(core::SensorType sensor) const {
    return impl_->supervisor.current_rate(sensor);
}

core::monitor::ConnectionMetrics Supervisor::metrics() const {
    return impl_->supervisor.metrics();
}

void Supervisor::debug_dump(std::ostream& os) const {
    impl_->supervisor.debug_dump(os);
#if defined(BANDLINK_ENABLE_TELEMETRY_L1)
    impl_->supervisor.telemetry().debug_dump(os);
#endif
}

} // namespace bandlink::lite
