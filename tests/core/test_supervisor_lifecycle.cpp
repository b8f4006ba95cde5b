/*
===============================================================================
 core::Supervisor - Lifecycle Unit Tests
===============================================================================

Scope:
------
start() / stop() contract of bandlink::core::Supervisor and the reconnect
policy as seen from the supervisor.

Covered Requirements:
---------------------
L1. Invalid configuration
    - start() returns the validation error, nothing is created or connected
L2. stop() cancels every timer and releases the socket
    - No reconnect attempt after stop(), even with a retry pending
L3. Exhausted reconnect policy
    - Critical "Reconnect attempts exhausted" alert, no further attempts
L4. Host inputs
    - Engine flag and api reachability drive the gate and the raw status
L5. Restart
    - start() while running restarts on a fresh runtime
L6. stop() from an observer
    - Teardown runs once poll() unwinds; no observer fires after stop()

===============================================================================
*/

#include <iostream>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

#include "common/harness/supervisor.hpp"

using bandlink::core::test::SupervisorHarness;
using bandlink::core::test::harness::deterministic_config;
using bandlink::core::test::harness::make_event;
using bandlink::core::test::harness::make_frame;
using monitor::OverallStatus;


// -----------------------------------------------------------------------------
// L1. Invalid configuration
// -----------------------------------------------------------------------------
void test_invalid_config() {
    std::cout << "[TEST] Invalid configuration\n";
    SupervisorHarness h;

    config::Supervisor cfg = deterministic_config();
    cfg.url = "http://localhost:8121/stream";
    TEST_CHECK(h.supervisor.start(cfg) == config::Error::InvalidUrl);

    cfg = deterministic_config();
    cfg.url = "wss://localhost:8121/stream";
    TEST_CHECK(h.supervisor.start(cfg) == config::Error::InvalidUrl);

    cfg = deterministic_config();
    cfg.tick_interval = std::chrono::milliseconds(0);
    TEST_CHECK(h.supervisor.start(cfg) == config::Error::InvalidInterval);

    TEST_CHECK(!h.supervisor.is_running());
    TEST_CHECK(h.supervisor.pending_timers() == 0);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);
    TEST_CHECK(h.gate_changes.empty());

    // Polling a supervisor that never started is harmless
    h.advance(std::chrono::milliseconds(5000));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);
    TEST_CHECK(h.supervisor.overall_status() == OverallStatus::Offline);
    TEST_CHECK(!h.supervisor.can_record().allowed);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L2. stop()
// -----------------------------------------------------------------------------
void test_stop_cancels_timers() {
    std::cout << "[TEST] stop() cancels every timer\n";

    {
        SupervisorHarness h;
        h.start();
        h.streaming_second();

        // Tick timer, probe send timer, one outstanding health check
        TEST_CHECK(h.supervisor.pending_timers() == 3);
        TEST_CHECK(WebSocketUnderTest::open_handles() == 1);

        h.supervisor.stop();
        TEST_CHECK(!h.supervisor.is_running());
        TEST_CHECK(h.supervisor.pending_timers() == 0);
        TEST_CHECK(WebSocketUnderTest::open_handles() == 0);
        TEST_CHECK(h.supervisor.connection_state() == State::Disconnected);

        h.advance(std::chrono::milliseconds(10000));
        TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
        TEST_CHECK(WebSocketUnderTest::sent_count("health_check") == 2);

        // Idempotent
        h.supervisor.stop();
        TEST_CHECK(!h.supervisor.is_running());
    }

    // Retry pending at stop()
    {
        SupervisorHarness h;
        h.start();
        h.ws().emit_close();
        h.poll();
        TEST_CHECK(h.supervisor.connection_state() == State::WaitingReconnect);
        TEST_CHECK(h.supervisor.connection().pending_timers() == 1);

        h.supervisor.stop();
        TEST_CHECK(h.supervisor.pending_timers() == 0);

        h.advance(std::chrono::milliseconds(60000));
        TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
        TEST_CHECK(WebSocketUnderTest::open_handles() == 0);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L3. Exhausted reconnect policy
// -----------------------------------------------------------------------------
void test_reconnect_exhausted() {
    std::cout << "[TEST] Reconnect attempts exhausted\n";
    SupervisorHarness h;

    config::Supervisor cfg = deterministic_config();
    cfg.reconnect.max_attempts = 1;

    WebSocketUnderTest::fail_next_connect(Error::TransportFailure);
    WebSocketUnderTest::fail_next_connect(Error::TransportFailure);
    h.start(cfg);

    // Initial failure: one retry allowed
    TEST_CHECK(h.supervisor.connection_state() == State::WaitingReconnect);
    TEST_CHECK(h.alerts.empty());

    h.advance(std::chrono::milliseconds(1000));
    TEST_CHECK(h.supervisor.connection_state() == State::Connecting);
    TEST_CHECK(h.alerts.size() == 1);
    TEST_CHECK(h.alerts[0].kind == monitor::AlertKind::Offline);

    h.poll();
    TEST_CHECK(h.supervisor.connection_state() == State::Disconnected);
    TEST_CHECK(h.supervisor.connection().disconnect_reason() == DisconnectReason::RetryExhausted);
    TEST_CHECK(h.alerts.size() == 2);
    TEST_CHECK(h.alerts[1].level == monitor::AlertLevel::Critical);
    TEST_CHECK(h.alerts[1].kind == monitor::AlertKind::ReconnectExhausted);
    TEST_CHECK(h.alerts[1].message == "Reconnect attempts exhausted");
    TEST_CHECK(h.alerts[1].id == 2);

    h.advance(std::chrono::milliseconds(60000));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(h.supervisor.is_running());
    TEST_CHECK(h.raw_overall() == OverallStatus::Offline);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L4. Host inputs
// -----------------------------------------------------------------------------
void test_host_inputs() {
    std::cout << "[TEST] Engine flag and api reachability\n";
    SupervisorHarness h;
    h.start();
    h.streaming_second();
    TEST_CHECK(h.supervisor.can_record().allowed);

    h.supervisor.set_engine_initialized(false);
    TEST_CHECK(!h.gate_changes.back().allowed);
    TEST_CHECK(h.gate_changes.back().reason == "Engine is not initialized");

    h.supervisor.set_engine_initialized(true);
    TEST_CHECK(h.gate_changes.back().allowed);

    // Unchanged input: no new decision
    const std::size_t decisions = h.gate_changes.size();
    h.supervisor.set_engine_initialized(true);
    TEST_CHECK(h.gate_changes.size() == decisions);

    // REST api down: websocket alone is Degraded, the gate still allows
    h.supervisor.set_api_reachable(false);
    h.streaming_second();
    TEST_CHECK(h.raw_overall() == OverallStatus::Degraded);
    TEST_CHECK(h.supervisor.current_status().websocket());
    TEST_CHECK(!h.supervisor.current_status().api());
    TEST_CHECK(h.supervisor.can_record().allowed);

    // Latency feeds the metrics EMA
    h.supervisor.record_api_latency(100.0);
    h.supervisor.record_api_latency(200.0);
    TEST_CHECK_NEAR(h.supervisor.metrics().average_latency_ms, 110.0, 1e-9);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L5. Restart
// -----------------------------------------------------------------------------
void test_restart() {
    std::cout << "[TEST] start() while running\n";
    SupervisorHarness h;
    h.start();
    h.streaming_second();
    h.streaming_second();
    TEST_CHECK(h.supervisor.metrics().total_checks == 2);

    TEST_CHECK(h.supervisor.start(deterministic_config()) == config::Error::None);
    h.poll();
    TEST_CHECK(h.supervisor.is_running());
    TEST_CHECK(h.supervisor.connection_state() == State::Connected);
    TEST_CHECK(h.supervisor.transport_epoch() == 1);
    TEST_CHECK(h.supervisor.metrics().total_checks == 0);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(WebSocketUnderTest::open_handles() == 1);

    std::ostringstream os;
    h.supervisor.debug_dump(os);
    TEST_CHECK(os.str().find("Connection Monitor") != std::string::npos);
    TEST_CHECK(os.str().find("=== Bridge ===") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// L6. stop() from an observer
// -----------------------------------------------------------------------------
void test_stop_from_observer() {
    std::cout << "[TEST] stop() from inside an observer\n";

    // Gate change while frames are still queued behind the event
    {
        SupervisorHarness h;
        h.start();
        h.streaming_second();
        TEST_CHECK(h.supervisor.can_record().allowed);

        int gate_calls = 0;
        bool running_inside = true;
        h.supervisor.on_gate_change([&](const gate::GateDecision& d) {
            ++gate_calls;
            TEST_CHECK(!d.allowed);
            h.supervisor.stop();
            running_inside = h.supervisor.is_running();
        });

        const std::size_t events_before = h.events.size();
        h.inject(make_event("device_disconnected", "null"));
        h.inject(make_frame("raw_data", "eeg", h.device_time, 256));
        h.inject(make_event("device_connected", "null"));
        h.poll();

        TEST_CHECK(gate_calls == 1);
        TEST_CHECK(!running_inside);
        TEST_CHECK(h.events.size() == events_before);
        TEST_CHECK(!h.supervisor.is_running());
        TEST_CHECK(h.supervisor.pending_timers() == 0);
        TEST_CHECK(h.supervisor.connection_state() == State::Disconnected);
        TEST_CHECK(WebSocketUnderTest::open_handles() == 0);

        h.advance(std::chrono::milliseconds(10000));
        TEST_CHECK(gate_calls == 1);
        TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    }

    // Critical alert raised while connection signals are being drained
    {
        SupervisorHarness h;
        config::Supervisor cfg = deterministic_config();
        cfg.reconnect.max_attempts = 1;

        std::vector<monitor::AlertKind> kinds;
        h.supervisor.on_alert([&](const monitor::Alert& a) {
            kinds.push_back(a.kind);
            if (a.kind == monitor::AlertKind::ReconnectExhausted) {
                h.supervisor.stop();
            }
        });

        WebSocketUnderTest::fail_next_connect(Error::TransportFailure);
        WebSocketUnderTest::fail_next_connect(Error::TransportFailure);
        h.start(cfg);
        h.advance(std::chrono::milliseconds(1000));
        TEST_CHECK(h.supervisor.is_running());

        h.poll();
        TEST_CHECK(kinds.size() == 2);
        TEST_CHECK(kinds.back() == monitor::AlertKind::ReconnectExhausted);
        TEST_CHECK(!h.supervisor.is_running());
        TEST_CHECK(h.supervisor.pending_timers() == 0);

        h.advance(std::chrono::milliseconds(60000));
        TEST_CHECK(kinds.size() == 2);
        TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    }

    // Streaming change during the periodic tick
    {
        SupervisorHarness h;
        h.start();
        const std::uint32_t status_before = h.status_changes;
        const std::size_t gate_before = h.gate_changes.size();

        int streaming_calls = 0;
        h.supervisor.on_streaming_change([&](const stream::StreamingState&) {
            ++streaming_calls;
            h.supervisor.stop();
        });
        h.streaming_second();

        TEST_CHECK(streaming_calls == 1);
        TEST_CHECK(!h.supervisor.is_running());
        TEST_CHECK(h.status_changes == status_before);
        TEST_CHECK(h.gate_changes.size() == gate_before);
        TEST_CHECK(h.overall_changes.empty());
        TEST_CHECK(WebSocketUnderTest::open_handles() == 0);

        // The supervisor can be started again afterwards
        h.start();
        TEST_CHECK(h.supervisor.is_running());
        TEST_CHECK(h.supervisor.connection_state() == State::Connected);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_invalid_config();
    test_stop_cancels_timers();
    test_reconnect_exhausted();
    test_host_inputs();
    test_restart();
    test_stop_from_observer();

    std::cout << "\n[SUPERVISOR LIFECYCLE TESTS PASSED]\n";
    return 0;
}
