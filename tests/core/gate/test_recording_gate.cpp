/*
===============================================================================
 gate::RecordingGate Unit Tests
===============================================================================

Covered Requirements:
---------------------
1. Recording is allowed only with an initialized engine, a connected device,
   an Active stream and a bridge that is not Offline
2. Denial order: offline > engine > device > no data > degrading
3. Ready and Degraded bridges do not block recording on their own

===============================================================================
*/

#include <iostream>

#include "bandlink/core/gate/recording_gate.hpp"
#include "common/test_check.hpp"

using namespace bandlink::core;
using namespace bandlink::core::gate;
using monitor::OverallStatus;


static GateInputs ready_inputs() {
    GateInputs in;
    in.engine_initialized = true;
    in.device_connected = true;
    in.streaming = stream::Active{};
    in.overall = OverallStatus::Healthy;
    return in;
}


void test_allowed() {
    std::cout << "[TEST] All preconditions met\n";

    const GateDecision d = RecordingGate::can_record(ready_inputs());
    TEST_CHECK(d.allowed);
    TEST_CHECK(d.reason == "Ready to record");

    GateInputs in = ready_inputs();
    in.overall = OverallStatus::Ready;
    TEST_CHECK(RecordingGate::can_record(in).allowed);
    in.overall = OverallStatus::Degraded;
    TEST_CHECK(RecordingGate::can_record(in).allowed);

    std::cout << "[TEST] OK\n";
}

void test_single_denials() {
    std::cout << "[TEST] Each missing precondition denies\n";

    GateInputs in = ready_inputs();
    in.overall = OverallStatus::Offline;
    TEST_CHECK(RecordingGate::can_record(in) == (GateDecision{false, "Bridge connection is offline"}));

    in = ready_inputs();
    in.engine_initialized = false;
    TEST_CHECK(RecordingGate::can_record(in) == (GateDecision{false, "Engine is not initialized"}));

    in = ready_inputs();
    in.device_connected = false;
    TEST_CHECK(RecordingGate::can_record(in) == (GateDecision{false, "No device connected"}));

    in = ready_inputs();
    in.streaming = stream::Idle{};
    TEST_CHECK(RecordingGate::can_record(in) == (GateDecision{false, "No data is streaming"}));

    in = ready_inputs();
    in.streaming = stream::Degrading{{}, 1};
    TEST_CHECK(RecordingGate::can_record(in) == (GateDecision{false, "Data stream is degrading"}));

    std::cout << "[TEST] OK\n";
}

void test_denial_order() {
    std::cout << "[TEST] Denial order\n";

    GateInputs in{};   // everything missing
    TEST_CHECK(RecordingGate::can_record(in).reason == "Bridge connection is offline");

    in.overall = OverallStatus::Ready;
    TEST_CHECK(RecordingGate::can_record(in).reason == "Engine is not initialized");

    in.engine_initialized = true;
    TEST_CHECK(RecordingGate::can_record(in).reason == "No device connected");

    in.device_connected = true;
    TEST_CHECK(RecordingGate::can_record(in).reason == "No data is streaming");

    in.streaming = stream::Degrading{};
    TEST_CHECK(RecordingGate::can_record(in).reason == "Data stream is degrading");

    in.streaming = stream::Active{};
    TEST_CHECK(RecordingGate::can_record(in).allowed);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_allowed();
    test_single_denials();
    test_denial_order();

    std::cout << "\n[RECORDING GATE TESTS PASSED]\n";
    return 0;
}
