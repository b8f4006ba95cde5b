/*
===============================================================================
 transport::Connection - Reconnection Unit Tests
===============================================================================

Scope:
------
Retry cycle of bandlink::core::transport::Connection driven by policy::Backoff
and a ManualClock (jitter disabled).

Covered Requirements:
---------------------
R1. Exponential backoff
    - Failed attempts are retried after 1s, 2s, 4s
R2. Attempt counter reset
    - A successful connection restarts the sequence at 1s
R3. Retry exhaustion
    - With max_attempts, the cycle ends in Disconnected / RetryExhausted
R4. Non-retryable failures
    - No retry is scheduled, the connection stays Disconnected
R5. close() cancels the pending retry
R6. open() during the wait overrides the retry cycle
R7. Synchronous refusal
    - open() reports the error and the retry cycle still applies

===============================================================================
*/

#include <iostream>
#include <chrono>

#include "common/harness/connection.hpp"

using bandlink::core::transport::test::ConnectionHarness;
using bandlink::core::transport::test::harness::deterministic_reconnect;
using namespace std::chrono_literals;


// -----------------------------------------------------------------------------
// R1: Exponential backoff
// -----------------------------------------------------------------------------
void test_exponential_backoff() {
    std::cout << "[TEST] R1: exponential backoff 1s, 2s, 4s\n";
    ConnectionHarness h;

    WebSocketUnderTest::fail_next_connect(Error::ConnectionFailed);
    WebSocketUnderTest::fail_next_connect(Error::ConnectionFailed);
    WebSocketUnderTest::fail_next_connect(Error::HandshakeFailed);

    TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
    h.poll();

    TEST_CHECK(h.connection->state() == State::WaitingReconnect);
    TEST_CHECK(h.connection->next_retry_in() == 1000ms);
    TEST_CHECK(h.count(connection::Signal::RetryScheduled) == 1);
    TEST_CHECK(WebSocketUnderTest::instances() == 1);
    TEST_CHECK(WebSocketUnderTest::open_handles() == 0);

    h.advance(999ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    h.advance(1ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(h.connection->retry_attempts() == 1);

    // Second failure is reported on the next poll
    h.poll();
    TEST_CHECK(h.connection->state() == State::WaitingReconnect);
    TEST_CHECK(h.connection->next_retry_in() == 2000ms);

    h.advance(1999ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    h.advance(1ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 3);

    h.poll();
    TEST_CHECK(h.connection->next_retry_in() == 4000ms);
    TEST_CHECK(h.connection->last_error() == Error::HandshakeFailed);

    // Fourth attempt succeeds
    h.advance(4000ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 4);
    h.poll();

    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(h.connection->retry_attempts() == 0);
    TEST_CHECK(h.connection->epoch() == 1);
    TEST_CHECK(h.count(connection::Signal::Connected) == 1);
    TEST_CHECK(h.count(connection::Signal::RetryScheduled) == 3);
    TEST_CHECK(WebSocketUnderTest::max_open_handles() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R2: Attempt counter reset
// -----------------------------------------------------------------------------
void test_backoff_resets_after_success() {
    std::cout << "[TEST] R2: backoff resets after a successful connection\n";
    ConnectionHarness h;

    WebSocketUnderTest::fail_next_connect(Error::ConnectionFailed);
    WebSocketUnderTest::fail_next_connect(Error::ConnectionFailed);
    TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
    h.poll();
    h.advance(1000ms);
    h.poll();
    h.advance(2000ms);
    h.poll();
    TEST_CHECK(h.connection->is_connected());

    // Connection lost: the cycle starts again at base delay
    WebSocketUnderTest::current()->emit_close();
    h.poll();

    TEST_CHECK(h.connection->state() == State::WaitingReconnect);
    TEST_CHECK(h.connection->next_retry_in() == 1000ms);
    TEST_CHECK(h.connection->disconnect_reason() == DisconnectReason::TransportError);
    TEST_CHECK(h.changes.size() == 2);
    TEST_CHECK(h.changes[1] == false);

    h.advance(1000ms);
    h.poll();
    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(h.connection->epoch() == 2);
    TEST_CHECK(h.changes.back() == true);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R3: Retry exhaustion
// -----------------------------------------------------------------------------
void test_retry_exhaustion() {
    std::cout << "[TEST] R3: retry exhaustion\n";
    ConnectionHarness h{deterministic_reconnect(2)};

    for (int i = 0; i < 3; ++i) {
        WebSocketUnderTest::fail_next_connect(Error::ConnectionFailed);
    }

    TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
    h.poll();
    h.advance(1000ms);
    h.poll();
    h.advance(2000ms);
    h.poll();

    TEST_CHECK(WebSocketUnderTest::connect_calls() == 3);
    TEST_CHECK(h.connection->state() == State::Disconnected);
    TEST_CHECK(h.connection->disconnect_reason() == DisconnectReason::RetryExhausted);
    TEST_CHECK(h.count(connection::Signal::RetryExhausted) == 1);
    TEST_CHECK(h.count(connection::Signal::RetryScheduled) == 2);
    TEST_CHECK(h.connection->pending_timers() == 0);
    TEST_CHECK(h.telemetry.retry_exhausted_total.load() == 1);

    // Nothing further happens on its own
    h.advance(60000ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 3);

    // An explicit open() starts a fresh cycle
    TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
    h.poll();
    TEST_CHECK(h.connection->is_connected());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R4: Non-retryable failures
// -----------------------------------------------------------------------------
void test_non_retryable_failure() {
    std::cout << "[TEST] R4: non-retryable failures are not retried\n";
    {
        ConnectionHarness h;
        WebSocketUnderTest::fail_next_connect(Error::ProtocolError);
        TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
        h.poll();

        TEST_CHECK(h.connection->state() == State::Disconnected);
        TEST_CHECK(h.connection->last_error() == Error::ProtocolError);
        TEST_CHECK(h.count(connection::Signal::RetryScheduled) == 0);
        TEST_CHECK(h.connection->pending_timers() == 0);
    }
    {
        ConnectionHarness h;
        h.open_and_connect();
        WebSocketUnderTest::current()->emit_close(Error::ProtocolError);
        h.poll();

        TEST_CHECK(h.connection->state() == State::Disconnected);
        TEST_CHECK(h.count(connection::Signal::Disconnected) == 1);
        TEST_CHECK(h.count(connection::Signal::RetryScheduled) == 0);
        TEST_CHECK(h.changes.size() == 2);
        TEST_CHECK(h.changes[1] == false);

        h.advance(10000ms);
        TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R5: close() cancels the pending retry
// -----------------------------------------------------------------------------
void test_close_cancels_retry() {
    std::cout << "[TEST] R5: close cancels the pending retry\n";
    ConnectionHarness h;

    WebSocketUnderTest::fail_next_connect(Error::ConnectionFailed);
    TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
    h.poll();
    TEST_CHECK(h.connection->pending_timers() == 1);

    h.connection->close();
    TEST_CHECK(h.connection->state() == State::Disconnected);
    TEST_CHECK(h.connection->pending_timers() == 0);
    TEST_CHECK(h.connection->disconnect_reason() == DisconnectReason::LocalClose);

    h.advance(10000ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(h.count(connection::Signal::Connected) == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R6: open() during the wait
// -----------------------------------------------------------------------------
void test_open_during_wait() {
    std::cout << "[TEST] R6: open during reconnect wait connects immediately\n";
    ConnectionHarness h;

    WebSocketUnderTest::fail_next_connect(Error::ConnectionFailed);
    TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
    h.poll();
    TEST_CHECK(h.connection->state() == State::WaitingReconnect);

    TEST_CHECK(h.connection->open(TEST_URL) == Error::None);
    TEST_CHECK(h.connection->state() == State::Connecting);
    TEST_CHECK(h.connection->pending_timers() == 0);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);

    h.poll();
    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(h.connection->retry_attempts() == 0);
    TEST_CHECK(WebSocketUnderTest::max_open_handles() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R7: Synchronous refusal
// -----------------------------------------------------------------------------
void test_synchronous_refusal() {
    std::cout << "[TEST] R7: synchronous connect refusal\n";
    ConnectionHarness h;

    WebSocketUnderTest::refuse_next_connect(Error::ConnectionFailed);
    TEST_CHECK(h.connection->open(TEST_URL) == Error::ConnectionFailed);
    h.drain_signals();

    TEST_CHECK(h.connection->state() == State::WaitingReconnect);
    TEST_CHECK(h.count(connection::Signal::RetryScheduled) == 1);
    TEST_CHECK(WebSocketUnderTest::open_handles() == 0);

    h.advance(1000ms);
    h.poll();
    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_exponential_backoff();
    test_backoff_resets_after_success();
    test_retry_exhaustion();
    test_non_retryable_failure();
    test_close_cancels_retry();
    test_open_during_wait();
    test_synchronous_refusal();

    std::cout << "\n[CONNECTION RECONNECT TESTS PASSED]\n";
    return 0;
}
