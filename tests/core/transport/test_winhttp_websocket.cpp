/*
================================================================================
WinHTTP WebSocket Backend Unit Tests
================================================================================

Exercises transport::winhttp::WebSocketImpl without WinHTTP, the OS or any
network I/O: the receive loop runs against a scripted Api injected as a
compile-time policy.

Covered:
  W1. Close frame: Open then exactly one Close(RemoteClosed)
  W2. Receive errors map to transport errors, one terminal event each
  W3. Fragmented text frames are reassembled into one message
  W4. Local close(): idempotent, no terminal event after it
  W5. send(): reports the Api result, false once closed
================================================================================
*/

#include <algorithm>
#include <atomic>
#include <cstring>
#include <deque>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

#include "bandlink/core/transport/websocket_concept.hpp"
#include "bandlink/core/transport/winhttp/api.hpp"
#include "bandlink/core/transport/winhttp/websocket.hpp"
#include "common/test_check.hpp"


namespace bandlink::core::transport::winhttp {

// -----------------------------------------------------------------------------
// Scripted WinHTTP API (test-only)
// -----------------------------------------------------------------------------
struct FakeApi {
    struct Step {
        DWORD result{ERROR_SUCCESS};
        WINHTTP_WEB_SOCKET_BUFFER_TYPE type{WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE};
        std::string payload{};
    };

    // Filled before the receive loop starts, consumed by the backend thread
    std::deque<Step> script;

    std::atomic<int> receive_count{0};
    std::atomic<int> send_count{0};
    std::atomic<int> close_count{0};
    DWORD send_result = ERROR_SUCCESS;

    // Script exhausted: block like a real receive until the socket is closed
    DWORD websocket_receive(HINTERNET, void* buffer, DWORD buffer_len, DWORD* bytes, WINHTTP_WEB_SOCKET_BUFFER_TYPE* type) {
        ++receive_count;
        *bytes = 0;
        if (script.empty()) {
            while (close_count.load() == 0) {
                std::this_thread::yield();
            }
            return ERROR_WINHTTP_OPERATION_CANCELLED;
        }
        Step step = std::move(script.front());
        script.pop_front();
        *type = step.type;
        if (step.result != ERROR_SUCCESS) {
            return step.result;
        }
        const DWORD n = static_cast<DWORD>(std::min<std::size_t>(step.payload.size(), buffer_len));
        std::memcpy(buffer, step.payload.data(), n);
        *bytes = n;
        return ERROR_SUCCESS;
    }

    DWORD websocket_send_text(HINTERNET, std::string_view) {
        ++send_count;
        return send_result;
    }

    void websocket_close(HINTERNET) {
        ++close_count;
    }
};
static_assert(ApiConcept<FakeApi>);

} // namespace bandlink::core::transport::winhttp


// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace bandlink::core;
using namespace bandlink::core::transport;

using WebSocketUnderTest = winhttp::WebSocketImpl<winhttp::FakeApi>;
static_assert(WebSocketConcept<WebSocketUnderTest>);

namespace {

void start(WebSocketUnderTest& ws) {
    std::atomic<bool> started{false};
    ws.set_receive_started_flag(&started);
    ws.test_start_receive_loop();
    while (!started.load(std::memory_order_acquire)) {
        std::this_thread::yield();
    }
    ws.set_receive_started_flag(nullptr);
}

websocket::Event next_event(WebSocketUnderTest& ws) {
    websocket::Event ev;
    while (!ws.poll_event(ev)) {
        std::this_thread::yield();
    }
    return ev;
}

void expect_open(WebSocketUnderTest& ws) {
    const websocket::Event ev = next_event(ws);
    TEST_CHECK(ev.type == websocket::EventType::Open);
}

} // namespace


// -----------------------------------------------------------------------------
// W1. Close frame
// -----------------------------------------------------------------------------
void test_close_frame() {
    std::cout << "[TEST] Close frame\n";
    transport::telemetry::WebSocket telemetry;
    WebSocketUnderTest ws(telemetry);
    ws.test_api().script.push_back({ERROR_SUCCESS, WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE, {}});

    start(ws);
    expect_open(ws);
    const websocket::Event ev = next_event(ws);
    TEST_CHECK(ev.type == websocket::EventType::Close);
    TEST_CHECK(ev.error == Error::RemoteClosed);

    ws.close();
    websocket::Event extra;
    TEST_CHECK(!ws.poll_event(extra));
    TEST_CHECK(telemetry.close_events_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W2. Receive errors
// -----------------------------------------------------------------------------
void check_receive_error(DWORD code, websocket::EventType expected_type, Error expected_error) {
    transport::telemetry::WebSocket telemetry;
    WebSocketUnderTest ws(telemetry);
    ws.test_api().script.push_back({code, WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, {}});

    start(ws);
    expect_open(ws);
    const websocket::Event ev = next_event(ws);
    TEST_CHECK(ev.type == expected_type);
    TEST_CHECK(ev.error == expected_error);

    ws.close();
    websocket::Event extra;
    TEST_CHECK(!ws.poll_event(extra));
    TEST_CHECK(telemetry.receive_errors_total.load() == 1);
}

void test_receive_errors() {
    std::cout << "[TEST] Receive errors\n";
    check_receive_error(ERROR_WINHTTP_CONNECTION_ERROR, websocket::EventType::Close, Error::RemoteClosed);
    check_receive_error(ERROR_WINHTTP_TIMEOUT, websocket::EventType::Error, Error::Timeout);
    check_receive_error(ERROR_WINHTTP_INTERNAL_ERROR, websocket::EventType::Error, Error::TransportFailure);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W3. Fragment reassembly
// -----------------------------------------------------------------------------
void test_fragment_reassembly() {
    std::cout << "[TEST] Fragmented frames are reassembled\n";
    transport::telemetry::WebSocket telemetry;
    WebSocketUnderTest ws(telemetry);
    auto& script = ws.test_api().script;
    script.push_back({ERROR_SUCCESS, WINHTTP_WEB_SOCKET_UTF8_FRAGMENT_BUFFER_TYPE, R"({"type":"event",)"});
    script.push_back({ERROR_SUCCESS, WINHTTP_WEB_SOCKET_UTF8_FRAGMENT_BUFFER_TYPE, R"("event_type":"stream_started",)"});
    script.push_back({ERROR_SUCCESS, WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, R"("data":null})"});
    script.push_back({ERROR_SUCCESS, WINHTTP_WEB_SOCKET_UTF8_MESSAGE_BUFFER_TYPE, R"({"type":"health_check_response"})"});

    start(ws);
    expect_open(ws);

    std::string msg;
    while (!ws.poll_message(msg)) {
        std::this_thread::yield();
    }
    TEST_CHECK(msg == R"({"type":"event","event_type":"stream_started","data":null})");
    while (!ws.poll_message(msg)) {
        std::this_thread::yield();
    }
    TEST_CHECK(msg == R"({"type":"health_check_response"})");

    ws.close();
    TEST_CHECK(telemetry.messages_rx_total.load() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W4. Local close
// -----------------------------------------------------------------------------
void test_local_close() {
    std::cout << "[TEST] Local close\n";
    transport::telemetry::WebSocket telemetry;
    WebSocketUnderTest ws(telemetry);

    start(ws);
    expect_open(ws);
    while (ws.test_api().receive_count.load() < 1) {
        std::this_thread::yield();
    }

    ws.close();
    ws.close();
    TEST_CHECK(ws.test_api().close_count.load() == 1);

    websocket::Event ev;
    TEST_CHECK(!ws.poll_event(ev));
    TEST_CHECK(telemetry.close_events_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W5. send()
// -----------------------------------------------------------------------------
void test_send() {
    std::cout << "[TEST] send()\n";
    transport::telemetry::WebSocket telemetry;
    WebSocketUnderTest ws(telemetry);

    TEST_CHECK(!ws.send(R"({"type":"command","command":"health_check"})"));
    TEST_CHECK(ws.test_api().send_count.load() == 0);

    start(ws);
    expect_open(ws);

    TEST_CHECK(ws.send(R"({"type":"command","command":"health_check"})"));
    TEST_CHECK(telemetry.messages_tx_total.load() == 1);

    ws.test_api().send_result = ERROR_WINHTTP_CONNECTION_ERROR;
    TEST_CHECK(!ws.send(R"({"type":"command","command":"scan_devices"})"));
    TEST_CHECK(telemetry.send_errors_total.load() == 1);
    TEST_CHECK(ws.test_api().send_count.load() == 2);

    ws.close();
    TEST_CHECK(!ws.send(R"({"type":"command","command":"health_check"})"));
    TEST_CHECK(ws.test_api().send_count.load() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_close_frame();
    test_receive_errors();
    test_fragment_reassembly();
    test_local_close();
    test_send();

    std::cout << "\n[WINHTTP WEBSOCKET TESTS PASSED]\n";
    return 0;
}
