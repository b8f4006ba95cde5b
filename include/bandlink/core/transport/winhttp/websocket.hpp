#pragma once

#include <string>
#include <string_view>
#include <thread>
#include <atomic>
#include <vector>
#include <system_error>
#include <cstdlib>

#include "bandlink/core/transport/websocket_concept.hpp"
#include "bandlink/core/transport/error.hpp"
#include "bandlink/core/transport/websocket/events.hpp"
#include "bandlink/core/transport/winhttp/api.hpp"
#include "bandlink/core/transport/telemetry/websocket.hpp"
#include "bandlink/core/telemetry.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"

#include <windows.h>
#include <winhttp.h>
#include <winerror.h>

/*
================================================================================
WebSocket Transport (WinHTTP)
================================================================================

Windows backend for the bridge link, same contract as transport::beast:

  • Single-attempt primitive: no retries, no reconnection logic
  • connect() opens the session and returns; the HTTP upgrade and the receive
    loop run on the backend thread, which reports Open / Close / Error through
    the control ring and complete text frames through the message ring
  • Exactly one terminal event per attempt, none after a local close()
  • WinHTTP calls used by the receive loop are injected as a compile-time
    policy (WebSocketImpl<ApiConcept>) so the loop runs against a scripted API
    in unit tests

Plain ws:// only; the bridge listens on loopback.
================================================================================
*/

namespace bandlink::core::transport::winhttp {

// UTF-8 to UTF-16 for the WinHTTP wide-string API
inline std::wstring to_wide(const std::string& utf8) {
    if (utf8.empty()) return L"";
    int size = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), (int)utf8.size(), NULL, 0);
    std::wstring out(size, 0);
    MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), (int)utf8.size(), &out[0], size);
    return out;
}

template<ApiConcept Api = RealApi>
class WebSocketImpl {
    // Bridge frames are small JSON documents; larger ones arrive as fragments
    constexpr static size_t RX_BUFFER_SIZE = 8 * 1024;

    static constexpr std::size_t MESSAGE_RING_SIZE = 1024;
    static constexpr std::size_t CONTROL_RING_SIZE = 16;

    // resolve, connect, send, receive (ms); receive stays unbounded, liveness
    // is the health probe's job
    static constexpr int RESOLVE_TIMEOUT_MS = 2000;
    static constexpr int CONNECT_TIMEOUT_MS = 5000;
    static constexpr int SEND_TIMEOUT_MS    = 5000;

public:
    explicit WebSocketImpl(telemetry::WebSocket& telemetry) noexcept
        : telemetry_(telemetry) {
    }

    ~WebSocketImpl() {
        close();
        if (hSession_) {
            WinHttpCloseHandle(hSession_);
            hSession_ = nullptr;
        }
    }

    WebSocketImpl(const WebSocketImpl&) = delete;
    WebSocketImpl& operator=(const WebSocketImpl&) = delete;

    [[nodiscard]]
    inline Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
        if (hSession_) {
            BL_WARN("[WS] connect() called twice on the same backend instance");
            return Error::InvalidState;
        }
        BL_TL1( telemetry_.connect_attempts_total.inc() );

        char* end = nullptr;
        const unsigned long port_number = std::strtoul(port.c_str(), &end, 10);
        if (port.empty() || *end != '\0' || port_number == 0 || port_number > 65535) {
            BL_ERROR("[WS] Invalid port '" << port << "'");
            return Error::InvalidUrl;
        }

        hSession_ = WinHttpOpen(
            L"bandlink/1.0",
            WINHTTP_ACCESS_TYPE_NO_PROXY,
            WINHTTP_NO_PROXY_NAME,
            WINHTTP_NO_PROXY_BYPASS,
            0
        );
        if (!hSession_) {
            BL_ERROR("[WS] WinHttpOpen failed (" << GetLastError() << ")");
            return Error::TransportFailure;
        }
        WinHttpSetTimeouts(hSession_, RESOLVE_TIMEOUT_MS, CONNECT_TIMEOUT_MS, SEND_TIMEOUT_MS, 0);

        host_ = to_wide(host);
        path_ = to_wide(path.empty() ? std::string("/") : path);
        port_ = static_cast<INTERNET_PORT>(port_number);

        try {
            io_thread_ = std::thread(&WebSocketImpl::run_, this);
        }
        catch (const std::system_error& e) {
            BL_ERROR("[WS] Cannot start I/O thread: " << e.what());
            return Error::TransportFailure;
        }
        return Error::None;
    }

    // Text frame, synchronous on the caller's thread (WinHTTP allows one send
    // concurrent with the receive loop). False when not open or on failure;
    // the failure itself surfaces through the receive loop.
    [[nodiscard]]
    inline bool send(std::string_view msg) noexcept {
        HINTERNET ws = hWebSocket_.load(std::memory_order_acquire);
        if (!ws || !open_.load(std::memory_order_acquire)) {
            BL_DEBUG("[WS] send() on a socket that is not open");
            return false;
        }
        BL_TRACE("[WS:API] Sending message ... (size " << msg.size() << ")");
        const bool ok = api_.websocket_send_text(ws, msg) == ERROR_SUCCESS;
        if (!ok) [[unlikely]] {
            BL_ERROR("[WS] websocket_send() failed");
            BL_TL1( telemetry_.send_errors_total.inc() );
        }
        else {
            BL_TL2( telemetry_.bytes_tx_total.inc(msg.size()) );
            BL_TL1( telemetry_.messages_tx_total.inc() );
        }
        return ok;
    }

    // Idempotent. Unblocks the backend thread and joins it.
    inline void close() noexcept {
        closing_.store(true, std::memory_order_release);
        open_.store(false, std::memory_order_release);
        if (HINTERNET ws = hWebSocket_.load(std::memory_order_acquire)) {
            BL_TRACE("[WS:API] Closing WebSocket ...");
            api_.websocket_close(ws);
        }
        else if (HINTERNET req = hRequest_.exchange(nullptr)) {
            // Upgrade still in flight: closing the request aborts it
            WinHttpCloseHandle(req);
        }
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        if (HINTERNET ws = hWebSocket_.exchange(nullptr); ws && !simulated_) { WinHttpCloseHandle(ws); }
        if (HINTERNET req = hRequest_.exchange(nullptr))  { WinHttpCloseHandle(req); }
        if (hConnect_) { WinHttpCloseHandle(hConnect_); hConnect_ = nullptr; }
        BL_TRACE("[WS] WebSocket closed.");
    }

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        return messages_.pop(out);
    }

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        return events_.pop(out);
    }

private:
    inline void run_() noexcept {
        const Error error = upgrade_();
        if (error != Error::None) {
            terminate_(error);
            return;
        }
        open_.store(true, std::memory_order_release);
        push_event_(websocket::Event::make_open());
        receive_loop_();
    }

    inline Error upgrade_() noexcept {
        hConnect_ = WinHttpConnect(hSession_, host_.c_str(), port_, 0);
        if (!hConnect_) {
            BL_WARN("[WS] WinHttpConnect failed (" << GetLastError() << ")");
            return Error::ConnectionFailed;
        }

        HINTERNET req = WinHttpOpenRequest(
            hConnect_,
            L"GET",
            path_.c_str(),
            nullptr,
            WINHTTP_NO_REFERER,
            WINHTTP_DEFAULT_ACCEPT_TYPES,
            0
        );
        if (!req) {
            BL_ERROR("[WS] WinHttpOpenRequest failed (" << GetLastError() << ")");
            return Error::TransportFailure;
        }
        hRequest_.store(req, std::memory_order_release);
        if (closing_.load(std::memory_order_acquire)) {
            return Error::LocalShutdown;
        }

        if (!WinHttpSetOption(req, WINHTTP_OPTION_UPGRADE_TO_WEB_SOCKET, nullptr, 0)) {
            BL_ERROR("[WS] WinHttpSetOption failed (" << GetLastError() << ")");
            return Error::ProtocolError;
        }
        if (!WinHttpSendRequest(req, WINHTTP_NO_ADDITIONAL_HEADERS, 0, nullptr, 0, 0, 0)) {
            return classify_connect_error_(GetLastError());
        }
        if (!WinHttpReceiveResponse(req, nullptr)) {
            return classify_connect_error_(GetLastError());
        }

        HINTERNET ws = WinHttpWebSocketCompleteUpgrade(req, 0);
        if (!ws) {
            BL_WARN("[WS] WinHttpWebSocketCompleteUpgrade failed (" << GetLastError() << ")");
            return Error::HandshakeFailed;
        }
        hWebSocket_.store(ws, std::memory_order_release);
        if (HINTERNET done = hRequest_.exchange(nullptr)) {
            WinHttpCloseHandle(done);
        }
        if (closing_.load(std::memory_order_acquire)) {
            return Error::LocalShutdown;
        }
        return Error::None;
    }

    inline void receive_loop_() noexcept {
#ifdef BL_UNIT_TEST
        if (receive_started_flag_) {
            receive_started_flag_->store(true, std::memory_order_release);
        }
#endif // BL_UNIT_TEST
        std::vector<char> buffer(RX_BUFFER_SIZE);
        std::string message;
        HINTERNET ws = hWebSocket_.load(std::memory_order_acquire);

        while (!closing_.load(std::memory_order_acquire)) {
            DWORD bytes = 0;
            WINHTTP_WEB_SOCKET_BUFFER_TYPE type;
            DWORD result = api_.websocket_receive(
                ws,
                buffer.data(),
                (DWORD)buffer.size(),
                &bytes,
                &type
            );
            if (result != ERROR_SUCCESS) [[unlikely]] {
                BL_TL1( telemetry_.receive_errors_total.inc() );
                terminate_(handle_receive_error_(result));
                return;
            }
            BL_TL2( telemetry_.bytes_rx_total.inc(bytes) );

            if (type == WINHTTP_WEB_SOCKET_CLOSE_BUFFER_TYPE) {
                BL_INFO("[WS] Received WebSocket close frame.");
                terminate_(Error::RemoteClosed);
                return;
            }
            message.append(buffer.data(), bytes);
            if (type == WINHTTP_WEB_SOCKET_UTF8_FRAGMENT_BUFFER_TYPE ||
                type == WINHTTP_WEB_SOCKET_BINARY_FRAGMENT_BUFFER_TYPE) {
                BL_DEBUG("[WS] Received message fragment (size " << bytes << ")");
                continue;
            }
            BL_TL1( telemetry_.messages_rx_total.inc() );
            if (!messages_.push(std::move(message))) [[unlikely]] {
                BL_TL1( telemetry_.rx_overflow_total.inc() );
                BL_ERROR("[WS] Message ring full, closing socket");
                terminate_(Error::Backpressure);
                return;
            }
            message.clear();
        }
    }

    inline Error classify_connect_error_(DWORD error) noexcept {
        switch (error) {
        case ERROR_WINHTTP_CANNOT_CONNECT:
        case ERROR_WINHTTP_NAME_NOT_RESOLVED:
            BL_WARN("[WS] Cannot connect to bridge (" << error << ")");
            return Error::ConnectionFailed;
        case ERROR_WINHTTP_TIMEOUT:
            BL_WARN("[WS] Connect timeout");
            return Error::Timeout;
        case ERROR_WINHTTP_OPERATION_CANCELLED:
            return Error::LocalShutdown;
        default:
            BL_WARN("[WS] Upgrade request failed (" << error << ")");
            return Error::HandshakeFailed;
        }
    }

    inline Error handle_receive_error_(DWORD error) noexcept {
        switch (error) {
        case ERROR_WINHTTP_OPERATION_CANCELLED: // 12017, local close
            BL_TRACE("[WS] Receive cancelled (local shutdown)");
            return Error::LocalShutdown;

        case ERROR_WINHTTP_CONNECTION_ERROR:    // 12030, peer vanished without CLOSE
            BL_INFO("[WS] Connection closed by peer");
            return Error::RemoteClosed;

        case ERROR_WINHTTP_TIMEOUT:             // 12002
            BL_WARN("[WS] Receive timeout");
            return Error::Timeout;

        default:
            BL_ERROR("[WS] Receive failed with error code " << error);
            return Error::TransportFailure;
        }
    }

    // Exactly one terminal event per attempt, nothing after a local close()
    inline void terminate_(Error error) noexcept {
        open_.store(false, std::memory_order_release);
        if (closing_.load(std::memory_order_acquire) || terminated_) {
            return;
        }
        terminated_ = true;
        BL_TL1( telemetry_.close_events_total.inc() );
        if (error == Error::RemoteClosed) {
            push_event_(websocket::Event::make_close(error));
        } else {
            push_event_(websocket::Event::make_error(error));
        }
    }

    inline void push_event_(const websocket::Event& ev) noexcept {
        if (!events_.push(ev)) [[unlikely]] {
            BL_ERROR("[WS] Control ring full, event dropped");
        }
    }

private:
    telemetry::WebSocket& telemetry_;
    Api api_;

    std::wstring host_;
    std::wstring path_;
    INTERNET_PORT port_{0};

    HINTERNET hSession_ = nullptr;                  // reactor thread
    HINTERNET hConnect_ = nullptr;                  // backend thread until joined
    std::atomic<HINTERNET> hRequest_{nullptr};      // shared: close() may abort the upgrade
    std::atomic<HINTERNET> hWebSocket_{nullptr};

    std::thread io_thread_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    bool terminated_{false};                        // backend thread only
    bool simulated_{false};                         // handle is not a WinHTTP handle (tests)

    lcr::lockfree::spsc_ring<std::string, MESSAGE_RING_SIZE> messages_;
    lcr::lockfree::spsc_ring<websocket::Event, CONTROL_RING_SIZE> events_;

#ifdef BL_UNIT_TEST
public:
    Api& test_api() noexcept {
        return api_;
    }

    // Runs the receive loop against the injected Api without an upgrade
    void test_start_receive_loop() {
        if (io_thread_.joinable()) {
            return;
        }
        simulated_ = true;
        hWebSocket_.store(reinterpret_cast<HINTERNET>(1), std::memory_order_release);
        open_.store(true, std::memory_order_release);
        push_event_(websocket::Event::make_open());
        io_thread_ = std::thread(&WebSocketImpl::receive_loop_, this);
    }

    // Set once the backend thread is inside the receive loop
    void set_receive_started_flag(std::atomic<bool>* flag) noexcept {
        receive_started_flag_ = flag;
    }

private:
    std::atomic<bool>* receive_started_flag_ = nullptr;
#endif // BL_UNIT_TEST
};

using WebSocket = WebSocketImpl<RealApi>;
static_assert(WebSocketConcept<WebSocket>);

} // namespace bandlink::core::transport::winhttp
