#pragma once

#include <string>
#include <string_view>
#include <thread>
#include <atomic>
#include <deque>
#include <memory>
#include <chrono>
#include <system_error>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "bandlink/core/transport/websocket_concept.hpp"
#include "bandlink/core/transport/error.hpp"
#include "bandlink/core/transport/websocket/events.hpp"
#include "bandlink/core/transport/telemetry/websocket.hpp"
#include "bandlink/core/telemetry.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast)
================================================================================

Portable WebSocket backend for the bridge link. One instance = one attempt:
transport::Connection creates a fresh backend for every (re)connect.

  • Own I/O thread running a private io_context; every socket operation
    (resolve, connect, handshake, read, write, close) runs on it
  • connect() only starts the attempt; Open / Close / Error are reported
    through the control ring, text frames through the message ring
  • send() never blocks: the frame is posted to the I/O thread and queued
  • Exactly one terminal event (Close or Error) per attempt
  • Message ring overflow closes the socket with Error::Backpressure

Plain ws:// only; the bridge listens on loopback.
================================================================================
*/

namespace bandlink::core::transport::beast {

namespace net  = boost::asio;
namespace bbst = boost::beast;
namespace bws  = boost::beast::websocket;
using tcp      = boost::asio::ip::tcp;

class WebSocket {
    static constexpr std::size_t MESSAGE_RING_SIZE = 1024;
    static constexpr std::size_t CONTROL_RING_SIZE = 16;
    static constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(5);

public:
    explicit WebSocket(telemetry::WebSocket& telemetry) noexcept
        : telemetry_(telemetry)
        , resolver_(ioc_)
        , ws_(ioc_)
    {}

    ~WebSocket() {
        close();
    }

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    inline Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
        if (started_) {
            BL_WARN("[WS] connect() called twice on the same backend instance");
            return Error::InvalidState;
        }
        started_ = true;
        host_ = host;
        path_ = path.empty() ? std::string("/") : path;
        BL_TL1( telemetry_.connect_attempts_total.inc() );

        BL_TRACE("[WS] Resolving " << host << ":" << port << " ...");
        resolver_.async_resolve(host, port,
            [this](const bbst::error_code& ec, tcp::resolver::results_type results) {
                on_resolve_(ec, results);
            });

        try {
            io_thread_ = std::thread([this]() { run_(); });
        }
        catch (const std::system_error& e) {
            BL_ERROR("[WS] Cannot start I/O thread: " << e.what());
            return Error::TransportFailure;
        }
        return Error::None;
    }

    // Posts the frame to the I/O thread. False when the socket is not open.
    [[nodiscard]]
    inline bool send(std::string_view msg) noexcept {
        if (!open_.load(std::memory_order_acquire)) {
            BL_DEBUG("[WS] send() on a socket that is not open");
            return false;
        }
        BL_TRACE("[WS] Sending message (size " << msg.size() << ")");
        net::post(ioc_, [this, frame = std::string(msg)]() mutable {
            write_queue_.push_back(std::move(frame));
            if (write_queue_.size() == 1) {
                write_next_();
            }
        });
        return true;
    }

    // Idempotent. Stops the I/O thread; no event is pushed for a local close.
    inline void close() noexcept {
        if (!io_thread_.joinable()) {
            return;
        }
        BL_TRACE("[WS] Closing WebSocket ...");
        open_.store(false, std::memory_order_release);
        net::post(ioc_, [this]() {
            closing_ = true;
            resolver_.cancel();
            bbst::error_code ignored;
            bbst::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
            bbst::get_lowest_layer(ws_).close();
        });
        io_thread_.join();
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
    telemetry::WebSocket& telemetry_;

    net::io_context ioc_;
    tcp::resolver resolver_;
    bws::stream<bbst::tcp_stream> ws_;
    bbst::flat_buffer buffer_;
    std::deque<std::string> write_queue_;   // I/O thread only

    std::string host_;
    std::string path_;

    std::thread io_thread_;
    std::atomic<bool> open_{false};
    bool started_{false};                   // reactor thread only
    bool closing_{false};                   // I/O thread only
    bool terminated_{false};                // I/O thread only

    lcr::lockfree::spsc_ring<std::string, MESSAGE_RING_SIZE> messages_;
    lcr::lockfree::spsc_ring<websocket::Event, CONTROL_RING_SIZE> events_;

private:
    inline void run_() noexcept {
        try {
            ioc_.run();
        }
        catch (const std::exception& e) {
            BL_ERROR("[WS] I/O thread stopped on exception: " << e.what());
            terminate_(Error::TransportFailure);
        }
    }

    inline void on_resolve_(const bbst::error_code& ec, const tcp::resolver::results_type& results) {
        if (ec) {
            fail_("resolve", ec, Error::ConnectionFailed);
            return;
        }
        bbst::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
        bbst::get_lowest_layer(ws_).async_connect(results,
            [this](const bbst::error_code& ec, const tcp::endpoint&) {
                on_connect_(ec);
            });
    }

    inline void on_connect_(const bbst::error_code& ec) {
        if (ec) {
            fail_("connect", ec, Error::ConnectionFailed);
            return;
        }
        // The websocket stream manages its own timeouts from here on
        bbst::get_lowest_layer(ws_).expires_never();
        ws_.set_option(bws::stream_base::timeout::suggested(bbst::role_type::client));
        ws_.set_option(bws::stream_base::decorator([](bws::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "bandlink/1.0");
        }));
        ws_.text(true);
        ws_.async_handshake(host_, path_,
            [this](const bbst::error_code& ec) {
                on_handshake_(ec);
            });
    }

    inline void on_handshake_(const bbst::error_code& ec) {
        if (ec) {
            fail_("handshake", ec, Error::HandshakeFailed);
            return;
        }
        BL_DEBUG("[WS] Handshake complete with " << host_ << path_);
        open_.store(true, std::memory_order_release);
        push_event_(websocket::Event::make_open());
        read_next_();
    }

    inline void read_next_() {
        ws_.async_read(buffer_,
            [this](const bbst::error_code& ec, std::size_t bytes) {
                on_read_(ec, bytes);
            });
    }

    inline void on_read_(const bbst::error_code& ec, std::size_t bytes) {
        if (ec) {
            if (ec == bws::error::closed) {
                BL_INFO("[WS] Received WebSocket close frame.");
                terminate_(Error::RemoteClosed);
                return;
            }
            BL_TL1( telemetry_.receive_errors_total.inc() );
            fail_("read", ec, Error::TransportFailure);
            return;
        }
        BL_TL2( telemetry_.bytes_rx_total.inc(bytes) );
        BL_TL1( telemetry_.messages_rx_total.inc() );
        std::string frame = bbst::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (!messages_.push(std::move(frame))) [[unlikely]] {
            BL_TL1( telemetry_.rx_overflow_total.inc() );
            BL_ERROR("[WS] Message ring full, closing socket");
            terminate_(Error::Backpressure);
            bbst::get_lowest_layer(ws_).close();
            return;
        }
        read_next_();
    }

    inline void write_next_() {
        ws_.async_write(net::buffer(write_queue_.front()),
            [this](const bbst::error_code& ec, std::size_t bytes) {
                on_write_(ec, bytes);
            });
    }

    inline void on_write_(const bbst::error_code& ec, std::size_t bytes) {
        if (ec) {
            BL_TL1( telemetry_.send_errors_total.inc() );
            write_queue_.clear();
            fail_("write", ec, Error::TransportFailure);
            return;
        }
        BL_TL2( telemetry_.bytes_tx_total.inc(bytes) );
        BL_TL1( telemetry_.messages_tx_total.inc() );
        write_queue_.pop_front();
        if (!write_queue_.empty()) {
            write_next_();
        }
    }

    inline void fail_(const char* what, const bbst::error_code& ec, Error fallback) {
        if (closing_ || ec == net::error::operation_aborted) {
            BL_TRACE("[WS] " << what << " cancelled (local shutdown)");
            return;
        }
        const Error error = classify_(ec, fallback);
        BL_WARN("[WS] " << what << " failed: " << ec.message() << " (" << to_string(error) << ")");
        terminate_(error);
    }

    [[nodiscard]]
    inline Error classify_(const bbst::error_code& ec, Error fallback) const noexcept {
        if (ec == bbst::error::timeout) {
            return Error::Timeout;
        }
        if (ec == net::error::eof || ec == net::error::connection_reset) {
            return Error::RemoteClosed;
        }
        if (ec == net::error::connection_refused || ec == net::error::host_unreachable ||
            ec == net::error::network_unreachable) {
            return Error::ConnectionFailed;
        }
        return fallback;
    }

    // Exactly one terminal event per attempt, none after a local close
    inline void terminate_(Error error) {
        if (terminated_ || closing_) {
            return;
        }
        terminated_ = true;
        open_.store(false, std::memory_order_release);
        BL_TL1( telemetry_.close_events_total.inc() );
        if (error == Error::RemoteClosed) {
            push_event_(websocket::Event::make_close(error));
        } else {
            push_event_(websocket::Event::make_error(error));
        }
    }

    inline void push_event_(const websocket::Event& ev) {
        // Capacity covers Open plus one terminal event many times over
        if (!events_.push(ev)) [[unlikely]] {
            BL_ERROR("[WS] Control ring full, event dropped");
        }
    }
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace bandlink::core::transport::beast
