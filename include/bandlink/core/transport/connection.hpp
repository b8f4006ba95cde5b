#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include <chrono>
#include <memory>
#include <utility>

#include "bandlink/core/transport/websocket_concept.hpp"
#include "bandlink/core/transport/telemetry/connection.hpp"
#include "bandlink/core/transport/parse_url.hpp"
#include "bandlink/core/transport/state.hpp"
#include "bandlink/core/transport/connection/signal.hpp"
#include "bandlink/core/transport/websocket/events.hpp"
#include "bandlink/core/policy/backoff.hpp"
#include "bandlink/core/clock.hpp"
#include "bandlink/core/timer.hpp"
#include "bandlink/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core::transport {

/*
===============================================================================
 bandlink::core::transport::Connection
===============================================================================

One logical, self-healing WebSocket connection to the device bridge,
parameterized by a backend conforming to transport::WebSocketConcept and by a
Clock policy.

The logical connection survives transient transport failures: the backend
socket is recreated for every attempt, while the Connection keeps its URL,
handlers, epoch and telemetry.

-------------------------------------------------------------------------------
 Contract
-------------------------------------------------------------------------------
- open(url)                 start connecting; no-op while Connecting/Connected
- close()                   cancel the reconnect timer, release the socket
- send(text)                fails fast (false) unless Connected
- on_message(handler)       every inbound text frame, in arrival order
- on_connection_change(h)   h(true) on Connected, h(false) when it is lost
- force_reconnect(reason)   peer stopped answering: same path as a transport
                            failure (socket dropped, reconnect scheduled)
- poll()                    drives everything; must be called regularly

Handlers run on the caller's thread inside poll(), close() and
force_reconnect(), never on a backend thread. An exception thrown by a handler
propagates to that caller; handlers invoked from the destructor must not throw.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

  Disconnected ──open──► Connecting ──Open──► Connected
        ▲                  │    ▲                 │
        │       connect failed  │ retry timer     │ closed / error / health timeout
        │                  ▼    │                 ▼
        └──── exhausted ◄─ WaitingReconnect ◄─────┘

  close() from any state ends in Disconnected with no timer armed.

The Connecting state is the single "connecting" gate: at most one backend
instance exists, and open() during an attempt does not create another.

-------------------------------------------------------------------------------
 Reconnection
-------------------------------------------------------------------------------
Retryable failures (see transport::is_retryable) arm a one-shot deadline using
policy::Backoff. The first retry after a failure waits base_delay (1s), then
2s, 4s, ... capped at 30s, each with ±20% jitter. A successful connection
resets the attempt counter. With max_attempts set, the cycle ends in
Disconnected / DisconnectReason::RetryExhausted and Signal::RetryExhausted.

===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    ClockConcept Clock = SteadyClock
>
class Connection {
public:
    using MessageHandler          = std::function<void(std::string_view)>;
    using ConnectionChangeHandler = std::function<void(bool)>;

    explicit Connection(telemetry::Connection& telemetry, policy::Backoff backoff = policy::Backoff{}) noexcept
        : telemetry_(telemetry)
        , backoff_(std::move(backoff))
    {}

    // Reconnection is never attempted after object lifetime ends
    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error open(const std::string& url) {
        BL_TL1( telemetry_.open_calls_total.inc() );

        // Idempotent: an attempt in flight or a live socket is left alone
        if (state_ == State::Connecting || state_ == State::Connected) {
            BL_DEBUG("[CONN] open() ignored: already " << to_string(state_) << " (" << url_ << ")");
            BL_TL1( telemetry_.open_ignored_total.inc() );
            return Error::None;
        }
        if (state_ == State::Disconnecting) {
            BL_WARN("[CONN] open() called while disconnecting. Ignoring.");
            return Error::InvalidState;
        }

        ParsedUrl tmp;
        Error url_error = parse_url(url, tmp);
        if (url_error == Error::None && tmp.secure) {
            // The bridge listens on loopback only, backends speak plain ws://
            url_error = Error::InvalidUrl;
        }
        if (url_error != Error::None) {
            BL_ERROR("[CONN] Invalid bridge url: '" << url << "'");
            last_error_ = url_error;
            return url_error;
        }
        url_ = url;
        parsed_url_ = std::move(tmp);

        BL_DEBUG("[CONN] Connecting to: " << url_);
        sync_error_ = Error::None;
        transition_(Event::OpenRequested);
        return sync_error_;
    }

    // Unconditional shutdown: cancels any pending reconnect timer.
    inline void close() {
        if (state_ == State::Disconnected && !retry_timer_.armed()) {
            return; // idempotent
        }
        BL_TL1( telemetry_.close_calls_total.inc() );
        transition_(Event::CloseRequested);
    }

    // Drop a live socket and go through the reconnect path. HealthTimeout is
    // the peer-unresponsive case; any other reason is handled as a transport
    // failure.
    inline void force_reconnect(DisconnectReason reason) {
        if (state_ != State::Connected) {
            return;
        }
        if (reason == DisconnectReason::HealthTimeout) {
            transition_(Event::HealthTimeout, Error::Timeout);
        } else {
            transition_(Event::TransportClosed, Error::TransportFailure);
        }
    }

    // -------------------------------------------------------------------------
    // Data plane
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        BL_TL1( telemetry_.send_calls_total.inc() );
        if (state_ != State::Connected) {
            BL_DEBUG("[CONN] send() rejected while " << to_string(state_));
            BL_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        if (!ws_->send(text)) {
            BL_WARN("[CONN] send() refused by transport");
            BL_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        ++tx_messages_;
        return true;
    }

    inline void on_message(MessageHandler handler) {
        on_message_ = std::move(handler);
    }

    inline void on_connection_change(ConnectionChangeHandler handler) {
        on_connection_change_ = std::move(handler);
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    inline void poll() {
        // === Drain backend control events, then any remaining frames ===
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            on_backend_event_(ev);
        }
        if (state_ == State::Connected) {
            drain_messages_();
        }
        // === Reconnect timer ===
        if (state_ == State::WaitingReconnect && retry_timer_.expired(Clock::now())) {
            transition_(Event::RetryTimerExpired);
        }
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) {
        return signals_.pop(out);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline bool is_connected() const noexcept { return state_ == State::Connected; }
    [[nodiscard]] inline bool is_connecting() const noexcept { return state_ == State::Connecting; }

    // Incremented once per established connection (never on attempts)
    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_; }

    [[nodiscard]] inline std::uint64_t rx_messages() const noexcept { return rx_messages_; }
    [[nodiscard]] inline std::uint64_t tx_messages() const noexcept { return tx_messages_; }

    // Reconnect attempts made in the current retry cycle
    [[nodiscard]] inline std::uint32_t retry_attempts() const noexcept { return retry_attempts_; }

    [[nodiscard]] inline Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] inline DisconnectReason disconnect_reason() const noexcept { return disconnect_reason_; }
    [[nodiscard]] inline const std::string& url() const noexcept { return url_; }

    // Armed deadlines owned by the Connection (0 after close())
    [[nodiscard]]
    inline std::size_t pending_timers() const noexcept {
        return retry_timer_.armed() ? 1 : 0;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds next_retry_in() const noexcept {
        return retry_timer_.remaining(Clock::now());
    }

#ifdef BL_UNIT_TEST
public:
    // Current backend instance (nullptr while no attempt is alive)
    WS* ws() noexcept {
        return ws_.get();
    }
#endif // BL_UNIT_TEST

private:
    transport::telemetry::Connection& telemetry_;   // not owned
    policy::Backoff backoff_;
    std::unique_ptr<WS> ws_;                        // one backend instance per attempt

    std::string url_;
    lcr::optional<ParsedUrl> parsed_url_;           // Invariant: has() once open() accepted a url

    MessageHandler on_message_;
    ConnectionChangeHandler on_connection_change_;

    State state_{State::Disconnected};
    DisconnectReason disconnect_reason_{DisconnectReason::None};
    Error last_error_{Error::None};
    Error sync_error_{Error::None};                 // synchronous connect() failure reported by open()

    Deadline retry_timer_;
    std::uint32_t retry_attempts_{0};
    bool in_retry_cycle_{false};

    std::uint64_t epoch_{0};
    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};

    lcr::lockfree::spsc_ring<connection::Signal, 16> signals_;

private:
    inline void set_state_(State new_state) noexcept {
        BL_TRACE("[CONN] State: " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    // Signals are best-effort: when the owner stops draining, the oldest is dropped
    inline void emit_(connection::Signal sig) {
        BL_TRACE("[CONN] Emitting signal: " << to_string(sig));
        if (signals_.push(sig)) [[likely]] {
            return;
        }
        connection::Signal dropped;
        (void)signals_.pop(dropped);
        BL_WARN("[CONN] Signal ring full, dropped '" << to_string(dropped) << "'");
        (void)signals_.push(sig);
    }

    inline void notify_(bool connected) {
        if (on_connection_change_) {
            on_connection_change_(connected);
        }
    }

    // -------------------------------------------------------------------------
    // State machine transition function
    // -------------------------------------------------------------------------
    inline void transition_(Event event, Error error = Error::None) {
        const State state = state_;

        BL_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::OpenRequested:
                retry_attempts_ = 0;
                in_retry_cycle_ = false;
                set_state_(State::Connecting);
                start_attempt_();
                break;

            case Event::CloseRequested:
                retry_timer_.disarm();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(State::Connected);
                BL_TL1( telemetry_.connect_success_total.inc() );
                if (in_retry_cycle_) {
                    BL_TL1( telemetry_.retry_success_total.inc() );
                    BL_INFO("[CONN] Connection re-established with bridge '" << url_ << "' after "
                            << retry_attempts_ << " attempt(s)");
                } else {
                    BL_INFO("[CONN] Connected to bridge: " << url_);
                }
                retry_attempts_ = 0;
                in_retry_cycle_ = false;
                disconnect_reason_ = DisconnectReason::None;
                last_error_ = Error::None;
                ++epoch_;
                emit_(connection::Signal::Connected);
                notify_(true);
                break;

            case Event::TransportConnectFailed:
                BL_TL1( telemetry_.connect_failure_total.inc() );
                BL_WARN("[CONN] Connection attempt failed (" << to_string(error) << ")");
                release_transport_();
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::TransportError;
                if (is_retryable(error)) {
                    schedule_retry_();
                } else {
                    BL_ERROR("[CONN] Non-retryable connect failure (" << to_string(error) << "), giving up");
                    set_state_(State::Disconnected);
                }
                break;

            case Event::CloseRequested:
                disconnect_reason_ = DisconnectReason::LocalClose;
                release_transport_();
                set_state_(State::Disconnected);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::CloseRequested:
                BL_DEBUG("[CONN] Disconnecting from: " << url_);
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Disconnecting);
                release_transport_();
                set_state_(State::Disconnected);
                BL_TL1( telemetry_.disconnect_events_total.inc() );
                emit_(connection::Signal::Disconnected);
                BL_INFO("[CONN] Disconnected from bridge: " << url_);
                notify_(false);
                break;

            case Event::TransportClosed:
                BL_TL1( telemetry_.disconnect_events_total.inc() );
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::TransportError;
                set_state_(State::Disconnecting);
                release_transport_();
                emit_(connection::Signal::Disconnected);
                BL_WARN("[CONN] Connection to bridge lost (" << to_string(error) << ")");
                if (is_retryable(error)) {
                    schedule_retry_();
                } else {
                    set_state_(State::Disconnected);
                }
                notify_(false);
                break;

            case Event::HealthTimeout:
                BL_TL1( telemetry_.disconnect_events_total.inc() );
                BL_TL1( telemetry_.health_timeouts_total.inc() );
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::HealthTimeout;
                set_state_(State::Disconnecting);
                release_transport_();
                emit_(connection::Signal::Disconnected);
                BL_WARN("[CONN] Bridge stopped answering health checks, forcing reconnect");
                schedule_retry_();
                notify_(false);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Disconnecting:
            // Transient: resolved synchronously inside the transition that entered it
            break;

        // ================================================================
        case State::WaitingReconnect:
            switch (event) {
            case Event::RetryTimerExpired:
                retry_timer_.disarm();
                ++retry_attempts_;
                BL_TL1( telemetry_.retry_attempts_total.inc() );
                BL_DEBUG("[CONN] Reconnecting to: " << url_ << " (attempt " << retry_attempts_ << ")");
                set_state_(State::Connecting);
                start_attempt_();
                break;

            case Event::OpenRequested:
                // Explicit open() overrides the pending retry cycle
                retry_timer_.disarm();
                retry_attempts_ = 0;
                in_retry_cycle_ = false;
                set_state_(State::Connecting);
                start_attempt_();
                break;

            case Event::CloseRequested:
                retry_timer_.disarm();
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Disconnected);
                BL_DEBUG("[CONN] Pending reconnect cancelled");
                break;

            default:
                break;
            }
            break;
        }
    }

    // PRECONDITION: state_ == Connecting, parsed_url_.has()
    inline void start_attempt_() {
        create_transport_();
        const ParsedUrl& u = parsed_url_.value();
        const Error error = ws_->connect(u.host, u.port, u.path);
        if (error != Error::None) {
            sync_error_ = error;
            transition_(Event::TransportConnectFailed, error);
        }
    }

    inline void create_transport_() {
        release_transport_();
        ws_ = std::make_unique<WS>(telemetry_.websocket);
    }

    inline void release_transport_() noexcept {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
    }

    inline void schedule_retry_() {
        const std::uint32_t next = retry_attempts_ + 1;
        if (backoff_.exhausted(next)) {
            set_state_(State::Disconnected);
            disconnect_reason_ = DisconnectReason::RetryExhausted;
            in_retry_cycle_ = false;
            BL_TL1( telemetry_.retry_exhausted_total.inc() );
            emit_(connection::Signal::RetryExhausted);
            BL_ERROR("[CONN] Giving up on '" << url_ << "' after " << retry_attempts_
                     << " reconnect attempt(s) (last error: " << to_string(last_error_) << ")");
            return;
        }
        const auto delay = backoff_.delay(next);
        retry_timer_.arm_after(Clock::now(), delay);
        in_retry_cycle_ = true;
        set_state_(State::WaitingReconnect);
        BL_TL1( telemetry_.retry_scheduled_total.inc() );
        emit_(connection::Signal::RetryScheduled);
        BL_INFO("[CONN] Next reconnection attempt in " << delay.count() << " ms");
    }

    inline void on_backend_event_(const websocket::Event& ev) {
        switch (ev.type) {
        case websocket::EventType::Open:
            if (state_ == State::Connecting) {
                transition_(Event::TransportConnected);
            }
            break;

        case websocket::EventType::Close:
        case websocket::EventType::Error: {
            const Error error = (ev.error == Error::None) ? Error::RemoteClosed : ev.error;
            if (state_ == State::Connecting) {
                transition_(Event::TransportConnectFailed, error);
            }
            else if (state_ == State::Connected) {
                // Frames received before the socket died are still delivered
                drain_messages_();
                if (state_ == State::Connected) {
                    transition_(Event::TransportClosed, error);
                }
            }
            break;
        }
        }
    }

    inline void drain_messages_() {
        std::string msg;
        while (ws_ && state_ == State::Connected && ws_->poll_message(msg)) {
            ++rx_messages_;
            BL_TL1( telemetry_.messages_forwarded_total.inc() );
            if (on_message_) {
                on_message_(msg);
            }
        }
    }
};

} // namespace bandlink::core::transport
