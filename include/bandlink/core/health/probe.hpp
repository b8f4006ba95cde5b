#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <utility>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/clock.hpp"
#include "bandlink/core/timer.hpp"
#include "lcr/local/history_ring.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace bandlink::core::health {

/*
===============================================================================
 health::Probe
===============================================================================

Application-level liveness for the bridge link. A socket can stay technically
open while the bridge process is wedged; the probe detects that by sending a
health_check command every `interval` and expecting a health_check_response
within `timeout`.

  arm(now)                  first request goes out on the next tick
  tick(now, send)           expire overdue requests, then send if due
  acknowledge(now, ack)     match the oldest outstanding request (FIFO)
  disarm()                  forget every outstanding request and deadline

Each overdue request is one missed ack; a failed send is one missed ack; an
ack resets the streak. Once consecutive_misses() reaches max_missed the
verdict is Unresponsive and the owner takes the transport-failure path.

Outstanding requests are bounded: when the ring overflows the oldest request
is dropped and counted as a miss.
===============================================================================
*/

enum class Verdict : std::uint8_t {
    Disarmed,
    Responsive,
    Unresponsive
};

[[nodiscard]]
inline constexpr std::string_view to_string(Verdict v) noexcept {
    switch (v) {
        case Verdict::Disarmed:      return "Disarmed";
        case Verdict::Responsive:    return "Responsive";
        case Verdict::Unresponsive:  return "Unresponsive";
        default:                     return "Unknown";
    }
}

// Payload of the last health_check_response
struct Ack {
    std::uint64_t clients_connected{0};
    bool is_streaming{false};
    bool device_connected{false};
};


template<ClockConcept Clock = SteadyClock>
class Probe {
    static constexpr std::size_t MAX_OUTSTANDING = 8;

public:
    explicit Probe(const config::Health& cfg = {}) noexcept
        : cfg_(cfg)
    {}

    inline void arm(TimePoint now) noexcept {
        outstanding_.clear();
        consecutive_misses_ = 0;
        send_timer_.arm(now);
        armed_ = true;
        BL_DEBUG("[PROBE] Armed (every " << cfg_.interval.count() << " ms, timeout " << cfg_.timeout.count() << " ms)");
    }

    inline void arm() noexcept {
        arm(Clock::now());
    }

    inline void disarm() noexcept {
        if (!armed_) {
            return;
        }
        outstanding_.clear();
        send_timer_.disarm();
        armed_ = false;
        BL_DEBUG("[PROBE] Disarmed");
    }

    // `send` performs the actual health_check send and returns whether the
    // transport accepted it.
    template<class SendFn>
    inline void tick(TimePoint now, SendFn&& send) {
        if (!armed_) {
            return;
        }

        // === Expire overdue requests (oldest first) ===
        while (!outstanding_.empty() && now >= outstanding_.front() + cfg_.timeout) {
            (void)outstanding_.pop_front();
            record_miss_("ack timeout");
        }

        // === Send when due ===
        if (!send_timer_.expired(now)) {
            return;
        }
        send_timer_.arm_after(now, cfg_.interval);
        ++requests_sent_;
        if (!send()) {
            record_miss_("send failed");
            return;
        }
        if (outstanding_.push(now)) {
            record_miss_("too many outstanding requests");
        }
    }

    template<class SendFn>
    inline void tick(SendFn&& send) {
        tick(Clock::now(), std::forward<SendFn>(send));
    }

    // Returns the round-trip time of the matched request, or nothing for an
    // unsolicited ack (which still proves liveness).
    inline lcr::optional<std::chrono::milliseconds> acknowledge(TimePoint now, const Ack& ack) noexcept {
        ++acks_received_;
        last_ack_ = ack;
        consecutive_misses_ = 0;
        if (outstanding_.empty()) {
            BL_TRACE("[PROBE] Unsolicited health ack");
            return {};
        }
        const TimePoint sent = outstanding_.front();
        (void)outstanding_.pop_front();
        const auto rtt = elapsed_ms(sent, now);
        BL_TRACE("[PROBE] Health ack in " << rtt.count() << " ms");
        return rtt;
    }

    [[nodiscard]]
    inline Verdict verdict() const noexcept {
        if (!armed_) {
            return Verdict::Disarmed;
        }
        return consecutive_misses_ >= cfg_.max_missed ? Verdict::Unresponsive : Verdict::Responsive;
    }

    [[nodiscard]] inline bool is_armed() const noexcept { return armed_; }
    [[nodiscard]] inline std::uint32_t consecutive_misses() const noexcept { return consecutive_misses_; }
    [[nodiscard]] inline std::size_t outstanding() const noexcept { return outstanding_.size(); }
    [[nodiscard]] inline const lcr::optional<Ack>& last_ack() const noexcept { return last_ack_; }

    [[nodiscard]] inline std::uint64_t requests_sent() const noexcept { return requests_sent_; }
    [[nodiscard]] inline std::uint64_t acks_received() const noexcept { return acks_received_; }
    [[nodiscard]] inline std::uint64_t misses_total() const noexcept { return misses_total_; }

    // Send timer plus one ack deadline per outstanding request
    [[nodiscard]]
    inline std::size_t pending_timers() const noexcept {
        return (send_timer_.armed() ? 1 : 0) + outstanding_.size();
    }

    [[nodiscard]]
    inline const config::Health& config() const noexcept {
        return cfg_;
    }

private:
    config::Health cfg_;

    bool armed_{false};
    Deadline send_timer_;
    lcr::local::history_ring<TimePoint, MAX_OUTSTANDING> outstanding_;   // send times, oldest first

    std::uint32_t consecutive_misses_{0};
    lcr::optional<Ack> last_ack_{};

    std::uint64_t requests_sent_{0};
    std::uint64_t acks_received_{0};
    std::uint64_t misses_total_{0};

private:
    inline void record_miss_(const char* why) noexcept {
        ++consecutive_misses_;
        ++misses_total_;
        BL_WARN("[PROBE] Missed health ack (" << why << "), " << consecutive_misses_ << "/" << cfg_.max_missed);
    }
};

} // namespace bandlink::core::health
