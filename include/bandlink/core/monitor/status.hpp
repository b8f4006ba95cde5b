#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include "bandlink/core/clock.hpp"


namespace bandlink::core::monitor {

// ===============================================================
// OVERALL STATUS
// ===============================================================
enum class OverallStatus : std::uint8_t {
    Offline,
    Degraded,
    Ready,
    Healthy
};

[[nodiscard]]
inline constexpr std::string_view to_string(OverallStatus s) noexcept {
    switch (s) {
        case OverallStatus::Offline:   return "offline";
        case OverallStatus::Degraded:  return "degraded";
        case OverallStatus::Ready:     return "ready";
        case OverallStatus::Healthy:   return "healthy";
        default:                       return "unknown";
    }
}

// ---------------------------------------------------------------
// The only way an overall status is produced:
//
//   websocket  api    streaming   overall
//   true       true   true        Healthy
//   true       true   false       Ready
//   exactly one true  any         Degraded
//   false      false  any         Offline
// ---------------------------------------------------------------
[[nodiscard]]
inline constexpr OverallStatus derive_overall(bool websocket, bool api, bool streaming) noexcept {
    if (websocket && api) {
        return streaming ? OverallStatus::Healthy : OverallStatus::Ready;
    }
    if (websocket || api) {
        return OverallStatus::Degraded;
    }
    return OverallStatus::Offline;
}


// One recorded check. `overall` is fixed at construction from the three
// inputs; there is no setter.
class ConnectionStatus {
public:
    ConnectionStatus() noexcept = default;

    ConnectionStatus(bool websocket, bool api, bool streaming, TimePoint last_check) noexcept
        : websocket_(websocket)
        , api_(api)
        , streaming_(streaming)
        , overall_(derive_overall(websocket, api, streaming))
        , last_check_(last_check)
    {}

    [[nodiscard]] inline bool websocket() const noexcept { return websocket_; }
    [[nodiscard]] inline bool api() const noexcept { return api_; }
    [[nodiscard]] inline bool streaming() const noexcept { return streaming_; }
    [[nodiscard]] inline OverallStatus overall() const noexcept { return overall_; }
    [[nodiscard]] inline TimePoint last_check() const noexcept { return last_check_; }

    // Same observable state, ignoring when it was checked
    [[nodiscard]]
    inline bool same_state(const ConnectionStatus& other) const noexcept {
        return websocket_ == other.websocket_ && api_ == other.api_ &&
               streaming_ == other.streaming_ && overall_ == other.overall_;
    }

private:
    bool websocket_{false};
    bool api_{false};
    bool streaming_{false};
    OverallStatus overall_{OverallStatus::Offline};
    TimePoint last_check_{};
};

inline std::ostream& operator<<(std::ostream& os, const ConnectionStatus& s) {
    return os << "{websocket: " << (s.websocket() ? "up" : "down")
              << ", api: " << (s.api() ? "up" : "down")
              << ", streaming: " << (s.streaming() ? "yes" : "no")
              << ", overall: " << to_string(s.overall()) << "}";
}

} // namespace bandlink::core::monitor
