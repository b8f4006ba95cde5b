#pragma once

#include <ostream>
#include <string>

#include "bandlink/core/monitor/status.hpp"
#include "bandlink/core/stream/state.hpp"


namespace bandlink::core::gate {

// -----------------------------------------------------------------------------
// Recording gate
//
// Decides whether a recording may start. A pure function of its inputs: the
// Supervisor rebuilds GateInputs on every change and re-evaluates.
//
// Denial order (first match wins):
//   bridge offline > engine not initialized > no device > no data > degrading
// -----------------------------------------------------------------------------

struct GateInputs {
    bool engine_initialized{false};
    bool device_connected{false};
    stream::StreamingState streaming{stream::Idle{}};
    monitor::OverallStatus overall{monitor::OverallStatus::Offline};   // raw, not voted

    bool operator==(const GateInputs&) const = default;
};

struct GateDecision {
    bool allowed{false};
    std::string reason{};

    bool operator==(const GateDecision&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const GateDecision& d) {
    return os << (d.allowed ? "allowed" : "denied") << " (" << d.reason << ")";
}


class RecordingGate {
public:
    [[nodiscard]]
    static GateDecision can_record(const GateInputs& in) {
        if (in.overall == monitor::OverallStatus::Offline) {
            return {false, "Bridge connection is offline"};
        }
        if (!in.engine_initialized) {
            return {false, "Engine is not initialized"};
        }
        if (!in.device_connected) {
            return {false, "No device connected"};
        }
        switch (stream::phase_of(in.streaming)) {
            case stream::Phase::Idle:       return {false, "No data is streaming"};
            case stream::Phase::Degrading:  return {false, "Data stream is degrading"};
            case stream::Phase::Active:     break;
        }
        return {true, "Ready to record"};
    }
};

} // namespace bandlink::core::gate
