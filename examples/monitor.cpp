#include <atomic>
#include <csignal>
#include <chrono>
#include <iostream>
#include <string_view>
#include <thread>

#include "bandlink/lite/supervisor.hpp"
using namespace bandlink;

#include "common/cli/monitor_params.hpp"
namespace cli = bandlink::examples::cli;


// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    core::config::Supervisor cfg{};
    const auto params = cli::monitor::configure(argc, argv, "Bandlink - Bridge Monitor\n"
        "Connects to the device bridge and reports connection, streaming and recording readiness.\n",
        cfg
    );
    params.dump("=== Monitor Parameters ===", std::cout);
    if (params.dump_config) {
        core::config::dump(cfg, std::cout);
    }

    // -------------------------------------------------------------
    // Supervisor setup
    // -------------------------------------------------------------
    lite::Supervisor supervisor;
    supervisor.set_api_reachable(!params.no_api);
    supervisor.set_engine_initialized(!params.no_engine);

    supervisor.on_overall_change([](core::monitor::OverallStatus current, core::monitor::OverallStatus previous) {
        std::cout << "[bandlink] overall: " << core::monitor::to_string(previous)
                  << " -> " << core::monitor::to_string(current) << std::endl;
    });

    bool stream_requested = false;
    supervisor.on_status_change([&](const core::monitor::ConnectionStatus& current, const core::monitor::ConnectionStatus&) {
        std::cout << "[bandlink] status: " << current << std::endl;
        if (params.start_streaming && !stream_requested && current.websocket()) {
            stream_requested = supervisor.request_streaming(true);
        }
    });

    supervisor.on_streaming_change([](const core::stream::StreamingState& state) {
        std::cout << "[bandlink] streaming: " << core::stream::to_string(state) << std::endl;
    });

    supervisor.on_gate_change([](const core::gate::GateDecision& decision) {
        std::cout << "[bandlink] recording " << decision << std::endl;
    });

    supervisor.on_alert([](const core::monitor::Alert& alert) {
        std::cout << "[bandlink] alert #" << alert.id << " " << core::monitor::to_string(alert.level)
                  << ": " << alert.message << std::endl;
    });

    supervisor.on_bridge_event([](std::string_view type, std::string_view data) {
        std::cout << "[bandlink] event " << type << ": " << data << std::endl;
    });

    const core::config::Error err = supervisor.start(cfg);
    if (err != core::config::Error::None) {
        std::cerr << "[bandlink] Invalid configuration: " << core::config::to_string(err) << std::endl;
        return -1;
    }

    // -------------------------------------------------------------
    // Main polling loop (runs until Ctrl+C or the requested duration)
    // -------------------------------------------------------------
    const auto started = std::chrono::steady_clock::now();
    const auto duration = std::chrono::seconds(params.duration_s);
    supervisor.run_until([&]() {
        if (!running.load()) {
            return true;
        }
        return params.duration_s > 0 && std::chrono::steady_clock::now() - started >= duration;
    });

    // -------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------
    if (stream_requested) {
        (void)supervisor.request_streaming(false);
        supervisor.run_for(std::chrono::milliseconds(200));
    }
    supervisor.debug_dump(std::cout);
    supervisor.stop();

    std::cout << "\n[bandlink] Done.\n";
    return 0;
}
