#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>

#include <CLI/CLI.hpp>

#include "bandlink/core/config/supervisor.hpp"
#include "bandlink/core/config/loader.hpp"
#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace bandlink::examples::cli::monitor {

    // -------------------------------------------------------------
    // Monitor example parameters
    // -------------------------------------------------------------
    struct Params {
        std::string url               = core::config::DEFAULT_BRIDGE_URL;
        std::string config_file       = {};
        std::string log_level         = "info";
        std::uint32_t duration_s      = 0;          // 0 = until Ctrl+C
        std::uint32_t max_attempts    = 0;
        bool no_api                   = false;
        bool no_engine                = false;
        bool start_streaming          = false;
        bool dump_config              = false;

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  URL          : " << url << "\n"
               << "  Config file  : " << (config_file.empty() ? "(none)" : config_file) << "\n"
               << "  Duration     : " << (duration_s == 0 ? std::string("until interrupted") : std::to_string(duration_s) + " s") << "\n"
               << "  API          : " << (no_api ? "unreachable" : "reachable") << "\n"
               << "  Engine       : " << (no_engine ? "not initialized" : "initialized") << "\n"
               << "  Log Level    : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI and the supervisor configuration
    // -------------------------------------------------------------
    // JSON file first, then command-line overrides.
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description, core::config::Supervisor& cfg) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("--url", params.url, "Bridge WebSocket URL")->check(ws_url_validator)->default_val(params.url);
        app.add_option("-c,--config", params.config_file, "JSON configuration file")->check(CLI::ExistingFile);
        app.add_option("-d,--duration", params.duration_s, "Run time in seconds (0 = until interrupted)")->default_val(params.duration_s);
        app.add_option("--max-attempts", params.max_attempts, "Reconnect attempts before giving up (0 = unbounded)");
        app.add_flag("--no-api", params.no_api, "Report the REST api as unreachable");
        app.add_flag("--no-engine", params.no_engine, "Report the engine as not initialized");
        app.add_flag("--stream", params.start_streaming, "Send start_streaming once connected");
        app.add_flag("--dump-config", params.dump_config, "Print the effective configuration");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
            ->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Supervises the device bridge and prints status, streaming and\n"
            "recording-gate changes. Press Ctrl+C to exit cleanly."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e));
        }

        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);

        // -------------------------------------------------------------
        // Configuration
        // -------------------------------------------------------------
        if (!params.config_file.empty()) {
            const core::config::Error err = core::config::load_file(params.config_file, cfg);
            if (err != core::config::Error::None) {
                std::cerr << "Cannot load " << params.config_file << ": " << core::config::to_string(err) << std::endl;
                std::exit(EXIT_FAILURE);
            }
        }
        if (app.count("--url") > 0 || params.config_file.empty()) {
            cfg.url = params.url;
        }
        if (app.count("--max-attempts") > 0) {
            cfg.reconnect.max_attempts = params.max_attempts;
        }
        return params;
    }

} // namespace bandlink::examples::cli::monitor
