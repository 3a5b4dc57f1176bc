#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "lcr/log/logger.hpp"
#include "termlink/config/config.hpp"
#include "termlink/config/loader.hpp"


namespace termlink::examples::cli::connect {

    // -------------------------------------------------------------
    // Command-line overrides (empty / zero = keep file or env value)
    // -------------------------------------------------------------
    struct Params {
        std::string config_file;
        std::string endpoint;
        std::uint64_t login      = 0;
        std::string server_name;
        std::string host;
        int port                 = 0;
        std::string symbol;
        bool insecure            = false;
        int tries                = 0;
        std::string log_level    = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Config    : " << (config_file.empty() ? "(none)" : config_file) << "\n"
               << "  Endpoint  : " << (endpoint.empty() ? "(default)" : endpoint) << (insecure ? " (plaintext)" : "") << "\n"
               << "  Login     : " << login << "\n"
               << "  Server    : " << server_name << "\n"
               << "  Symbol    : " << symbol << "\n"
               << "  Log Level : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI for examples
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-c,--config", params.config_file, "JSON configuration file")->check(CLI::ExistingFile);
        app.add_option("--endpoint", params.endpoint, "Gateway endpoint (host:port)")->check(endpoint_validator);
        app.add_option("--login", params.login, "MT5 account login");
        app.add_option("--server", params.server_name, "MT cluster name (e.g. Demo-A)");
        app.add_option("--host", params.host, "Trading server host forwarded to Connect");
        app.add_option("--port", params.port, "Trading server port forwarded to Connect")->check(CLI::Range(1, 65535));
        app.add_option("-s,--symbol", params.symbol, "Base chart symbol (e.g. EURUSD)");
        app.add_flag("--insecure", params.insecure, "Plaintext channel (local gateways)");
        app.add_option("--tries", params.tries, "Readiness probe iterations")->check(CLI::PositiveNumber);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Credentials may also come from MT5_LOGIN, MT5_PASSWORD, MT5_SERVER and GRPC_SERVER.\n"
            "Command-line values override the environment, which overrides the config file."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        lcr::log::Logger::instance().set_level(params.log_level);
        return params;
    }

    // -------------------------------------------------------------
    // file -> environment -> command line, then validation
    // -------------------------------------------------------------
    [[nodiscard]]
    inline bool build_config(const Params& params, config::Config& cfg) {
        config::Error err = config::Error::None;
        if (!params.config_file.empty()) {
            err = config::load_file(params.config_file, cfg);
            if (err != config::Error::None) {
                std::cerr << "Cannot load " << params.config_file << ": " << config::to_string(err) << "\n";
                return false;
            }
        }
        err = config::apply_env(cfg);
        if (err != config::Error::None) {
            std::cerr << "Invalid environment override: " << config::to_string(err) << "\n";
            return false;
        }
        if (!params.endpoint.empty())    cfg.endpoint = params.endpoint;
        if (params.login != 0)           cfg.login = params.login;
        if (!params.server_name.empty()) cfg.server_name = params.server_name;
        if (!params.host.empty())        cfg.host = params.host;
        if (params.port != 0)            cfg.port = params.port;
        if (!params.symbol.empty())      cfg.base_symbol = params.symbol;
        if (params.insecure)             cfg.secure = false;
        if (params.tries != 0)           cfg.readiness_tries = params.tries;
        cfg.log_level = params.log_level;

        err = config::validate(cfg);
        if (err != config::Error::None) {
            std::cerr << "Invalid configuration: " << config::to_string(err) << "\n";
            return false;
        }
        return true;
    }

} // namespace termlink::examples::cli::connect
