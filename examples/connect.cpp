#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

#include "termlink.hpp"

#include "common/cli/connect_params.hpp"

using namespace termlink;
using core::session::ConnectionError;

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::connect::configure(argc, argv,
        "termlink - Connect Example\n"
        "Opens one session on the MT5 gateway, reports its readiness and closes it.\n");
    params.dump("=== Connect Example Parameters ===", std::cout);

    config::Config cfg;
    if (!examples::cli::connect::build_config(params, cfg)) {
        return EXIT_FAILURE;
    }
    cfg.dump(std::cout);

    gateway::Client client(cfg);

    // -------------------------------------------------------------
    // Connect, retrying on ConnectionError
    // -------------------------------------------------------------
    const int attempts = cfg.connect_retries + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            const auto readiness = client.connect();
            std::cout << "[example] Connected: mode=" << core::session::to_string(client.mode())
                      << " readiness=" << core::session::to_string(readiness) << std::endl;
            break;
        }
        catch (const ConnectionError& e) {
            std::cout << "[example] Attempt " << attempt << "/" << attempts << " failed: " << e.what() << std::endl;
            if (attempt == attempts) {
                client.dump_telemetry(std::cout);
                return EXIT_FAILURE;
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    // -------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------
    client.disconnect();
    std::cout << "[example] State after disconnect: " << core::session::to_string(client.state()) << std::endl;
    client.dump_telemetry(std::cout);
    return EXIT_SUCCESS;
}
