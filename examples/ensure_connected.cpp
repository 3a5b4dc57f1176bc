#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include "termlink.hpp"

#include "common/cli/connect_params.hpp"

using namespace termlink;
using core::session::ConnectionError;

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
    const auto params = examples::cli::connect::configure(argc, argv,
        "termlink - Keep-Alive Example\n"
        "Keeps one session alive with ensure_connected(), reconnecting when the\n"
        "keep-alive probes fail.\n");
    params.dump("=== Keep-Alive Example Parameters ===", std::cout);

    config::Config cfg;
    if (!examples::cli::connect::build_config(params, cfg)) {
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, on_signal);

    gateway::Client client(cfg);

    // -------------------------------------------------------------
    // Keep-alive loop
    // -------------------------------------------------------------
    int failures = 0;
    while (running.load()) {
        try {
            const auto readiness = client.ensure_connected();
            std::cout << "[example] " << core::session::to_string(client.mode()) << " session "
                      << core::session::to_string(readiness) << std::endl;
            failures = 0;
        }
        catch (const ConnectionError& e) {
            std::cout << "[example] Reconnect failed: " << e.what() << std::endl;
            if (++failures > cfg.connect_retries) {
                break;
            }
        }
        for (int i = 0; i < 50 && running.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    // -------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------
    client.disconnect();
    client.dump_telemetry(std::cout);
    std::cout << "\n[SUCCESS] Clean shutdown completed." << std::endl;
    return failures > cfg.connect_retries ? EXIT_FAILURE : EXIT_SUCCESS;
}
