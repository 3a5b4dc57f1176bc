#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

#include "termlink/core/catalog/capability.hpp"


namespace termlink::config {

// -----------------------------------------------------------------------------
// Session configuration
// -----------------------------------------------------------------------------
//
// Credentials, gateway endpoint and the timing knobs of the session engine.
// Loaded from JSON (load_file / load_string) and overridden from the
// environment (apply_env); see loader.hpp.
//
struct Config {
    // Credentials
    std::uint64_t login = 0;
    std::string password;
    std::string server_name;               // MT cluster name ("Demo-A")

    // Trading server address forwarded to Connect (derived from endpoint when empty)
    std::string host;
    int port = 443;

    // Gateway
    std::string endpoint = "mt5.mrpc.pro:443";
    bool secure = true;

    // Default symbol for chart binding and tick probes
    std::string base_symbol = "EURUSD";

    // Connect strategies
    std::chrono::seconds timeout{60};
    int connect_retries = 3;

    // Readiness loop
    int readiness_tries = 12;
    std::chrono::milliseconds readiness_delay{500};
    std::chrono::milliseconds settle_delay{500};

    // Per-call timeouts
    std::chrono::milliseconds probe_timeout{3'000};
    std::chrono::milliseconds handshake_timeout{10'000};
    std::chrono::milliseconds ping_timeout{5'000};
    std::chrono::milliseconds logout_timeout{3'000};

    std::string log_level = "info";

    [[nodiscard]]
    inline std::chrono::milliseconds timeout_for(core::catalog::Timeout t) const noexcept {
        using core::catalog::Timeout;
        switch (t) {
        case Timeout::Connect:   return timeout;
        case Timeout::Handshake: return handshake_timeout;
        case Timeout::Ping:      return ping_timeout;
        case Timeout::Logout:    return logout_timeout;
        case Timeout::Probe:     return probe_timeout;
        }
        return probe_timeout;
    }

    // Password is masked
    inline void dump(std::ostream& os) const {
        os << "[CONFIG] ----------------------------------\n"
           << "  Login            : " << login << '\n'
           << "  Password         : " << (password.empty() ? "(none)" : "********") << '\n'
           << "  Server name      : " << (server_name.empty() ? "(none)" : server_name) << '\n'
           << "  Host             : " << (host.empty() ? "(from endpoint)" : host) << '\n'
           << "  Port             : " << port << '\n'
           << "  Endpoint         : " << endpoint << (secure ? " (tls)" : " (plaintext)") << '\n'
           << "  Base symbol      : " << base_symbol << '\n'
           << "  Timeout          : " << timeout.count() << " s\n"
           << "  Connect retries  : " << connect_retries << '\n'
           << "  Readiness        : " << readiness_tries << " x " << readiness_delay.count() << " ms\n"
           << "  Settle delay     : " << settle_delay.count() << " ms\n"
           << "  Log level        : " << log_level << '\n'
           << "--------------------------------------------\n";
    }
};

} // namespace termlink::config
