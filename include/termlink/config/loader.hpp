#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "termlink/config/config.hpp"


namespace termlink::config {

enum class Error : std::uint8_t {
    None = 0,
    FileNotFound,      // File missing or unreadable
    InvalidJson,       // Not a JSON document
    InvalidSchema,     // Root is not an object or a key has the wrong type
    InvalidValue       // Well-typed but out of range / inconsistent
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:          return "None";
    case Error::FileNotFound:  return "FileNotFound";
    case Error::InvalidJson:   return "InvalidJson";
    case Error::InvalidSchema: return "InvalidSchema";
    case Error::InvalidValue:  return "InvalidValue";
    default:                   return "Unknown";
    }
}

/*
 JSON layout (every key optional, unknown keys ignored):

   {
     "login": 5036292718,
     "password": "...",
     "server_name": "Demo-A",
     "host": "", "port": 443,
     "endpoint": "mt5.mrpc.pro:443", "secure": true,
     "base_symbol": "EURUSD",
     "timeout_seconds": 60, "connect_retries": 3,
     "readiness_tries": 12, "readiness_delay_ms": 500, "settle_delay_ms": 500,
     "probe_timeout_ms": 3000, "handshake_timeout_ms": 10000,
     "ping_timeout_ms": 5000, "logout_timeout_ms": 3000,
     "log_level": "info"
   }

 On error the target Config is left untouched.
*/
[[nodiscard]]
Error load_string(std::string_view json, Config& out);

[[nodiscard]]
Error load_file(const std::string& path, Config& out);

// Overrides from MT5_LOGIN, MT5_PASSWORD, MT5_SERVER, GRPC_SERVER,
// TIMEOUT_SECONDS, CONNECT_RETRIES, BASE_SYMBOL
[[nodiscard]]
Error apply_env(Config& cfg);

[[nodiscard]]
Error validate(const Config& cfg) noexcept;

} // namespace termlink::config
