#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"
#include "termlink/core/rpc/endpoint.hpp"


namespace termlink::examples::cli {

// -------------------------------------------------------------
// Gateway endpoint validator
// -------------------------------------------------------------
inline auto endpoint_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::rpc::Endpoint endpoint;
        if (core::rpc::parse_endpoint(value, endpoint) == core::rpc::Error::None) {
            return {};
        }
        return "Endpoint must be [scheme://]host[:port] (e.g. mt5.mrpc.pro:443)";
    },
    "Gateway endpoint validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level level;
        if (lcr::log::parse_level(value, level)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);

} // namespace termlink::examples::cli
