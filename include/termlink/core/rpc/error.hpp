#pragma once

#include <cstdint>
#include <string_view>

namespace termlink::core {
namespace rpc {

/*
===============================================================================
 rpc::Error
===============================================================================

Call-level error classification.

This enum represents *semantic RPC failures*, abstracted away from the gRPC
status codes and from the error payloads the gateway embeds in its replies.

The session engine uses it to decide whether a step is worth retrying or
whether the capability simply does not exist in this deployment.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidEndpoint,     // Malformed endpoint (host, port, scheme)
    InvalidArgument,     // Request rejected before or by the server as malformed
    NotConnected,        // Channel is closed or was never opened

    // --- Remote contract ----------------------------------------------------
    Unimplemented,       // Service or method is not served by this deployment
    Rejected,            // Call completed but the reply carried an error payload

    // --- Transient / recoverable failures -----------------------------------
    Timeout,             // Deadline exceeded
    Unavailable,         // Server unreachable or connection dropped
    Cancelled,           // Call cancelled locally or remotely

    // --- Fatal / unspecified failures ---------------------------------------
    SerializationFailed, // Request or reply could not be (de)serialized
    TransportFailure,    // Any other transport failure
};


/// Optional helper for logging / diagnostics
[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                return "None";
    case Error::InvalidEndpoint:     return "InvalidEndpoint";
    case Error::InvalidArgument:     return "InvalidArgument";
    case Error::NotConnected:        return "NotConnected";
    case Error::Unimplemented:       return "Unimplemented";
    case Error::Rejected:            return "Rejected";
    case Error::Timeout:             return "Timeout";
    case Error::Unavailable:         return "Unavailable";
    case Error::Cancelled:           return "Cancelled";
    case Error::SerializationFailed: return "SerializationFailed";
    case Error::TransportFailure:    return "TransportFailure";
    default:                         return "Unknown";
    }
}

// True when retrying the same call later may succeed
[[nodiscard]]
inline constexpr bool is_transient(Error err) noexcept {
    return err == Error::Timeout || err == Error::Unavailable || err == Error::Cancelled;
}

} // namespace rpc
} // namespace termlink::core
