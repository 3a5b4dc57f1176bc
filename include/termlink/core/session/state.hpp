#pragma once

#include <cstdint>
#include <string_view>


namespace termlink::core::session {

// Session lifecycle. Transitions only move forward; teardown discards the
// whole context, which reads as Disconnected.
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    StubsAttached,
    Authenticating,
    Ready,
    Failed
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
    case State::Disconnected:   return "Disconnected";
    case State::Connecting:     return "Connecting";
    case State::StubsAttached:  return "StubsAttached";
    case State::Authenticating: return "Authenticating";
    case State::Ready:          return "Ready";
    case State::Failed:         return "Failed";
    default:                    return "Unknown";
    }
}


// Deployment profile, detected once per connection attempt
enum class Mode : std::uint8_t {
    Full,   // session + terminal handshake services present
    Lite    // reduced deployment, relaxed readiness
};

[[nodiscard]]
inline constexpr std::string_view to_string(Mode m) noexcept {
    switch (m) {
    case Mode::Full: return "FULL";
    case Mode::Lite: return "LITE";
    default:         return "Unknown";
    }
}


// Confidence of a successful connect()
enum class Readiness : std::uint8_t {
    Confirmed,      // a readiness probe succeeded
    SoftAccepted,   // LITE: no probe succeeded but capability stubs are attached
    Unconfirmed     // LITE: readiness loop exhausted, accepted anyway
};

[[nodiscard]]
inline constexpr std::string_view to_string(Readiness r) noexcept {
    switch (r) {
    case Readiness::Confirmed:    return "Confirmed";
    case Readiness::SoftAccepted: return "SoftAccepted";
    case Readiness::Unconfirmed:  return "Unconfirmed";
    default:                      return "Unknown";
    }
}

} // namespace termlink::core::session
