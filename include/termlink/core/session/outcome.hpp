#pragma once

#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

#include "termlink/core/rpc/error.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session {

// -----------------------------------------------------------------------------
// Outcome of one probing step (strategy, handshake candidate, login attempt,
// probe, teardown step). Steps never throw: failures are folded into this.
// -----------------------------------------------------------------------------
enum class Outcome : std::uint8_t {
    Success,
    SoftFailure,     // tried and failed, continue with the next candidate
    NotApplicable    // capability/method absent, nothing was tried
};

[[nodiscard]]
inline constexpr std::string_view to_string(Outcome o) noexcept {
    switch (o) {
    case Outcome::Success:       return "Success";
    case Outcome::SoftFailure:   return "SoftFailure";
    case Outcome::NotApplicable: return "NotApplicable";
    default:                     return "Unknown";
    }
}

[[nodiscard]]
inline constexpr Outcome to_outcome(rpc::Error err) noexcept {
    if (err == rpc::Error::None) {
        return Outcome::Success;
    }
    return err == rpc::Error::Unimplemented ? Outcome::NotApplicable : Outcome::SoftFailure;
}

[[nodiscard]]
inline constexpr Outcome to_outcome(bool ok) noexcept {
    return ok ? Outcome::Success : Outcome::SoftFailure;
}

[[nodiscard]]
inline constexpr Outcome to_outcome(Outcome o) noexcept {
    return o;
}


// -----------------------------------------------------------------------------
// run_step
// -----------------------------------------------------------------------------
//
// Runs a step exposed by a collaborator (account method, factory, stream stop)
// and maps whatever it returns onto an Outcome:
//
//   void            -> Success
//   bool            -> Success / SoftFailure
//   rpc::Error      -> Success / NotApplicable (Unimplemented) / SoftFailure
//   Outcome         -> as is
//   anything else   -> Success (the call returned normally)
//
// Any exception thrown by the step is logged and mapped to SoftFailure.
//
template<class F>
[[nodiscard]]
Outcome run_step(std::string_view tag, std::string_view label, F&& fn) {
    using R = std::invoke_result_t<F&>;
    try {
        if constexpr (std::is_void_v<R>) {
            fn();
            return Outcome::Success;
        }
        else if constexpr (std::is_same_v<std::decay_t<R>, bool> ||
                           std::is_same_v<std::decay_t<R>, rpc::Error> ||
                           std::is_same_v<std::decay_t<R>, Outcome>) {
            const Outcome o = to_outcome(fn());
            if (o == Outcome::SoftFailure) {
                TL_DEBUG(tag << " " << label << " reported failure");
            }
            return o;
        }
        else {
            (void)fn();
            return Outcome::Success;
        }
    }
    catch (const std::exception& e) {
        TL_WARN(tag << " " << label << " raised: " << e.what());
        return Outcome::SoftFailure;
    }
    catch (...) {
        TL_WARN(tag << " " << label << " raised a non-standard exception");
        return Outcome::SoftFailure;
    }
}

} // namespace termlink::core::session
