#pragma once

#include <memory>
#include <string>

#include "termlink/core/rpc/concepts.hpp"
#include "termlink/core/rpc/metadata.hpp"
#include "termlink/core/session/state.hpp"
#include "termlink/core/session/stub_registry.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session {

// -----------------------------------------------------------------------------
// Context<Channel, Account>
// -----------------------------------------------------------------------------
//
// Everything one logical session owns. Created fresh by every connect() and
// discarded by teardown; never reused across reconnects.
//
// Invariants (maintained by the engine, the only writer):
//   - channel is non-null whenever state is past Connecting
//   - identity only changes while state == Connecting
//   - headers carry the identity under rpc::IDENTITY_KEY once built
//   - mode is written once (mode_detected)
//   - stubs entries are never replaced
//
template<rpc::ChannelConcept Channel, class Account>
struct Context {
    std::unique_ptr<Account> account;

    std::string identity;
    rpc::Metadata headers;

    std::shared_ptr<Channel> channel;
    std::string channel_origin;          // where the resolver found it

    StubRegistry<Channel> stubs;

    Mode mode = Mode::Full;
    bool mode_detected = false;

    State state = State::Disconnected;

    // Forward-only transition
    inline bool advance(State next) noexcept {
        if (next <= state) {
            TL_WARN("[ENGINE] Ignored backward transition " << to_string(state) << " -> " << to_string(next));
            return false;
        }
        TL_DEBUG("[ENGINE] " << to_string(state) << " -> " << to_string(next));
        state = next;
        return true;
    }
};

} // namespace termlink::core::session
