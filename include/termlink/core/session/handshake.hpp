#pragma once

#include <array>
#include <utility>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/session/calls.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/outcome.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session::handshake {

// ---------------------------------------------------------------------
// Mode detection
// ---------------------------------------------------------------------
//
// FULL when both handshake capabilities resolve in this deployment.
// Computed once per context; later calls return the recorded mode.
//
template<class Channel, class A>
Mode detect_mode(Context<Channel, A>& ctx, const catalog::Catalog& catalog) {
    if (ctx.mode_detected) {
        return ctx.mode;
    }
    bool full = true;
    for (auto key : catalog::HANDSHAKE_CAPABILITIES) {
        full = full && catalog.has(key);
    }
    ctx.mode = full ? Mode::Full : Mode::Lite;
    ctx.mode_detected = true;
    TL_INFO("[ENGINE] Deployment mode " << to_string(ctx.mode));
    return ctx.mode;
}


// ---------------------------------------------------------------------
// FULL handshake cascade
// ---------------------------------------------------------------------
//
//   (a) open-session       session capability   (OpenSession | SessionOpen)
//   (b) terminal-login     terminal capability
//   (c) terminal-is-alive  terminal capability
//   (d) helper-ping        account-helper capability
//
// First success ends the cascade. Session and terminal stubs are attached
// to the registry before the cascade runs.
//
template<class Channel, class A>
Outcome run_full(Context<Channel, A>& ctx, const config::Config& cfg, const catalog::Catalog& catalog,
                 telemetry::Session& telemetry) {
    for (auto key : catalog::HANDSHAKE_CAPABILITIES) {
        if (ctx.stubs.attach(catalog, key, ctx.channel)) {
            telemetry.stubs_attached_total.inc();
        }
    }

    auto with_credentials = [&](google::protobuf::Message& req) { fill_credentials(req, cfg, ctx.identity); };
    auto with_identity = [&](google::protobuf::Message& req) {
        proto::assign_string(req, catalog::field::IDENTITY, ctx.identity);
    };

    struct Candidate {
        const catalog::Operation* operation;
        bool credentials;       // login/password/server, else identity only
    };
    const std::array<Candidate, 4> cascade = {{
        {&catalog::op::OPEN_SESSION,   true},
        {&catalog::op::TERMINAL_LOGIN, true},
        {&catalog::op::IS_ALIVE,       false},
        {&catalog::op::HELPER_PING,    false},
    }};
    for (const auto& candidate : cascade) {
        const catalog::Operation& operation = *candidate.operation;
        const Outcome o = candidate.credentials
            ? invoke_operation(ctx, operation, cfg, with_credentials)
            : invoke_operation(ctx, operation, cfg, with_identity);
        TL_DEBUG("[HANDSHAKE] " << operation.name << ": " << to_string(o));
        if (o == Outcome::Success) {
            telemetry.handshake_success_total.inc();
            TL_INFO("[HANDSHAKE] Completed via " << operation.name);
            return o;
        }
    }
    TL_WARN("[HANDSHAKE] No handshake candidate succeeded");
    return Outcome::SoftFailure;
}


// ---------------------------------------------------------------------
// LITE keep-alive: a single best-effort helper ping
// ---------------------------------------------------------------------
template<class Channel, class A>
Outcome run_lite(Context<Channel, A>& ctx, const config::Config& cfg, telemetry::Session& telemetry) {
    const Outcome o = invoke_operation(ctx, catalog::op::HELPER_PING, cfg, no_fields);
    TL_DEBUG("[HANDSHAKE] LITE ping: " << to_string(o));
    if (o == Outcome::Success) {
        telemetry.handshake_success_total.inc();
    }
    return o;
}

} // namespace termlink::core::session::handshake
