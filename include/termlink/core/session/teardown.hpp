#pragma once

#include <exception>
#include <memory>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/session/account_traits.hpp"
#include "termlink/core/session/calls.hpp"
#include "termlink/core/session/channel_resolver.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/outcome.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session::teardown {

/*
===============================================================================
 Teardown sequence
===============================================================================

Best-effort, in order, every step guarded independently:

  1) stop streams        each of unsubscribe_all / stop_streams / close_streams
  2) logout RPC          on the account capability, when attached
  3) account shutdown    each of logout / close / disconnect / stop / shutdown
  4) channel close       context channel, else whatever the resolver finds
  5) context reset       unconditional

A missing resource counts as success. Teardown never raises and may run on a
context that never got past Connecting (or on no context at all).
===============================================================================
*/

template<class Channel, class A>
void run(std::unique_ptr<Context<Channel, A>>& ctx, const config::Config& cfg,
         telemetry::Session& telemetry) noexcept {
    if (!ctx) {
        return;
    }
    TL_DEBUG("[TEARDOWN] Tearing down session in state " << to_string(ctx->state));
    telemetry.teardowns_total.inc();

    if (ctx->account) {
        A& a = *ctx->account;

        // 1) Streams
        if constexpr (account::exposes_unsubscribe_all<A>) (void)run_step("[TEARDOWN]", "unsubscribe_all()", [&] { return a.unsubscribe_all(); });
        if constexpr (account::exposes_stop_streams<A>)    (void)run_step("[TEARDOWN]", "stop_streams()",    [&] { return a.stop_streams(); });
        if constexpr (account::exposes_close_streams<A>)   (void)run_step("[TEARDOWN]", "close_streams()",   [&] { return a.close_streams(); });
    }

    // 2) Logout RPC
    if (ctx->stubs.contains(catalog::ACCOUNT)) {
        const Outcome o = run_step("[TEARDOWN]", "Logout", [&] {
            return invoke_operation(*ctx, catalog::op::LOGOUT, cfg, no_fields);
        });
        TL_DEBUG("[TEARDOWN] Logout: " << to_string(o));
    }

    // 3) Account shutdown
    std::shared_ptr<Channel> channel = ctx->channel;
    if (ctx->account) {
        A& a = *ctx->account;
        if (!channel) {
            // Resolve before the account releases its transport
            (void)run_step("[TEARDOWN]", "resolve channel", [&] {
                if (auto resolved = resolve_channel<Channel>(a, ctx->stubs)) {
                    channel = resolved->channel;
                }
            });
        }
        if constexpr (account::exposes_logout<A>)     (void)run_step("[TEARDOWN]", "logout()",     [&] { return a.logout(); });
        if constexpr (account::exposes_close<A>)      (void)run_step("[TEARDOWN]", "close()",      [&] { return a.close(); });
        if constexpr (account::exposes_disconnect<A>) (void)run_step("[TEARDOWN]", "disconnect()", [&] { return a.disconnect(); });
        if constexpr (account::exposes_stop<A>)       (void)run_step("[TEARDOWN]", "stop()",       [&] { return a.stop(); });
        if constexpr (account::exposes_shutdown<A>)   (void)run_step("[TEARDOWN]", "shutdown()",   [&] { return a.shutdown(); });
    }

    // 4) Channel
    if (channel) {
        channel->close();
    }

    // 5) Context
    ctx.reset();
    TL_INFO("[TEARDOWN] Session closed");
}

} // namespace termlink::core::session::teardown
