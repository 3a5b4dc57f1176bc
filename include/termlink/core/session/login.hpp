#pragma once

#include <memory>
#include <optional>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/session/calls.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/outcome.hpp"
#include "termlink/core/session/stub.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session::login {

/*
===============================================================================
 Login fallback
===============================================================================

Runs only when the registry attached no "account" stub.

  discover()  scans every deployed service (not only the registry set), in
              module order, for one exposing a login-shaped method
              (Login, AccountLogin, UserLogin, OpenSession, SessionOpen,
              TerminalLogin) and returns a stub bound to the channel.

  attempt()   builds each exposed login-shaped request from its method
              descriptor, fills the credential aliases the request exposes
              and invokes the methods in alias order until one succeeds.

The stub that authenticates is bound under "account" by the engine.
===============================================================================
*/

template<rpc::ChannelConcept Channel>
[[nodiscard]]
std::optional<Stub<Channel>> discover(const catalog::Catalog& catalog, const std::shared_ptr<Channel>& channel) {
    for (const auto* service : catalog.services()) {
        Stub<Channel> candidate(service->full_name(), service, channel);
        if (candidate.exposes(catalog::method::LOGIN)) {
            TL_INFO("[LOGIN] Login-capable service " << service->full_name());
            return candidate;
        }
    }
    TL_WARN("[LOGIN] No login-capable service deployed");
    return std::nullopt;
}

template<rpc::ChannelConcept Channel>
[[nodiscard]]
Outcome attempt(const Stub<Channel>& stub, const config::Config& cfg, const std::string& identity,
                const rpc::Metadata& headers) {
    const auto methods = stub.find_methods(catalog::method::LOGIN);
    if (methods.empty()) {
        return Outcome::NotApplicable;
    }
    for (const auto* method : methods) {
        const Outcome o = stub.invoke(method, [&](google::protobuf::Message& req) {
            fill_credentials(req, cfg, identity);
        }, headers, cfg.timeout_for(catalog::Timeout::Handshake));
        TL_DEBUG("[LOGIN] " << method->full_name() << ": " << to_string(o));
        if (o == Outcome::Success) {
            return o;
        }
    }
    return Outcome::SoftFailure;
}

// Discover + attempt + bind as "account"
template<class Channel, class A>
Outcome run(Context<Channel, A>& ctx, const config::Config& cfg, const catalog::Catalog& catalog,
            telemetry::Session& telemetry) {
    if (ctx.stubs.contains(catalog::ACCOUNT)) {
        TL_DEBUG("[LOGIN] Account stub attached, fallback skipped");
        return Outcome::NotApplicable;
    }
    telemetry.login_discoveries_total.inc();
    auto stub = discover(catalog, ctx.channel);
    if (!stub) {
        return Outcome::NotApplicable;
    }
    const Outcome o = attempt(*stub, cfg, ctx.identity, ctx.headers);
    if (o != Outcome::Success) {
        TL_WARN("[LOGIN] Fallback login failed on " << stub->key());
        return o;
    }
    if (ctx.stubs.bind(catalog::ACCOUNT, std::move(*stub))) {
        telemetry.stubs_attached_total.inc();
    }
    telemetry.login_success_total.inc();
    TL_INFO("[LOGIN] Logged in, bound as '" << catalog::ACCOUNT << "'");
    return o;
}

} // namespace termlink::core::session::login
