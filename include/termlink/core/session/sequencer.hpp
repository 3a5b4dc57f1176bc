#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/proto/fields.hpp"
#include "termlink/core/rpc/endpoint.hpp"
#include "termlink/core/session/account_traits.hpp"
#include "termlink/core/session/channel_resolver.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/identity.hpp"
#include "termlink/core/session/outcome.hpp"
#include "termlink/core/session/stub.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session::sequencer {

/*
===============================================================================
 Connection attempt sequencer
===============================================================================

Strategies, in this fixed order, each independent and non-fatal:

  1) generic         first of reconnect/connect/start/initialize/open the account exposes
  2) server-name     account.connect_by_server_name(server, symbol, timeout_s)
  3) host-port       account.connect_by_host_port(host, port, symbol, timeout_s)
                     (host and port derived from the endpoint when unset)
  4) manual          ConnectEx, then Connect, issued on the connection capability

Every strategy returns an Outcome. A failure is logged and the next strategy
runs; the sequencer never raises. A terminal identity learned by a strategy
is adopted by the context (while Connecting) and the headers are rebuilt.
===============================================================================
*/

struct Report {
    std::uint32_t succeeded = 0;
    std::uint32_t failed = 0;
    std::uint32_t not_applicable = 0;

    inline void record(Outcome o) noexcept {
        switch (o) {
        case Outcome::Success:       ++succeeded; break;
        case Outcome::SoftFailure:   ++failed; break;
        case Outcome::NotApplicable: ++not_applicable; break;
        }
    }
};

// Trading server host/port: configured values, else the endpoint's
struct HostPort {
    std::string host;
    int port = 0;
};

[[nodiscard]]
inline HostPort derive_host_port(const config::Config& cfg) {
    if (!cfg.host.empty()) {
        return {cfg.host, cfg.port};
    }
    rpc::Endpoint endpoint;
    if (rpc::parse_endpoint(cfg.endpoint, endpoint) != rpc::Error::None) {
        return {};
    }
    return {endpoint.host, endpoint.port};
}

[[nodiscard]]
inline int timeout_seconds(const config::Config& cfg) noexcept {
    return static_cast<int>(cfg.timeout.count());
}


// ---------------------------------------------------------------------
// 1) Generic strategy
// ---------------------------------------------------------------------
template<class Channel, class A>
[[nodiscard]]
Outcome run_generic(Context<Channel, A>& ctx) {
    A& a = *ctx.account;
    if constexpr (account::exposes_reconnect<A>) {
        return run_step("[SEQ]", "reconnect()", [&] { return a.reconnect(); });
    }
    else if constexpr (account::exposes_connect<A>) {
        return run_step("[SEQ]", "connect()", [&] { return a.connect(); });
    }
    else if constexpr (account::exposes_start<A>) {
        return run_step("[SEQ]", "start()", [&] { return a.start(); });
    }
    else if constexpr (account::exposes_initialize<A>) {
        return run_step("[SEQ]", "initialize()", [&] { return a.initialize(); });
    }
    else if constexpr (account::exposes_open<A>) {
        return run_step("[SEQ]", "open()", [&] { return a.open(); });
    }
    else {
        return Outcome::NotApplicable;
    }
}

// ---------------------------------------------------------------------
// 2) Connect by server name
// ---------------------------------------------------------------------
template<class Channel, class A>
[[nodiscard]]
Outcome run_by_server_name(Context<Channel, A>& ctx, const config::Config& cfg) {
    if constexpr (account::connects_by_server_name<A>) {
        if (cfg.server_name.empty()) {
            return Outcome::NotApplicable;
        }
        return run_step("[SEQ]", "connect_by_server_name()", [&] {
            return ctx.account->connect_by_server_name(cfg.server_name, cfg.base_symbol, timeout_seconds(cfg));
        });
    }
    else {
        return Outcome::NotApplicable;
    }
}

// ---------------------------------------------------------------------
// 3) Connect by host/port
// ---------------------------------------------------------------------
template<class Channel, class A>
[[nodiscard]]
Outcome run_by_host_port(Context<Channel, A>& ctx, const config::Config& cfg) {
    if constexpr (account::connects_by_host_port<A>) {
        const HostPort hp = derive_host_port(cfg);
        if (hp.host.empty()) {
            return Outcome::NotApplicable;
        }
        return run_step("[SEQ]", "connect_by_host_port()", [&] {
            return ctx.account->connect_by_host_port(hp.host, hp.port, cfg.base_symbol, timeout_seconds(cfg));
        });
    }
    else {
        return Outcome::NotApplicable;
    }
}

// ---------------------------------------------------------------------
// 4) Manual handshake requests on the connection capability
// ---------------------------------------------------------------------
template<class Channel, class A>
[[nodiscard]]
Outcome run_manual(Context<Channel, A>& ctx, const config::Config& cfg, const catalog::Catalog& catalog,
                   const catalog::Operation& operation) {
    const auto* service = catalog.resolve(operation.capability);
    if (service == nullptr) {
        return Outcome::NotApplicable;
    }
    const bool extended = (operation.name == catalog::op::CONNECT_EX.name);
    if (extended && cfg.server_name.empty()) {
        return Outcome::NotApplicable;
    }
    auto resolved = resolve_channel<Channel>(*ctx.account, ctx.stubs);
    if (!resolved) {
        TL_DEBUG("[SEQ] " << operation.name << " skipped: no channel yet");
        return Outcome::NotApplicable;
    }
    // Transient stub: the connection capability is not part of the registry
    const Stub<Channel> stub(operation.capability, service, resolved->channel);
    const HostPort hp = derive_host_port(cfg);

    typename Stub<Channel>::MessagePtr reply;
    const Outcome outcome = stub.invoke(operation.methods, [&](google::protobuf::Message& req) {
        proto::assign_int(req, catalog::field::LOGIN, static_cast<std::int64_t>(cfg.login));
        proto::assign_string(req, catalog::field::PASSWORD, cfg.password);
        proto::assign_string(req, catalog::field::BASE_SYMBOL, cfg.base_symbol);
        proto::assign_int(req, catalog::field::READY_TIMEOUT, timeout_seconds(cfg));
        if (extended) {
            proto::assign_string(req, catalog::field::SERVER, cfg.server_name);
            proto::assign_string(req, catalog::field::IDENTITY, ctx.identity);
        }
        else {
            proto::assign_string(req, catalog::field::HOST, hp.host);
            proto::assign_int(req, catalog::field::PORT, hp.port);
        }
    }, ctx.headers, cfg.timeout_for(operation.timeout), &reply);

    if (outcome == Outcome::Success && reply) {
        if (auto assigned = proto::read_string(*reply, catalog::field::REPLY_IDENTITY)) {
            identity::adopt(ctx, *assigned, cfg);
        }
    }
    return outcome;
}


// ---------------------------------------------------------------------
// Full sequence
// ---------------------------------------------------------------------
template<class Channel, class A>
Report run(Context<Channel, A>& ctx, const config::Config& cfg, const catalog::Catalog& catalog,
           telemetry::Session& telemetry) {
    Report report;
    auto attempt = [&](std::string_view name, Outcome o) {
        report.record(o);
        if (o == Outcome::Success) {
            telemetry.strategy_success_total.inc();
        }
        TL_DEBUG("[SEQ] Strategy " << name << ": " << to_string(o));
        // The account may have learned a terminal identity from the server
        identity::sync_from_account(ctx, cfg);
    };

    attempt("generic",     run_generic(ctx));
    attempt("server-name", run_by_server_name(ctx, cfg));
    attempt("host-port",   run_by_host_port(ctx, cfg));
    attempt("connect-ex",  run_manual(ctx, cfg, catalog, catalog::op::CONNECT_EX));
    attempt("connect",     run_manual(ctx, cfg, catalog, catalog::op::CONNECT));

    if (report.succeeded == 0) {
        TL_WARN("[SEQ] No connect strategy succeeded (" << report.failed << " failed, "
                << report.not_applicable << " not applicable)");
    }
    return report;
}

} // namespace termlink::core::session::sequencer
