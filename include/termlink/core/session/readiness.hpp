#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/proto/fields.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/outcome.hpp"
#include "termlink/core/session/state.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session::readiness {

enum class ProbeSet : std::uint8_t {
    Readiness,   // server-time, symbols-total, opened-tickets, symbol-tick
    KeepAlive    // server-time, symbols-total, account-summary
};

// ---------------------------------------------------------------------
// One pass over the probe table, in priority order
// ---------------------------------------------------------------------
//
// Success        first probe that succeeded (the pass stops there)
// SoftFailure    at least one probe was issued, none succeeded
// NotApplicable  no probe could be issued (capabilities/methods absent)
//
template<class Channel, class A>
[[nodiscard]]
Outcome probe_once(const Context<Channel, A>& ctx, const config::Config& cfg, ProbeSet set,
                   telemetry::Session& telemetry) {
    bool issued = false;
    for (const auto& probe : catalog::PROBES) {
        const bool selected = (set == ProbeSet::Readiness) ? probe.readiness : probe.keepalive;
        if (!selected) {
            continue;
        }
        // First attached capability exposing the method
        const Stub<Channel>* stub = nullptr;
        for (auto key : probe.capabilities) {
            if (key.empty()) {
                continue;
            }
            const auto* candidate = ctx.stubs.find(key);
            if (candidate != nullptr && candidate->exposes(probe.methods)) {
                stub = candidate;
                break;
            }
        }
        if (stub == nullptr) {
            continue;
        }
        issued = true;
        telemetry.probes_issued_total.inc();
        const Outcome o = stub->invoke(probe.methods, [&](google::protobuf::Message& req) {
            switch (probe.args) {
            case catalog::ProbeArgs::SelectedOnlyFalse:
                proto::assign_bool(req, catalog::field::SELECTED_ONLY, false);
                break;
            case catalog::ProbeArgs::BaseSymbol:
                proto::assign_string(req, catalog::field::SYMBOL, cfg.base_symbol);
                break;
            case catalog::ProbeArgs::None:
                break;
            }
        }, ctx.headers, cfg.timeout_for(catalog::Timeout::Probe));
        TL_TRACE("[READY] Probe " << probe.name << ": " << to_string(o));
        if (o == Outcome::Success) {
            telemetry.probes_succeeded_total.inc();
            return o;
        }
    }
    return issued ? Outcome::SoftFailure : Outcome::NotApplicable;
}


// ---------------------------------------------------------------------
// Bounded readiness loop
// ---------------------------------------------------------------------
//
// Up to `readiness_tries` iterations spaced by `readiness_delay`:
//   - any probe success                        -> Confirmed
//   - LITE, after the delay of iteration i with
//     i >= max(1, tries / 2) and any of
//     account-helper/market-info/symbols/account
//     attached                                 -> SoftAccepted
// Exhaustion: LITE -> Unconfirmed (logged), FULL -> nullopt (caller raises).
//
template<class Channel, class A>
[[nodiscard]]
std::optional<Readiness> wait_ready(const Context<Channel, A>& ctx, const config::Config& cfg,
                                    telemetry::Session& telemetry) {
    const int tries = std::max(1, cfg.readiness_tries);
    const int soft_after = std::max(1, tries / 2);
    const bool lite = (ctx.mode == Mode::Lite);

    for (int i = 0; i < tries; ++i) {
        if (probe_once(ctx, cfg, ProbeSet::Readiness, telemetry) == Outcome::Success) {
            TL_INFO("[READY] Session ready after " << (i + 1) << " iteration(s)");
            return Readiness::Confirmed;
        }
        if (cfg.readiness_delay.count() > 0) {
            std::this_thread::sleep_for(cfg.readiness_delay);
        }
        if (lite && i >= soft_after && ctx.stubs.any_of(catalog::LITE_EVIDENCE_CAPABILITIES)) {
            telemetry.soft_acceptances_total.inc();
            TL_INFO("[READY] LITE session accepted on attached capabilities");
            return Readiness::SoftAccepted;
        }
    }

    if (lite) {
        TL_WARN("[READY] No readiness probe succeeded after " << tries << " tries; LITE session accepted unconfirmed");
        return Readiness::Unconfirmed;
    }
    TL_ERROR("[READY] No readiness probe succeeded after " << tries << " tries");
    return std::nullopt;
}

} // namespace termlink::core::session::readiness
