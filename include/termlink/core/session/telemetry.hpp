#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"


namespace termlink::core::telemetry {

// ============================================================================
// Session Telemetry
//
// Observes decisions of the session engine across connection attempts.
// Mechanical facts only. Owned by the caller, outlives the engine.
// ============================================================================

struct Session final {
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // connect() invoked (directly or by ensure_connected)
    lcr::metrics::atomic::counter32 connect_calls_total;

    // connect() returned a readiness verdict
    lcr::metrics::atomic::counter32 connect_success_total;

    // connect() raised
    lcr::metrics::atomic::counter32 connect_failure_total;

    // Teardown sequences executed
    lcr::metrics::atomic::counter32 teardowns_total;

    // ---------------------------------------------------------------------
    // Establishment
    // ---------------------------------------------------------------------

    // Connect strategies that succeeded
    lcr::metrics::atomic::counter32 strategy_success_total;

    // Channel found by the resolver
    lcr::metrics::atomic::counter32 channel_resolutions_total;

    // Stubs attached (registry + handshake + login binding)
    lcr::metrics::atomic::counter32 stubs_attached_total;

    // Handshake candidate that succeeded
    lcr::metrics::atomic::counter32 handshake_success_total;

    // ---------------------------------------------------------------------
    // Login fallback
    // ---------------------------------------------------------------------

    // Discovery scans started
    lcr::metrics::atomic::counter32 login_discoveries_total;

    // Fallback login succeeded and was bound as "account"
    lcr::metrics::atomic::counter32 login_success_total;

    // ---------------------------------------------------------------------
    // Readiness
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 probes_issued_total;
    lcr::metrics::atomic::counter32 probes_succeeded_total;

    // LITE readiness accepted without a successful probe
    lcr::metrics::atomic::counter32 soft_acceptances_total;

    // ensure_connected() triggered a full reconnect
    lcr::metrics::atomic::counter32 ensure_reconnects_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Session& other) const noexcept {
        connect_calls_total.copy_to(other.connect_calls_total);
        connect_success_total.copy_to(other.connect_success_total);
        connect_failure_total.copy_to(other.connect_failure_total);
        teardowns_total.copy_to(other.teardowns_total);
        strategy_success_total.copy_to(other.strategy_success_total);
        channel_resolutions_total.copy_to(other.channel_resolutions_total);
        stubs_attached_total.copy_to(other.stubs_attached_total);
        handshake_success_total.copy_to(other.handshake_success_total);
        login_discoveries_total.copy_to(other.login_discoveries_total);
        login_success_total.copy_to(other.login_success_total);
        probes_issued_total.copy_to(other.probes_issued_total);
        probes_succeeded_total.copy_to(other.probes_succeeded_total);
        soft_acceptances_total.copy_to(other.soft_acceptances_total);
        ensure_reconnects_total.copy_to(other.ensure_reconnects_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Session Telemetry ===\n";
        os << "Lifecycle\n";
        connect_calls_total.dump(os,       "Connect calls       ");
        connect_success_total.dump(os,     "Connect success     ");
        connect_failure_total.dump(os,     "Connect failure     ");
        teardowns_total.dump(os,           "Teardowns           ");
        os << "\nEstablishment\n";
        strategy_success_total.dump(os,    "Strategy success    ");
        channel_resolutions_total.dump(os, "Channel resolutions ");
        stubs_attached_total.dump(os,      "Stubs attached      ");
        handshake_success_total.dump(os,   "Handshake success   ");
        os << "\nLogin fallback\n";
        login_discoveries_total.dump(os,   "Discoveries         ");
        login_success_total.dump(os,       "Logins              ");
        os << "\nReadiness\n";
        probes_issued_total.dump(os,       "Probes issued       ");
        probes_succeeded_total.dump(os,    "Probes succeeded    ");
        soft_acceptances_total.dump(os,    "Soft acceptances    ");
        ensure_reconnects_total.dump(os,   "Ensure reconnects   ");
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Session>, "telemetry::Session must be standard layout");
static_assert(!std::is_polymorphic_v<Session>, "telemetry::Session must not be polymorphic");

} // namespace termlink::core::telemetry
