#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/rpc/concepts.hpp"
#include "termlink/core/session/account_traits.hpp"
#include "termlink/core/session/channel_resolver.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/error.hpp"
#include "termlink/core/session/handshake.hpp"
#include "termlink/core/session/identity.hpp"
#include "termlink/core/session/login.hpp"
#include "termlink/core/session/outcome.hpp"
#include "termlink/core/session/readiness.hpp"
#include "termlink/core/session/sequencer.hpp"
#include "termlink/core/session/state.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "termlink/core/session/teardown.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session {

/*
===============================================================================
 termlink::core::session::Engine<Channel, Account>
===============================================================================

Adaptive connection and session-readiness engine.

Turns a static configuration into a live session on a gateway whose API
surface is only partially known: services may be absent, method and field
names vary, and reduced (LITE) deployments lack the session/terminal
handshake services altogether.

Parameterized by a channel type (rpc::ChannelConcept) and an account type
created per connection attempt by the injected factory. What the account
can do (connect strategies, channel storage, identity fields, shutdown
methods) is detected at compile time; see account_traits.hpp.

-------------------------------------------------------------------------------
 connect() pipeline
-------------------------------------------------------------------------------
  1) Fresh context (previous one torn down), account from the factory
  2) Identity + headers
  3) Connect strategies (sequencer), then settle delay
  4) Channel resolution (channel factories as last resort)
  5) Stub registry attach -> StubsAttached
  6) Mode detection; FULL handshake cascade or LITE ping
  7) Login fallback when no account stub -> Authenticating
  8) Post-login channel factories
  9) Readiness loop -> Ready

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- Exactly one session per engine; attempts run serially, never concurrently
- Every intermediate step absorbs its own failures (Outcome)
- connect() raises ConnectionError only when no channel can be found or when
  readiness is exhausted in FULL mode; the context is torn down first
- disconnect() never raises and is idempotent
- ensure_connected() reconnects once when the keep-alive probes fail

-------------------------------------------------------------------------------
 Threading model
-------------------------------------------------------------------------------
- No internal locking: callers serialize connect / ensure_connected /
  disconnect upstream
- All RPCs are issued sequentially from the calling thread

===============================================================================
*/

template<rpc::ChannelConcept Channel, class Account>
class Engine {
public:
    using ContextT = Context<Channel, Account>;
    using AccountFactory = std::function<std::unique_ptr<Account>(const config::Config&)>;

    Engine(config::Config config, AccountFactory factory, telemetry::Session& telemetry,
           catalog::Catalog catalog = catalog::Catalog{})
        : config_(std::move(config))
        , factory_(std::move(factory))
        , telemetry_(telemetry)
        , catalog_(std::move(catalog))
    {}

    ~Engine() {
        disconnect();
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // -----------------------------------------------------------------------------
    // connect
    // -----------------------------------------------------------------------------
    //
    // Establishes a new session. An existing session is torn down first.
    // Returns the readiness confidence; raises ConnectionError on failure
    // (the context is then fully torn down and connect() may be retried).
    //
    Readiness connect() {
        telemetry_.connect_calls_total.inc();

        // 1) Fresh context
        if (ctx_) {
            TL_INFO("[ENGINE] Rebuilding existing session");
            teardown::run(ctx_, config_, telemetry_);
        }
        ctx_ = std::make_unique<ContextT>();
        if (!create_account_()) {
            fail_("account creation failed");
        }
        ctx_->advance(State::Connecting);

        // 2) Identity + headers
        identity::ensure(*ctx_);
        identity::build_headers(*ctx_, config_);

        // 3) Connect strategies
        (void)sequencer::run(*ctx_, config_, catalog_, telemetry_);
        if (config_.settle_delay.count() > 0) {
            std::this_thread::sleep_for(config_.settle_delay);
        }

        // 4) Channel
        if (!acquire_channel_()) {
            fail_("no transport channel");
        }

        // 5) Stubs
        telemetry_.stubs_attached_total.inc(static_cast<std::uint32_t>(ctx_->stubs.attach_all(catalog_, ctx_->channel)));
        ctx_->advance(State::StubsAttached);

        // 6) Mode + handshake
        if (handshake::detect_mode(*ctx_, catalog_) == Mode::Full) {
            (void)handshake::run_full(*ctx_, config_, catalog_, telemetry_);
            // Connected-state flags may depend on the handshake having happened
            (void)sequencer::run_generic(*ctx_);
            // Identity is frozen past Connecting
            (void)identity::restore(*ctx_);
        }
        else {
            (void)handshake::run_lite(*ctx_, config_, telemetry_);
        }

        // 7) Login fallback
        if (!ctx_->stubs.contains(catalog::ACCOUNT)) {
            ctx_->advance(State::Authenticating);
        }
        (void)login::run(*ctx_, config_, catalog_, telemetry_);

        // 8) Post-login factories
        run_channel_factories_();

        // 9) Readiness
        const std::optional<Readiness> ready = readiness::wait_ready(*ctx_, config_, telemetry_);
        if (!ready) {
            fail_("readiness exhausted");
        }
        if (ctx_->mode == Mode::Full && !ctx_->stubs.contains(catalog::ACCOUNT)) {
            fail_("no account capability after login");
        }
        ctx_->advance(State::Ready);
        telemetry_.connect_success_total.inc();
        TL_INFO("[ENGINE] Session ready (" << to_string(ctx_->mode) << ", " << to_string(*ready)
                << ", " << ctx_->stubs.size() << " capabilities, channel via " << ctx_->channel_origin << ")");
        return *ready;
    }

    // Best-effort teardown; safe at any point, any number of times
    void disconnect() noexcept {
        teardown::run(ctx_, config_, telemetry_);
    }

    // -----------------------------------------------------------------------------
    // ensure_connected
    // -----------------------------------------------------------------------------
    //
    // Cheap keep-alive probe on a Ready session; on failure (or when there is
    // no Ready session) the full connect() sequence runs once.
    // A session on which no keep-alive probe can be issued is kept as is.
    //
    Readiness ensure_connected() {
        if (!ctx_ || ctx_->state != State::Ready) {
            TL_INFO("[ENGINE] No ready session, connecting");
            telemetry_.ensure_reconnects_total.inc();
            return connect();
        }
        if (ctx_->channel && ctx_->channel->is_open()) {
            const Outcome o = readiness::probe_once(*ctx_, config_, readiness::ProbeSet::KeepAlive, telemetry_);
            if (o != Outcome::SoftFailure) {
                return Readiness::Confirmed;
            }
        }
        TL_WARN("[ENGINE] Keep-alive failed, reconnecting");
        telemetry_.ensure_reconnects_total.inc();
        teardown::run(ctx_, config_, telemetry_);
        return connect();
    }

    // -----------------------------------------------------------------------------
    // Accessors
    // -----------------------------------------------------------------------------

    [[nodiscard]]
    inline State state() const noexcept {
        return ctx_ ? ctx_->state : State::Disconnected;
    }

    // Mode of the current session (Full when none)
    [[nodiscard]]
    inline Mode mode() const noexcept {
        return ctx_ ? ctx_->mode : Mode::Full;
    }

    [[nodiscard]]
    inline const ContextT* context() const noexcept {
        return ctx_.get();
    }

    [[nodiscard]]
    inline const config::Config& config() const noexcept {
        return config_;
    }

    [[nodiscard]]
    inline const catalog::Catalog& catalog() const noexcept {
        return catalog_;
    }

    [[nodiscard]]
    inline telemetry::Session& telemetry() noexcept {
        return telemetry_;
    }

#ifdef TL_UNIT_TEST
public:
    // Opens a context and stops at Connecting (identity + headers built)
    inline ContextT& test_begin() {
        ctx_ = std::make_unique<ContextT>();
        if (!create_account_()) {
            throw ConnectionError{};
        }
        ctx_->advance(State::Connecting);
        identity::ensure(*ctx_);
        identity::build_headers(*ctx_, config_);
        return *ctx_;
    }

    inline ContextT* test_context() noexcept {
        return ctx_.get();
    }
#endif // TL_UNIT_TEST

private:
    bool create_account_() {
        try {
            ctx_->account = factory_(config_);
        }
        catch (const std::exception& e) {
            TL_ERROR("[ENGINE] Account factory raised: " << e.what());
            return false;
        }
        return ctx_->account != nullptr;
    }

    // Each exposed ensure_clients / connect_clients / connect_all_clients
    void run_channel_factories_() {
        Account& a = *ctx_->account;
        if constexpr (account::exposes_ensure_clients<Account>)      (void)run_step("[ENGINE]", "ensure_clients()",      [&] { return a.ensure_clients(); });
        if constexpr (account::exposes_connect_clients<Account>)     (void)run_step("[ENGINE]", "connect_clients()",     [&] { return a.connect_clients(); });
        if constexpr (account::exposes_connect_all_clients<Account>) (void)run_step("[ENGINE]", "connect_all_clients()", [&] { return a.connect_all_clients(); });
    }

    bool acquire_channel_() {
        auto resolved = resolve_channel<Channel>(*ctx_->account, ctx_->stubs);
        if (!resolved) {
            TL_DEBUG("[RESOLVER] No channel after connect strategies, running channel factories");
            run_channel_factories_();
            resolved = resolve_channel<Channel>(*ctx_->account, ctx_->stubs);
        }
        if (!resolved) {
            TL_ERROR("[RESOLVER] No transport channel found");
            return false;
        }
        ctx_->channel = std::move(resolved->channel);
        ctx_->channel_origin = std::string(resolved->origin);
        telemetry_.channel_resolutions_total.inc();
        TL_DEBUG("[RESOLVER] Channel resolved via " << ctx_->channel_origin);
        return true;
    }

    [[noreturn]]
    void fail_(std::string_view reason) {
        TL_ERROR("[ENGINE] Connect failed: " << reason);
        if (ctx_ && ctx_->channel) {
            ctx_->advance(State::Failed);
        }
        telemetry_.connect_failure_total.inc();
        teardown::run(ctx_, config_, telemetry_);
        throw ConnectionError{};
    }

private:
    config::Config config_;
    AccountFactory factory_;
    telemetry::Session& telemetry_;         // Telemetry reference (not owned)
    catalog::Catalog catalog_;
    std::unique_ptr<ContextT> ctx_;         // Current session (null when disconnected)
};

} // namespace termlink::core::session
