/*
===============================================================================
 Session Engine Test Harness
===============================================================================
*/
#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/session/engine.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "common/mock_account.hpp"
#include "common/mock_channel.hpp"
#include "common/test_check.hpp"


// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace termlink;
using namespace termlink::core;
using namespace termlink::core::session;
using namespace std::chrono_literals;

using termlink::test::Behavior;
using termlink::test::Journal;
using termlink::test::MockAccount;
using termlink::test::MockChannel;

using EngineUnderTest = Engine<MockChannel, MockAccount>;


namespace termlink::test::harness {

// Fast timings: no sleeps, short readiness loop
[[nodiscard]]
inline config::Config make_config() {
    config::Config cfg;
    cfg.login = 5036292718ULL;
    cfg.password = "secret";
    cfg.server_name = "Demo-A";
    cfg.endpoint = "grpc://localhost:50051";
    cfg.secure = false;
    cfg.readiness_tries = 4;
    cfg.readiness_delay = 0ms;
    cfg.settle_delay = 0ms;
    return cfg;
}

// Module manifests ------------------------------------------------------------

[[nodiscard]]
inline std::string module(std::string_view name) {
    return "mt5_term_api/" + std::string(name) + ".proto";
}

[[nodiscard]]
inline std::vector<std::string> manifest(std::initializer_list<std::string_view> names) {
    std::vector<std::string> out;
    for (auto n : names) {
        out.push_back(module(n));
    }
    return out;
}

// Every module: FULL deployment
[[nodiscard]]
inline std::vector<std::string> full_manifest() {
    return {core::catalog::MODULES.begin(), core::catalog::MODULES.end()};
}

// No session / terminal modules: LITE deployment
[[nodiscard]]
inline std::vector<std::string> lite_manifest() {
    return manifest({"connection", "account", "account_helper", "market_info", "symbols", "charts",
                     "market_book", "trade_functions", "auth"});
}

// Full method paths -------------------------------------------------------------

inline const std::string OPEN_SESSION   = MockChannel::path("Session", "OpenSession");
inline const std::string TERMINAL_LOGIN = MockChannel::path("Terminal", "TerminalLogin");
inline const std::string IS_ALIVE       = MockChannel::path("Terminal", "IsAlive");
inline const std::string HELPER_PING    = MockChannel::path("AccountHelper", "Ping");
inline const std::string OPENED_TICKETS = MockChannel::path("AccountHelper", "OpenedOrdersTickets");
inline const std::string ACCOUNT_SUMMARY = MockChannel::path("AccountHelper", "AccountSummary");
inline const std::string SERVER_TIME    = MockChannel::path("MarketInfo", "ServerTime");
inline const std::string SYMBOLS_TOTAL  = MockChannel::path("MarketInfo", "SymbolsTotal");
inline const std::string SYMBOL_TICK    = MockChannel::path("MarketInfo", "SymbolInfoTick");
inline const std::string ACCOUNT_LOGIN  = MockChannel::path("Account", "Login");
inline const std::string ACCOUNT_LOGOUT = MockChannel::path("Account", "Logout");
inline const std::string USER_LOGIN     = MockChannel::path("Auth", "UserLogin");
inline const std::string CONNECT_EX     = MockChannel::path("Connection", "ConnectEx");
inline const std::string CONNECT        = MockChannel::path("Connection", "Connect");

// Journal entry of an RPC
[[nodiscard]]
inline std::string rpc_event(const std::string& path) {
    return "rpc:" + path;
}

// Request of a recorded call as its generated type (nullptr when absent)
template<class T>
[[nodiscard]]
inline const T* request_of(const MockChannel::Call* call) {
    return call ? dynamic_cast<const T*>(call->request.get()) : nullptr;
}


// -----------------------------------------------------------------------------
// Engine harness
// -----------------------------------------------------------------------------
//
// One engine over a shared MockChannel. Every account created by the factory
// reopens the channel (a fresh transport per connection attempt) and follows
// `script`, which tests may change between connects.
//
struct EngineHarness {
    std::shared_ptr<MockChannel> channel = std::make_shared<MockChannel>();
    AccountScript script;
    core::telemetry::Session telemetry;
    int accounts_created = 0;
    bool factory_throws = false;
    std::unique_ptr<EngineUnderTest> engine;

    explicit EngineHarness(std::vector<std::string> modules = full_manifest(), config::Config cfg = make_config()) {
        Journal::reset();
        MockAccount::reset();
        engine = std::make_unique<EngineUnderTest>(
            std::move(cfg),
            [this](const config::Config&) -> std::unique_ptr<MockAccount> {
                if (factory_throws) {
                    throw std::runtime_error("factory failure");
                }
                ++accounts_created;
                channel->reopen();
                return std::make_unique<MockAccount>(channel, script);
            },
            telemetry,
            core::catalog::Catalog{std::move(modules)});
    }

    EngineHarness(const EngineHarness&) = delete;
    EngineHarness& operator=(const EngineHarness&) = delete;

    // Happy FULL path: session opens, server time answers
    inline void script_ready() {
        channel->ok(OPEN_SESSION);
        channel->ok(SERVER_TIME);
    }

    [[nodiscard]]
    inline const auto* context() const noexcept {
        return engine->context();
    }

    [[nodiscard]]
    inline MockAccount* account() const noexcept {
        return engine->context() ? engine->context()->account.get() : nullptr;
    }

    // Runs connect() and reports whether ConnectionError was raised
    [[nodiscard]]
    inline bool connect_raises() {
        try {
            (void)engine->connect();
        }
        catch (const ConnectionError& e) {
            TEST_CHECK(std::string(e.what()) == CONNECTION_ERROR_MESSAGE);
            return true;
        }
        return false;
    }
};

} // namespace termlink::test::harness

namespace harness = termlink::test::harness;
