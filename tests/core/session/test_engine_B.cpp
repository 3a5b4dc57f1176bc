#include <iostream>
#include <string>

#ifndef TERMLINK_LITE_API
#include "mt5_term_api/terminal.pb.h"
#endif

#include "common/harness/engine.hpp"

/*
================================================================================
Session Engine - Group B: FULL handshake cascade
================================================================================

Covered:
  • First successful candidate ends the cascade
  • Candidate requests filled from credentials / identity
  • Cascade order down to the helper ping
  • A failed cascade is not fatal when readiness is confirmed
================================================================================
*/

#ifndef TERMLINK_LITE_API

void test_open_session_ends_cascade() {
    std::cout << "[TEST] OpenSession success ends the cascade..." << std::endl;

    harness::EngineHarness h;
    h.script_ready();
    h.channel->ok(harness::TERMINAL_LOGIN);
    (void)h.engine->connect();

    TEST_CHECK(h.channel->count(harness::OPEN_SESSION) == 1);
    TEST_CHECK(h.channel->count(harness::TERMINAL_LOGIN) == 0);
    TEST_CHECK(h.channel->count(harness::IS_ALIVE) == 0);
    TEST_CHECK(h.channel->count(harness::HELPER_PING) == 0);
    TEST_CHECK(h.channel->last(harness::OPEN_SESSION)->timeout == 10s);

    std::cout << "[TEST] OK\n";
}

void test_terminal_login_fallback() {
    std::cout << "[TEST] OpenSession fails, TerminalLogin succeeds..." << std::endl;

    harness::EngineHarness h;
    h.channel->script(harness::OPEN_SESSION, rpc::Error::Unavailable);
    h.channel->ok(harness::TERMINAL_LOGIN);
    h.channel->ok(harness::SERVER_TIME);

    TEST_CHECK(h.engine->connect() == Readiness::Confirmed);
    TEST_CHECK(h.channel->count(harness::OPEN_SESSION) == 1);
    TEST_CHECK(h.channel->count(harness::TERMINAL_LOGIN) == 1);
    TEST_CHECK(h.channel->count(harness::IS_ALIVE) == 0);
    TEST_CHECK(h.telemetry.handshake_success_total.load() == 1);

    // Credentials go to the aliases the request exposes
    const auto* request = harness::request_of<mt5_term_api::TerminalLoginRequest>(h.channel->last(harness::TERMINAL_LOGIN));
    TEST_CHECK(request != nullptr);
    TEST_CHECK(request->user() == 5036292718ULL);
    TEST_CHECK(request->password() == "secret");
    TEST_CHECK(request->server() == "Demo-A");
    TEST_CHECK(request->id() == h.context()->identity);

    std::cout << "[TEST] OK\n";
}

void test_cascade_down_to_helper_ping() {
    std::cout << "[TEST] Cascade order down to the helper ping..." << std::endl;

    harness::EngineHarness h;
    h.channel->script(harness::OPEN_SESSION, rpc::Error::Unavailable);
    h.channel->script(harness::TERMINAL_LOGIN, rpc::Error::Rejected);
    h.channel->script(harness::IS_ALIVE, rpc::Error::Timeout);
    h.channel->ok(harness::HELPER_PING);
    h.channel->ok(harness::SERVER_TIME);

    TEST_CHECK(h.engine->connect() == Readiness::Confirmed);

    const int open     = Journal::index_of(harness::rpc_event(harness::OPEN_SESSION));
    const int login    = Journal::index_of(harness::rpc_event(harness::TERMINAL_LOGIN));
    const int is_alive = Journal::index_of(harness::rpc_event(harness::IS_ALIVE));
    const int ping     = Journal::index_of(harness::rpc_event(harness::HELPER_PING));
    TEST_CHECK(open >= 0 && open < login && login < is_alive && is_alive < ping);
    TEST_CHECK(h.channel->count(harness::HELPER_PING) == 1);
    TEST_CHECK(h.telemetry.handshake_success_total.load() == 1);

    // Liveness candidates carry the identity only, with the ping timeout
    const auto* alive = h.channel->last(harness::IS_ALIVE);
    const auto* request = harness::request_of<mt5_term_api::IsAliveRequest>(alive);
    TEST_CHECK(request != nullptr);
    TEST_CHECK(request->id() == h.context()->identity);
    TEST_CHECK(alive->timeout == 5s);
    TEST_CHECK(h.channel->last(harness::HELPER_PING)->timeout == 5s);

    std::cout << "[TEST] OK\n";
}

void test_failed_cascade_not_fatal() {
    std::cout << "[TEST] Failed cascade, readiness still confirms..." << std::endl;

    harness::EngineHarness h;
    h.channel->script(harness::OPEN_SESSION, rpc::Error::Unavailable);
    h.channel->script(harness::TERMINAL_LOGIN, rpc::Error::Unavailable);
    h.channel->script(harness::IS_ALIVE, rpc::Error::Unavailable);
    h.channel->script(harness::HELPER_PING, rpc::Error::Unavailable);
    h.channel->ok(harness::SERVER_TIME);

    TEST_CHECK(h.engine->connect() == Readiness::Confirmed);
    TEST_CHECK(h.engine->state() == State::Ready);
    TEST_CHECK(h.telemetry.handshake_success_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

void test_session_timeouts_from_config() {
    std::cout << "[TEST] Handshake timeout from configuration..." << std::endl;

    config::Config cfg = harness::make_config();
    cfg.handshake_timeout = 2500ms;
    cfg.probe_timeout = 750ms;
    harness::EngineHarness h(harness::full_manifest(), cfg);
    h.script_ready();

    (void)h.engine->connect();
    TEST_CHECK(h.channel->last(harness::OPEN_SESSION)->timeout == 2500ms);
    TEST_CHECK(h.channel->last(harness::SERVER_TIME)->timeout == 750ms);

    std::cout << "[TEST] OK\n";
}

#endif // TERMLINK_LITE_API

int main() {
#ifndef TERMLINK_LITE_API
    test_open_session_ends_cascade();
    test_terminal_login_fallback();
    test_cascade_down_to_helper_ping();
    test_failed_cascade_not_fatal();
    test_session_timeouts_from_config();

    std::cout << "\n[GROUP B: HANDSHAKE CASCADE TESTS PASSED]\n";
#else
    std::cout << "\n[GROUP B: SKIPPED, built without session/terminal modules]\n";
#endif
    return 0;
}
