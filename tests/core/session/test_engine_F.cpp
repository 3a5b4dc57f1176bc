#include <iostream>
#include <memory>
#include <string>

#include "common/harness/engine.hpp"

/*
================================================================================
Session Engine - Group F: teardown and keep-alive
================================================================================

Covered:
  • disconnect() idempotent, safe at any state
  • Teardown step order
  • Raising account shutdown absorbed, std and non-std exceptions alike
  • ensure_connected(): healthy session kept, failed keep-alive or closed
    channel reconnects, no session connects
================================================================================
*/

void test_disconnect_twice() {
    std::cout << "[TEST] disconnect() twice..." << std::endl;

    harness::EngineHarness h;
    h.script_ready();
    (void)h.engine->connect();

    h.engine->disconnect();
    TEST_CHECK(h.engine->state() == State::Disconnected);
    TEST_CHECK(h.context() == nullptr);
    TEST_CHECK(h.telemetry.teardowns_total.load() == 1);
    TEST_CHECK(h.channel->close_count() == 1);

    h.engine->disconnect();
    TEST_CHECK(h.telemetry.teardowns_total.load() == 1);
    TEST_CHECK(h.channel->close_count() == 1);

    std::cout << "[TEST] OK\n";
}

void test_disconnect_while_connecting() {
    std::cout << "[TEST] disconnect() of a context still Connecting..." << std::endl;

    harness::EngineHarness h;
    auto& ctx = h.engine->test_begin();
    TEST_CHECK(ctx.state == State::Connecting);
    TEST_CHECK(ctx.channel == nullptr);
    TEST_CHECK(!ctx.identity.empty());

    h.engine->disconnect();
    TEST_CHECK(h.engine->state() == State::Disconnected);
    TEST_CHECK(Journal::count("unsubscribe_all") == 1);
    TEST_CHECK(Journal::count("close") == 1);

    // No account stub: no logout; the account's channel is still closed
    TEST_CHECK(h.channel->count(harness::ACCOUNT_LOGOUT) == 0);
    TEST_CHECK(h.channel->close_count() == 1);

    std::cout << "[TEST] OK\n";
}

void test_teardown_order() {
    std::cout << "[TEST] Teardown order..." << std::endl;

    harness::EngineHarness h;
    h.script_ready();
    (void)h.engine->connect();

    Journal::reset();
    h.engine->disconnect();

    TEST_CHECK(Journal::events.size() == 4);
    TEST_CHECK(Journal::events[0] == "unsubscribe_all");
    TEST_CHECK(Journal::events[1] == harness::rpc_event(harness::ACCOUNT_LOGOUT));
    TEST_CHECK(Journal::events[2] == "close");
    TEST_CHECK(Journal::events[3] == "channel.close");
    TEST_CHECK(h.channel->last(harness::ACCOUNT_LOGOUT)->timeout == 3s);

    std::cout << "[TEST] OK\n";
}

void test_raising_close_absorbed() {
    std::cout << "[TEST] Raising account close() absorbed..." << std::endl;

    harness::EngineHarness h;
    h.script.throw_on_close = true;
    h.script_ready();
    (void)h.engine->connect();

    h.engine->disconnect();
    TEST_CHECK(h.engine->state() == State::Disconnected);
    TEST_CHECK(Journal::count("close") == 1);
    TEST_CHECK(h.channel->close_count() == 1);

    std::cout << "[TEST] OK\n";
}

void test_non_standard_exception_absorbed() {
    std::cout << "[TEST] Account close() raising a non-std exception absorbed..." << std::endl;

    harness::EngineHarness h;
    h.script.throw_int_on_close = true;
    h.script_ready();
    (void)h.engine->connect();

    Journal::reset();
    h.engine->disconnect();
    TEST_CHECK(h.engine->state() == State::Disconnected);
    TEST_CHECK(h.context() == nullptr);
    TEST_CHECK(Journal::count("close") == 1);
    TEST_CHECK(h.channel->close_count() == 1);

    // Steps after close() still ran
    TEST_CHECK(Journal::index_of("close") < Journal::index_of("channel.close"));

    std::cout << "[TEST] OK\n";
}

void test_reconnect_rebuilds_session() {
    std::cout << "[TEST] connect() on a live session rebuilds it..." << std::endl;

    harness::EngineHarness h;
    h.script_ready();
    (void)h.engine->connect();
    const std::string first_identity = h.context()->identity;

    TEST_CHECK(h.engine->connect() == Readiness::Confirmed);
    TEST_CHECK(h.accounts_created == 2);
    TEST_CHECK(h.telemetry.teardowns_total.load() == 1);
    TEST_CHECK(h.context()->identity != first_identity);
    TEST_CHECK(h.channel->is_open());

    std::cout << "[TEST] OK\n";
}

void test_ensure_healthy_session() {
    std::cout << "[TEST] ensure_connected() keeps a healthy session..." << std::endl;

    harness::EngineHarness h;
    h.script_ready();
    (void)h.engine->connect();

    TEST_CHECK(h.engine->ensure_connected() == Readiness::Confirmed);
    TEST_CHECK(h.accounts_created == 1);
    TEST_CHECK(h.telemetry.connect_calls_total.load() == 1);
    TEST_CHECK(h.telemetry.ensure_reconnects_total.load() == 0);
    TEST_CHECK(h.channel->count(harness::SERVER_TIME) == 2);

    std::cout << "[TEST] OK\n";
}

void test_ensure_keepalive_failure() {
    std::cout << "[TEST] ensure_connected() reconnects on keep-alive failure..." << std::endl;

    harness::EngineHarness h;
    h.channel->ok(harness::OPEN_SESSION);

    // Second ServerTime (the keep-alive probe) fails, every other succeeds
    auto calls = std::make_shared<int>(0);
    h.channel->script(harness::SERVER_TIME, [calls](const google::protobuf::Message&, google::protobuf::Message&) {
        return ++*calls == 2 ? rpc::Error::Unavailable : rpc::Error::None;
    });
    (void)h.engine->connect();

    TEST_CHECK(h.engine->ensure_connected() == Readiness::Confirmed);
    TEST_CHECK(h.engine->state() == State::Ready);
    TEST_CHECK(*calls == 3);
    TEST_CHECK(h.accounts_created == 2);
    TEST_CHECK(h.telemetry.ensure_reconnects_total.load() == 1);
    TEST_CHECK(h.telemetry.connect_calls_total.load() == 2);
    TEST_CHECK(h.telemetry.teardowns_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

void test_ensure_closed_channel() {
    std::cout << "[TEST] ensure_connected() reconnects a closed channel..." << std::endl;

    harness::EngineHarness h;
    h.script_ready();
    (void)h.engine->connect();

    h.channel->close();
    const int server_time_calls = h.channel->count(harness::SERVER_TIME);

    TEST_CHECK(h.engine->ensure_connected() == Readiness::Confirmed);
    TEST_CHECK(h.channel->is_open());
    TEST_CHECK(h.accounts_created == 2);
    TEST_CHECK(h.telemetry.ensure_reconnects_total.load() == 1);

    // No probe issued on the closed channel, one by the new session
    TEST_CHECK(h.channel->count(harness::SERVER_TIME) == server_time_calls + 1);

    std::cout << "[TEST] OK\n";
}

void test_ensure_without_session() {
    std::cout << "[TEST] ensure_connected() without a session connects..." << std::endl;

    harness::EngineHarness h;
    h.script_ready();

    TEST_CHECK(h.engine->ensure_connected() == Readiness::Confirmed);
    TEST_CHECK(h.engine->state() == State::Ready);
    TEST_CHECK(h.accounts_created == 1);
    TEST_CHECK(h.telemetry.ensure_reconnects_total.load() == 1);
    TEST_CHECK(h.telemetry.connect_calls_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

void test_ensure_without_probes() {
    std::cout << "[TEST] ensure_connected() keeps a session with no keep-alive probe..." << std::endl;

    // Account attached but nothing to probe: soft accepted
    harness::EngineHarness h(harness::manifest({"account", "charts"}));
    TEST_CHECK(h.engine->connect() == Readiness::SoftAccepted);

    TEST_CHECK(h.engine->ensure_connected() == Readiness::Confirmed);
    TEST_CHECK(h.accounts_created == 1);
    TEST_CHECK(h.telemetry.ensure_reconnects_total.load() == 0);
    TEST_CHECK(h.telemetry.probes_issued_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_disconnect_twice();
    test_disconnect_while_connecting();
    test_teardown_order();
    test_raising_close_absorbed();
    test_non_standard_exception_absorbed();
    test_reconnect_rebuilds_session();
    test_ensure_healthy_session();
    test_ensure_keepalive_failure();
    test_ensure_closed_channel();
    test_ensure_without_session();
    test_ensure_without_probes();

    std::cout << "\n[GROUP F: TEARDOWN AND KEEP-ALIVE TESTS PASSED]\n";
    return 0;
}
