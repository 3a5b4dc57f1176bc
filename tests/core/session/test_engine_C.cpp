#include <iostream>

#include "common/harness/engine.hpp"

/*
================================================================================
Session Engine - Group C: LITE deployments
================================================================================

Covered:
  • Mode detection without session/terminal services
  • Single best-effort helper ping, no handshake cascade
  • Soft acceptance after half of the readiness loop
  • Probe confirmation on a minimal capability set
  • Unconfirmed acceptance without any evidence
================================================================================
*/

void test_lite_mode() {
    std::cout << "[TEST] LITE mode detected, single ping..." << std::endl;

    harness::EngineHarness h(harness::lite_manifest());
    h.channel->ok(harness::SERVER_TIME);

    TEST_CHECK(h.engine->connect() == Readiness::Confirmed);
    TEST_CHECK(h.engine->mode() == Mode::Lite);
    TEST_CHECK(h.engine->state() == State::Ready);
    TEST_CHECK(h.channel->count(harness::HELPER_PING) == 1);
    TEST_CHECK(h.channel->count(harness::OPEN_SESSION) == 0);
    TEST_CHECK(h.channel->count(harness::TERMINAL_LOGIN) == 0);

    // No post-handshake generic strategy
    TEST_CHECK(Journal::count("reconnect") == 1);

    const auto* ctx = h.context();
    TEST_CHECK(ctx->stubs.size() == 7);
    TEST_CHECK(!ctx->stubs.contains(catalog::SESSION));
    TEST_CHECK(!ctx->stubs.contains(catalog::TERMINAL));

    std::cout << "[TEST] OK\n";
}

void test_soft_acceptance() {
    std::cout << "[TEST] LITE soft acceptance..." << std::endl;

    // 4 tries: soft acceptance once iteration 2 completes
    harness::EngineHarness h(harness::lite_manifest());

    TEST_CHECK(h.engine->connect() == Readiness::SoftAccepted);
    TEST_CHECK(h.engine->state() == State::Ready);
    TEST_CHECK(h.telemetry.soft_acceptances_total.load() == 1);
    TEST_CHECK(h.telemetry.probes_issued_total.load() == 12);
    TEST_CHECK(h.telemetry.probes_succeeded_total.load() == 0);
    TEST_CHECK(h.channel->count(harness::SERVER_TIME) == 3);

    std::cout << "[TEST] OK\n";
}

void test_single_try_soft_acceptance() {
    std::cout << "[TEST] LITE with one readiness try..." << std::endl;

    config::Config cfg = harness::make_config();
    cfg.readiness_tries = 1;
    harness::EngineHarness h(harness::lite_manifest(), cfg);

    // Threshold is at least iteration 1: a single try ends unconfirmed
    TEST_CHECK(h.engine->connect() == Readiness::Unconfirmed);
    TEST_CHECK(h.telemetry.soft_acceptances_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

void test_minimal_capabilities_confirmed() {
    std::cout << "[TEST] LITE account + helper confirmed by opened tickets..." << std::endl;

    harness::EngineHarness h(harness::manifest({"account", "account_helper"}));
    h.channel->ok(harness::OPENED_TICKETS);

    TEST_CHECK(h.engine->connect() == Readiness::Confirmed);
    TEST_CHECK(h.engine->mode() == Mode::Lite);
    TEST_CHECK(h.context()->stubs.size() == 2);
    TEST_CHECK(h.channel->count(harness::OPENED_TICKETS) == 1);
    TEST_CHECK(h.channel->count(harness::SERVER_TIME) == 0);
    TEST_CHECK(h.telemetry.probes_issued_total.load() == 1);

    // No connection service: manual requests are not issued
    TEST_CHECK(h.channel->count(harness::CONNECT_EX) == 0);
    TEST_CHECK(h.channel->count(harness::CONNECT) == 0);

    std::cout << "[TEST] OK\n";
}

void test_no_evidence_unconfirmed() {
    std::cout << "[TEST] LITE without evidence is unconfirmed..." << std::endl;

    harness::EngineHarness h(harness::manifest({"connection", "charts"}));

    TEST_CHECK(h.engine->connect() == Readiness::Unconfirmed);
    TEST_CHECK(h.engine->state() == State::Ready);
    TEST_CHECK(h.engine->mode() == Mode::Lite);
    TEST_CHECK(h.telemetry.probes_issued_total.load() == 0);
    TEST_CHECK(h.telemetry.soft_acceptances_total.load() == 0);

    // No account capability: the login fallback ran and found nothing
    TEST_CHECK(h.telemetry.login_discoveries_total.load() == 1);
    TEST_CHECK(h.telemetry.login_success_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_lite_mode();
    test_soft_acceptance();
    test_single_try_soft_acceptance();
    test_minimal_capabilities_confirmed();
    test_no_evidence_unconfirmed();

    std::cout << "\n[GROUP C: LITE DEPLOYMENT TESTS PASSED]\n";
    return 0;
}
