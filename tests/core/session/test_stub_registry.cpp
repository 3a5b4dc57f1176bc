#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "mt5_term_api/account_helper.pb.h"

#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/session/stub.hpp"
#include "termlink/core/session/stub_registry.hpp"
#include "common/mock_channel.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace termlink::core;
using namespace termlink::core::session;
using termlink::test::MockChannel;

/*
================================================================================
Stub Registry and Stubs - Unit Tests
================================================================================

Covered:
  • attach_all() attaches deployed capabilities only and is idempotent
  • bind() never replaces an attached stub
  • Stub method lookup by alias and call outcome mapping
================================================================================
*/

using Registry = StubRegistry<MockChannel>;

void test_attach_all_full() {
    std::cout << "[TEST] attach_all on a full deployment..." << std::endl;

    catalog::Catalog catalog;
    auto ch = std::make_shared<MockChannel>();
    Registry stubs;

    TEST_CHECK(stubs.attach_all(catalog, ch) == catalog::REGISTRY_CAPABILITIES.size());
    TEST_CHECK(stubs.size() == catalog::REGISTRY_CAPABILITIES.size());
    TEST_CHECK(stubs.find(catalog::ACCOUNT)->service()->full_name() == "mt5_term_api.Account");
    TEST_CHECK(stubs.find(catalog::ACCOUNT)->channel() == ch);
    TEST_CHECK(!stubs.contains(catalog::SESSION));
    TEST_CHECK(!stubs.contains(catalog::CONNECTION));

    std::cout << "[TEST] OK\n";
}

void test_attach_all_idempotent() {
    std::cout << "[TEST] attach_all twice keeps the attached stubs..." << std::endl;

    catalog::Catalog catalog;
    auto first = std::make_shared<MockChannel>();
    auto second = std::make_shared<MockChannel>();
    Registry stubs;

    (void)stubs.attach_all(catalog, first);
    const auto* account = stubs.find(catalog::ACCOUNT);

    TEST_CHECK(stubs.attach_all(catalog, second) == 0);
    TEST_CHECK(stubs.size() == catalog::REGISTRY_CAPABILITIES.size());
    TEST_CHECK(stubs.find(catalog::ACCOUNT) == account);
    TEST_CHECK(stubs.find(catalog::ACCOUNT)->channel() == first);

    std::cout << "[TEST] OK\n";
}

void test_attach_skips_absent_modules() {
    std::cout << "[TEST] Absent capabilities skipped silently..." << std::endl;

    catalog::Catalog catalog(std::vector<std::string>{"mt5_term_api/account.proto", "mt5_term_api/account_helper.proto"});
    auto ch = std::make_shared<MockChannel>();
    Registry stubs;

    TEST_CHECK(stubs.attach_all(catalog, ch) == 2);
    TEST_CHECK(stubs.contains(catalog::ACCOUNT));
    TEST_CHECK(stubs.contains(catalog::ACCOUNT_HELPER));
    TEST_CHECK(!stubs.contains(catalog::MARKET_INFO));
    TEST_CHECK(stubs.any_of(catalog::LITE_EVIDENCE_CAPABILITIES));
    TEST_CHECK(!stubs.attach(catalog, catalog::SESSION, ch));

    Registry none;
    TEST_CHECK(!none.any_of(catalog::LITE_EVIDENCE_CAPABILITIES));

    std::cout << "[TEST] OK\n";
}

void test_bind() {
    std::cout << "[TEST] bind() re-keys a discovered stub, never replaces..." << std::endl;

    catalog::Catalog catalog;
    auto ch = std::make_shared<MockChannel>();
    Registry stubs;

    const auto* auth = catalog.find_service("mt5_term_api.Auth");
    TEST_CHECK(auth != nullptr);
    TEST_CHECK(stubs.bind(catalog::ACCOUNT, Stub<MockChannel>(auth->full_name(), auth, ch)));
    TEST_CHECK(stubs.find(catalog::ACCOUNT)->key() == "account");
    TEST_CHECK(stubs.find(catalog::ACCOUNT)->service() == auth);

    // The registry cannot replace it either
    TEST_CHECK(!stubs.attach(catalog, catalog::ACCOUNT, ch));
    TEST_CHECK(!stubs.bind(catalog::ACCOUNT, Stub<MockChannel>("other", auth, ch)));
    TEST_CHECK(stubs.find(catalog::ACCOUNT)->service() == auth);

    std::cout << "[TEST] OK\n";
}

void test_stub_lookup() {
    std::cout << "[TEST] Method lookup by alias..." << std::endl;

    catalog::Catalog catalog;
    auto ch = std::make_shared<MockChannel>();
    const Stub<MockChannel> helper(catalog::ACCOUNT_HELPER, catalog.resolve(catalog::ACCOUNT_HELPER), ch);

    const auto* ping = helper.find_method(catalog::method::PING);
    TEST_CHECK(ping != nullptr && ping->name() == "Ping");
    TEST_CHECK(Stub<MockChannel>::method_path(ping) == "/mt5_term_api.AccountHelper/Ping");
    TEST_CHECK(helper.exposes(catalog::method::OPENED_TICKETS));
    TEST_CHECK(!helper.exposes(catalog::method::LOGIN));

    const Stub<MockChannel> account(catalog::ACCOUNT, catalog.resolve(catalog::ACCOUNT), ch);
    const auto logins = account.find_methods(catalog::method::LOGIN);
    TEST_CHECK(logins.size() == 1);
    TEST_CHECK(logins[0]->name() == "Login");

    std::cout << "[TEST] OK\n";
}

void test_stub_outcomes() {
    std::cout << "[TEST] Call outcomes..." << std::endl;

    catalog::Catalog catalog;
    auto ch = std::make_shared<MockChannel>();
    const Stub<MockChannel> helper(catalog::ACCOUNT_HELPER, catalog.resolve(catalog::ACCOUNT_HELPER), ch);
    const rpc::Metadata md{{"id", "guid-1"}};
    const std::string ping_path = MockChannel::path("AccountHelper", "Ping");
    const std::string summary_path = MockChannel::path("AccountHelper", "AccountSummary");

    // Unscripted: the deployment does not serve it
    TEST_CHECK(helper.invoke(catalog::method::PING, no_fields, md, 5s) == Outcome::NotApplicable);

    ch->ok(ping_path);
    Stub<MockChannel>::MessagePtr reply;
    TEST_CHECK(helper.invoke(catalog::method::PING, no_fields, md, 5s, &reply) == Outcome::Success);
    TEST_CHECK(reply != nullptr);
    TEST_CHECK(ch->last(ping_path)->timeout == 5s);
    TEST_CHECK(termlink::core::rpc::contains(ch->last(ping_path)->metadata, "id", "guid-1"));

    // Error payload in the reply
    ch->script(summary_path, [](const google::protobuf::Message&, google::protobuf::Message& out) {
        dynamic_cast<mt5_term_api::AccountSummaryReply&>(out).mutable_error()->set_error_code("NOT_AUTHORIZED");
        return rpc::Error::None;
    });
    TEST_CHECK(helper.invoke(catalog::method::ACCOUNT_SUMMARY, no_fields, md, 5s) == Outcome::SoftFailure);

    ch->script(ping_path, rpc::Error::Timeout);
    TEST_CHECK(helper.invoke(catalog::method::PING, no_fields, md, 5s) == Outcome::SoftFailure);

    // No alias exposed: nothing issued
    const int issued = static_cast<int>(ch->calls().size());
    TEST_CHECK(helper.invoke(catalog::method::LOGOUT, no_fields, md, 5s) == Outcome::NotApplicable);
    TEST_CHECK(static_cast<int>(ch->calls().size()) == issued);

    // Stub without a channel
    const Stub<MockChannel> detached(catalog::ACCOUNT_HELPER, catalog.resolve(catalog::ACCOUNT_HELPER), nullptr);
    TEST_CHECK(detached.invoke(catalog::method::PING, no_fields, md, 5s) == Outcome::SoftFailure);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_attach_all_full();
    test_attach_all_idempotent();
    test_attach_skips_absent_modules();
    test_bind();
    test_stub_lookup();
    test_stub_outcomes();

    std::cout << "\n[STUB REGISTRY TESTS PASSED]\n";
    return 0;
}
