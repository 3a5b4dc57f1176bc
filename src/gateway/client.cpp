#include "termlink/gateway/client.hpp"

#include <utility>

#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/rpc/grpc/channel.hpp"
#include "termlink/core/session/engine.hpp"
#include "termlink/core/session/telemetry.hpp"
#include "termlink/gateway/account.hpp"


namespace termlink::gateway {

struct Client::Impl {
    using EngineT = core::session::Engine<core::rpc::GrpcChannel, Account>;

    core::telemetry::Session telemetry;
    EngineT engine;

    explicit Impl(config::Config cfg)
        : engine(std::move(cfg),
                 [](const config::Config& c) { return std::make_unique<Account>(c); },
                 telemetry,
                 core::catalog::Catalog{})
    {}
};


Client::Client(config::Config cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg)))
{}

Client::~Client() = default;

core::session::Readiness Client::connect() {
    return impl_->engine.connect();
}

core::session::Readiness Client::ensure_connected() {
    return impl_->engine.ensure_connected();
}

void Client::disconnect() noexcept {
    impl_->engine.disconnect();
}

core::session::State Client::state() const noexcept {
    return impl_->engine.state();
}

core::session::Mode Client::mode() const noexcept {
    return impl_->engine.mode();
}

void Client::dump_telemetry(std::ostream& os) const {
    impl_->telemetry.debug_dump(os);
}

} // namespace termlink::gateway
