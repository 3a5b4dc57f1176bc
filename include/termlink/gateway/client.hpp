#pragma once

#include <memory>
#include <ostream>

#include "termlink/config/config.hpp"
#include "termlink/core/session/state.hpp"


namespace termlink::gateway {

/*
===============================================================================
 termlink::gateway::Client
===============================================================================

Ready-to-use session over the MT5 gRPC gateway.

Wires the session engine to gateway::Account and rpc::GrpcChannel, with the
catalog of every API module compiled into this build. Keeps gRPC and
protobuf headers out of user code.

  connect()            raises core::session::ConnectionError on failure
  ensure_connected()   keep-alive check, reconnects once when needed
  disconnect()         best-effort, never raises

Not thread-safe: serialize calls upstream.
===============================================================================
*/

class Client {
public:
    explicit Client(config::Config cfg);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    core::session::Readiness connect();
    core::session::Readiness ensure_connected();
    void disconnect() noexcept;

    [[nodiscard]]
    core::session::State state() const noexcept;

    [[nodiscard]]
    core::session::Mode mode() const noexcept;

    void dump_telemetry(std::ostream& os) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace termlink::gateway
