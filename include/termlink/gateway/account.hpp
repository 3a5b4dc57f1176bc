#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "termlink/config/config.hpp"
#include "termlink/core/rpc/error.hpp"
#include "termlink/core/rpc/metadata.hpp"
#include "termlink/core/rpc/grpc/channel.hpp"


namespace termlink::gateway {

/*
===============================================================================
 termlink::gateway::Account
===============================================================================

MT5 terminal account bound to one gRPC gateway channel.

Owns the channel for the lifetime of one connection attempt and exposes the
shape the session engine looks for:

  terminal_instance_guid          identity field (written by the engine)
  channel()                       transport accessor
  headers()                       {"id": terminal_instance_guid}
  reconnect()                     Connection.Reconnect for the current GUID
  connect_by_server_name(...)     Connection.ConnectEx
  connect_by_host_port(...)       Connection.Connect
  close()                         releases the channel

Connect replies carrying a terminal GUID update terminal_instance_guid.
===============================================================================
*/

class Account {
public:
    // Creates the gRPC channel from cfg.endpoint; throws std::invalid_argument
    // on a malformed endpoint
    explicit Account(const config::Config& cfg);

    // Uses an existing channel (in-process servers, tests)
    Account(const config::Config& cfg, std::shared_ptr<core::rpc::GrpcChannel> channel);

    ~Account();

    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;

    std::string terminal_instance_guid;

    [[nodiscard]]
    inline std::shared_ptr<core::rpc::GrpcChannel> channel() const noexcept {
        return channel_;
    }

    [[nodiscard]]
    core::rpc::Metadata headers() const;

    core::rpc::Error reconnect();

    core::rpc::Error connect_by_server_name(std::string_view server_name, std::string_view base_symbol,
                                            int timeout_seconds);

    core::rpc::Error connect_by_host_port(std::string_view host, int port, std::string_view base_symbol,
                                          int timeout_seconds);

    void close() noexcept;

private:
    std::chrono::milliseconds call_timeout_(int timeout_seconds) const noexcept;

private:
    std::uint64_t login_;
    std::string password_;
    std::chrono::seconds timeout_;
    std::shared_ptr<core::rpc::GrpcChannel> channel_;
};

} // namespace termlink::gateway
