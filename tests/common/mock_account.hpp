#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "termlink/core/rpc/error.hpp"
#include "common/mock_channel.hpp"


namespace termlink::test {

// Scripted result of one account method
enum class Behavior {
    Succeed,
    Fail,      // returns an rpc::Error
    Throw      // raises std::runtime_error
};

struct AccountScript {
    Behavior reconnect      = Behavior::Fail;
    Behavior by_server_name = Behavior::Succeed;
    Behavior by_host_port   = Behavior::Succeed;
    std::string assigned_guid;          // written by a successful connect_by_*
    std::string late_guid;              // written by a successful reconnect after the first
    bool attach_channel     = true;     // channel field set at construction
    bool throw_on_close     = false;
    bool throw_int_on_close = false;    // non-std exception out of close()
};


// -----------------------------------------------------------------------------
// MockAccount
// -----------------------------------------------------------------------------
//
// Account shape of the MT5 client: identity field, channel field, generic
// reconnect, both explicit connect strategies, stream stop and close.
// Every call is journaled; arguments of the last connect are kept.
//
struct MockAccount {
    std::string terminal_instance_guid;
    std::shared_ptr<MockChannel> channel;

    AccountScript script;

    inline static std::string last_server;
    inline static std::string last_symbol;
    inline static std::string last_host;
    inline static int last_port = 0;
    inline static int last_timeout = 0;

    MockAccount(std::shared_ptr<MockChannel> ch, AccountScript s)
        : channel(s.attach_channel ? std::move(ch) : nullptr)
        , script(std::move(s))
    {}

    static inline void reset() {
        last_server.clear();
        last_symbol.clear();
        last_host.clear();
        last_port = 0;
        last_timeout = 0;
    }

    inline core::rpc::Error reconnect() {
        Journal::record("reconnect");
        const core::rpc::Error err = apply_(script.reconnect);
        if (err == core::rpc::Error::None && ++reconnects_ > 1 && !script.late_guid.empty()) {
            terminal_instance_guid = script.late_guid;
        }
        return err;
    }

    inline core::rpc::Error connect_by_server_name(std::string_view server, std::string_view symbol, int timeout_s) {
        Journal::record("connect_by_server_name");
        last_server = server;
        last_symbol = symbol;
        last_timeout = timeout_s;
        return apply_(script.by_server_name);
    }

    inline core::rpc::Error connect_by_host_port(std::string_view host, int port, std::string_view symbol, int timeout_s) {
        Journal::record("connect_by_host_port");
        last_host = host;
        last_port = port;
        last_symbol = symbol;
        last_timeout = timeout_s;
        return apply_(script.by_host_port);
    }

    inline void unsubscribe_all() {
        Journal::record("unsubscribe_all");
    }

    inline void close() {
        Journal::record("close");
        if (script.throw_on_close) {
            throw std::runtime_error("close failed");
        }
        if (script.throw_int_on_close) {
            throw 42;
        }
    }

private:
    int reconnects_ = 0;

    inline core::rpc::Error apply_(Behavior b) {
        switch (b) {
        case Behavior::Succeed:
            if (!script.assigned_guid.empty()) {
                terminal_instance_guid = script.assigned_guid;
            }
            return core::rpc::Error::None;
        case Behavior::Fail:
            return core::rpc::Error::Unavailable;
        case Behavior::Throw:
            throw std::runtime_error("scripted failure");
        }
        return core::rpc::Error::TransportFailure;
    }
};


// -----------------------------------------------------------------------------
// Account shapes for the channel resolver
// -----------------------------------------------------------------------------

struct BareAccount {};

struct GrpcFieldAccount {
    std::shared_ptr<MockChannel> grpc_channel;
};

struct AccessorAccount {
    std::shared_ptr<MockChannel> stored;
    inline std::shared_ptr<MockChannel> get_channel() const { return stored; }
};

struct ClientsAccount {
    struct Clients {
        std::shared_ptr<MockChannel> channel;
    } clients;
};

// Field and clients container both populated
struct FieldAndClientsAccount {
    std::shared_ptr<MockChannel> channel;
    struct Clients {
        std::shared_ptr<MockChannel> grpc_channel;
    } clients;
};

struct NestedClientsAccount {
    struct ConnectionClient {
        std::shared_ptr<MockChannel> channel;
    } connection_client;

    struct HelperClient {
        std::shared_ptr<MockChannel> stored;
        inline std::shared_ptr<MockChannel> channel() const { return stored; }
    } helper_client;
};

// Identity kept under the alternative field names
struct CamelIdentityAccount {
    std::string terminalInstanceGuid;
    std::string id;
};

// Account supplying its own headers, without the identity key
struct HeaderAccount {
    std::string terminal_instance_guid;
    inline core::rpc::Metadata headers() const {
        return {{"x-client", "termlink-test"}};
    }
};

// Channel only created by a channel factory
struct LazyAccount {
    std::shared_ptr<MockChannel> channel;
    std::shared_ptr<MockChannel> pending;

    explicit LazyAccount(std::shared_ptr<MockChannel> ch)
        : pending(std::move(ch))
    {}

    inline void ensure_clients() {
        Journal::record("ensure_clients");
        channel = pending;
    }
};

} // namespace termlink::test
