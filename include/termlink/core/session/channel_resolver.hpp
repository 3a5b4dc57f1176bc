#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "termlink/core/rpc/concepts.hpp"
#include "termlink/core/session/account_traits.hpp"
#include "termlink/core/session/stub_registry.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session {

template<rpc::ChannelConcept Channel>
struct ResolvedChannel {
    std::shared_ptr<Channel> channel;
    std::string_view origin;    // storage location label, for logs and tests
};

/*
===============================================================================
 resolve_channel
===============================================================================

Finds a live transport channel. Locations are probed in a fixed order:

  (a) account fields        channel, grpc_channel, rpc_channel
  (b) account accessors     get_channel(), channel(), grpc_channel(), get_grpc_channel()
  (c) clients container     clients.channel, clients.grpc_channel
  (d) through stubs         channel of every attached stub, then the channel of
                            the account's connection/account/helper client objects

The first non-null, open channel wins. Side-effect-free: safe to call any
number of times per connection attempt.
===============================================================================
*/

namespace detail {

template<rpc::ChannelConcept Channel, class Client>
std::shared_ptr<Channel> client_channel(Client& client) {
    if constexpr (account::client_with_channel_field<Client, Channel>) {
        return client.channel;
    }
    else if constexpr (account::client_with_channel_accessor<Client, Channel>) {
        return client.channel();
    }
    else {
        return nullptr;
    }
}

} // namespace detail


template<rpc::ChannelConcept Channel, class A>
[[nodiscard]]
std::optional<ResolvedChannel<Channel>> resolve_channel(A& a, const StubRegistry<Channel>& stubs) {
    std::optional<ResolvedChannel<Channel>> found;

    auto consider = [&](std::shared_ptr<Channel> ch, std::string_view origin) {
        if (found || !ch || !ch->is_open()) {
            return;
        }
        found.emplace(ResolvedChannel<Channel>{std::move(ch), origin});
    };

    // (a) direct fields
    if constexpr (account::has_channel_field_channel<A, Channel>)      consider(a.channel, "field:channel");
    if constexpr (account::has_channel_field_grpc_channel<A, Channel>) consider(a.grpc_channel, "field:grpc_channel");
    if constexpr (account::has_channel_field_rpc_channel<A, Channel>)  consider(a.rpc_channel, "field:rpc_channel");

    // (b) accessors
    if constexpr (account::has_channel_accessor_get_channel<A, Channel>)      if (!found) consider(a.get_channel(), "accessor:get_channel");
    if constexpr (account::has_channel_accessor_channel<A, Channel>)          if (!found) consider(a.channel(), "accessor:channel");
    if constexpr (account::has_channel_accessor_grpc_channel<A, Channel>)     if (!found) consider(a.grpc_channel(), "accessor:grpc_channel");
    if constexpr (account::has_channel_accessor_get_grpc_channel<A, Channel>) if (!found) consider(a.get_grpc_channel(), "accessor:get_grpc_channel");

    // (c) clients container
    if constexpr (account::has_clients_channel<A, Channel>)      consider(a.clients.channel, "clients.channel");
    if constexpr (account::has_clients_grpc_channel<A, Channel>) consider(a.clients.grpc_channel, "clients.grpc_channel");

    // (d) nested through stubs and per-service clients
    if (!found) {
        stubs.for_each([&](const std::string&, const Stub<Channel>& stub) {
            consider(stub.channel(), "stub");
        });
    }
    if constexpr (account::has_connection_client<A>) if (!found) consider(detail::client_channel<Channel>(a.connection_client), "connection_client");
    if constexpr (account::has_account_client<A>)    if (!found) consider(detail::client_channel<Channel>(a.account_client), "account_client");
    if constexpr (account::has_helper_client<A>)     if (!found) consider(detail::client_channel<Channel>(a.helper_client), "helper_client");

    if (found) {
        TL_TRACE("[RESOLVER] Channel found at " << found->origin);
    }
    return found;
}

} // namespace termlink::core::session
