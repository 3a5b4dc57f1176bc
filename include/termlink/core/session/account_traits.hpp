#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <string_view>

#include "termlink/core/rpc/metadata.hpp"


namespace termlink::core::session::account {

/*
===============================================================================
 Account shape probes
===============================================================================

The engine is written against any account type. What an account can do is
decided at compile time from the members it declares:

  exposes_<name><A>            A has a callable A::name()
  has_string_field_<name><A>   A has a data member `name` assignable from
                               std::string and readable as one
  has_channel_field_<name><A, Ch>
  has_channel_accessor_<name><A, Ch>
                               A has a data member / accessor yielding
                               std::shared_ptr<Ch>

A member function never satisfies a field probe and vice versa.
===============================================================================
*/

#define TL_ACCOUNT_METHOD_PROBE(name) \
    template<class A> \
    concept exposes_##name = requires(A& a) { a.name(); };

#define TL_ACCOUNT_STRING_FIELD_PROBE(name) \
    template<class A> \
    concept has_string_field_##name = requires(A& a) { \
        { a.name } -> std::convertible_to<std::string>; \
        a.name = std::string{}; \
    };

#define TL_ACCOUNT_CHANNEL_FIELD_PROBE(name) \
    template<class A, class Ch> \
    concept has_channel_field_##name = requires(A& a) { \
        { a.name } -> std::convertible_to<std::shared_ptr<Ch>>; \
    };

#define TL_ACCOUNT_CHANNEL_ACCESSOR_PROBE(name) \
    template<class A, class Ch> \
    concept has_channel_accessor_##name = requires(A& a) { \
        { a.name() } -> std::convertible_to<std::shared_ptr<Ch>>; \
    };

// ---------------------------------------------------------------------
// Generic connect strategies (first exposed wins)
// ---------------------------------------------------------------------
TL_ACCOUNT_METHOD_PROBE(reconnect)
TL_ACCOUNT_METHOD_PROBE(connect)
TL_ACCOUNT_METHOD_PROBE(start)
TL_ACCOUNT_METHOD_PROBE(initialize)
TL_ACCOUNT_METHOD_PROBE(open)

// ---------------------------------------------------------------------
// Channel factories
// ---------------------------------------------------------------------
TL_ACCOUNT_METHOD_PROBE(ensure_clients)
TL_ACCOUNT_METHOD_PROBE(connect_clients)
TL_ACCOUNT_METHOD_PROBE(connect_all_clients)

// ---------------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------------
TL_ACCOUNT_METHOD_PROBE(unsubscribe_all)
TL_ACCOUNT_METHOD_PROBE(stop_streams)
TL_ACCOUNT_METHOD_PROBE(close_streams)
TL_ACCOUNT_METHOD_PROBE(logout)
TL_ACCOUNT_METHOD_PROBE(close)
TL_ACCOUNT_METHOD_PROBE(disconnect)
TL_ACCOUNT_METHOD_PROBE(stop)
TL_ACCOUNT_METHOD_PROBE(shutdown)

// ---------------------------------------------------------------------
// Identity fields
// ---------------------------------------------------------------------
TL_ACCOUNT_STRING_FIELD_PROBE(terminal_instance_guid)
TL_ACCOUNT_STRING_FIELD_PROBE(terminalInstanceGuid)
TL_ACCOUNT_STRING_FIELD_PROBE(id)

// ---------------------------------------------------------------------
// Channel storage locations
// ---------------------------------------------------------------------
TL_ACCOUNT_CHANNEL_FIELD_PROBE(channel)
TL_ACCOUNT_CHANNEL_FIELD_PROBE(grpc_channel)
TL_ACCOUNT_CHANNEL_FIELD_PROBE(rpc_channel)

TL_ACCOUNT_CHANNEL_ACCESSOR_PROBE(get_channel)
TL_ACCOUNT_CHANNEL_ACCESSOR_PROBE(channel)
TL_ACCOUNT_CHANNEL_ACCESSOR_PROBE(grpc_channel)
TL_ACCOUNT_CHANNEL_ACCESSOR_PROBE(get_grpc_channel)

#undef TL_ACCOUNT_METHOD_PROBE
#undef TL_ACCOUNT_STRING_FIELD_PROBE
#undef TL_ACCOUNT_CHANNEL_FIELD_PROBE
#undef TL_ACCOUNT_CHANNEL_ACCESSOR_PROBE

// ---------------------------------------------------------------------
// Probes with arguments / nested members
// ---------------------------------------------------------------------

template<class A>
concept has_headers = requires(A& a) {
    { a.headers() } -> std::convertible_to<rpc::Metadata>;
};

template<class A>
concept connects_by_server_name = requires(A& a, std::string_view s, int seconds) {
    a.connect_by_server_name(s, s, seconds);
};

template<class A>
concept connects_by_host_port = requires(A& a, std::string_view s, int port, int seconds) {
    a.connect_by_host_port(s, port, s, seconds);
};

// `clients` container holding the transport
template<class A, class Ch>
concept has_clients_channel = requires(A& a) {
    { a.clients.channel } -> std::convertible_to<std::shared_ptr<Ch>>;
};

template<class A, class Ch>
concept has_clients_grpc_channel = requires(A& a) {
    { a.clients.grpc_channel } -> std::convertible_to<std::shared_ptr<Ch>>;
};

// Per-service client objects held by the account (field or accessor)
template<class C, class Ch>
concept client_with_channel_field = requires(C& c) {
    { c.channel } -> std::convertible_to<std::shared_ptr<Ch>>;
};

template<class C, class Ch>
concept client_with_channel_accessor = requires(C& c) {
    { c.channel() } -> std::convertible_to<std::shared_ptr<Ch>>;
};

template<class A> concept has_connection_client = requires(A& a) { a.connection_client; };
template<class A> concept has_account_client    = requires(A& a) { a.account_client; };
template<class A> concept has_helper_client     = requires(A& a) { a.helper_client; };

} // namespace termlink::core::session::account
