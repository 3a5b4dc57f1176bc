#pragma once

#include <string>
#include <chrono>
#include <concepts>

#include <google/protobuf/message.h>

#include "termlink/core/rpc/error.hpp"
#include "termlink/core/rpc/metadata.hpp"

namespace termlink::core::rpc {

// -----------------------------------------------------------------------------
// ChannelConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by stubs and by the session engine.
//
// The channel implementation:
//
//   • Issues one blocking unary call per invoke(), bounded by its timeout
//   • Takes the full method path ("/package.Service/Method")
//   • Attaches the given metadata to the outbound call
//   • Maps every failure onto rpc::Error (never throws)
//   • Treats close() as idempotent; invoke() after close() is NotConnected
//
// A channel is shared read-only by every stub bound to it.
//
// -----------------------------------------------------------------------------

template<class CH>
concept ChannelConcept =
    requires(
        CH ch,
        const CH cch,
        const std::string& method,
        const google::protobuf::Message& request,
        google::protobuf::Message& reply,
        const Metadata& metadata,
        std::chrono::milliseconds timeout
    )
{
    // ---------------------------------------------------------------------
    // Calls
    // ---------------------------------------------------------------------

    { ch.invoke(method, request, reply, metadata, timeout) } noexcept -> std::same_as<Error>;

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ch.close() } noexcept -> std::same_as<void>;
    { cch.is_open() } noexcept -> std::same_as<bool>;
};

} // namespace termlink::core::rpc
