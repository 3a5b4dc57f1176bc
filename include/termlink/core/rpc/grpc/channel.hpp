#pragma once

#include <string>
#include <chrono>
#include <memory>
#include <mutex>

#include <grpcpp/channel.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/support/status.h>
#include <google/protobuf/message.h>

#include "termlink/core/rpc/concepts.hpp"
#include "termlink/core/rpc/endpoint.hpp"
#include "termlink/core/rpc/error.hpp"
#include "termlink/core/rpc/metadata.hpp"


namespace termlink::core::rpc {

/*
===============================================================================
 termlink::core::rpc::GrpcChannel
===============================================================================

Real channel implementation over gRPC.

Calls are issued through grpc::GenericStub with the method path taken from the
protobuf service descriptor, so any service compiled into the build can be
called without generated gRPC stubs.

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- invoke() blocks until the call completes or its deadline expires
- Every call gets a fresh ClientContext (deadline + metadata)
- gRPC status codes and serialization failures are mapped onto rpc::Error
- close() releases the underlying grpc::Channel; it is idempotent
- Connection establishment is lazy (first call), as in gRPC itself

===============================================================================
*/

struct ChannelOptions {
    bool secure = true;
    int keepalive_time_ms = 20'000;
    int keepalive_timeout_ms = 5'000;
    bool keepalive_permit_without_calls = true;
    int initial_reconnect_backoff_ms = 200;
    int max_reconnect_backoff_ms = 3'000;
    int max_message_bytes = 100 * 1024 * 1024;
};


class GrpcChannel {
public:
    GrpcChannel(const Endpoint& endpoint, const ChannelOptions& options);

    // Adopt an already created channel (in-process servers, custom credentials)
    explicit GrpcChannel(std::shared_ptr<::grpc::Channel> channel, std::string target = {});

    ~GrpcChannel();

    GrpcChannel(const GrpcChannel&) = delete;
    GrpcChannel& operator=(const GrpcChannel&) = delete;

    [[nodiscard]]
    Error invoke(const std::string& method,
                 const google::protobuf::Message& request,
                 google::protobuf::Message& reply,
                 const Metadata& metadata,
                 std::chrono::milliseconds timeout) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool is_open() const noexcept;

    [[nodiscard]]
    inline const std::string& target() const noexcept {
        return target_;
    }

private:
    std::string target_;
    mutable std::mutex mutex_;                          // guards channel_/stub_ against close()
    std::shared_ptr<::grpc::Channel> channel_;
    std::shared_ptr<::grpc::GenericStub> stub_;
};

// Assert that GrpcChannel conforms to rpc::ChannelConcept
static_assert(ChannelConcept<GrpcChannel>);


[[nodiscard]]
Error from_status(const ::grpc::Status& status) noexcept;

} // namespace termlink::core::rpc
