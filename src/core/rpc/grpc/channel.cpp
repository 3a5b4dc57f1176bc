#include "termlink/core/rpc/grpc/channel.hpp"

#include <vector>
#include <exception>

#include <grpcpp/client_context.h>
#include <grpcpp/completion_queue.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/channel_arguments.h>
#include <grpcpp/support/slice.h>

#include "lcr/log/logger.hpp"


namespace termlink::core::rpc {

namespace {

std::shared_ptr<::grpc::Channel> make_channel_(const std::string& target, const ChannelOptions& options) {
    ::grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, options.keepalive_time_ms);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, options.keepalive_timeout_ms);
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, options.keepalive_permit_without_calls ? 1 : 0);
    args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS, options.initial_reconnect_backoff_ms);
    args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS, options.max_reconnect_backoff_ms);
    args.SetMaxReceiveMessageSize(options.max_message_bytes);
    args.SetMaxSendMessageSize(options.max_message_bytes);

    auto credentials = options.secure
        ? ::grpc::SslCredentials(::grpc::SslCredentialsOptions{})
        : ::grpc::InsecureChannelCredentials();
    return ::grpc::CreateCustomChannel(target, credentials, args);
}

} // namespace


Error from_status(const ::grpc::Status& status) noexcept {
    switch (status.error_code()) {
    case ::grpc::StatusCode::OK:                return Error::None;
    case ::grpc::StatusCode::UNIMPLEMENTED:     return Error::Unimplemented;
    case ::grpc::StatusCode::DEADLINE_EXCEEDED: return Error::Timeout;
    case ::grpc::StatusCode::UNAVAILABLE:       return Error::Unavailable;
    case ::grpc::StatusCode::CANCELLED:         return Error::Cancelled;
    case ::grpc::StatusCode::INVALID_ARGUMENT:  return Error::InvalidArgument;
    default:                                    return Error::TransportFailure;
    }
}


GrpcChannel::GrpcChannel(const Endpoint& endpoint, const ChannelOptions& options)
    : target_(endpoint.target())
    , channel_(make_channel_(target_, options))
    , stub_(std::make_shared<::grpc::GenericStub>(channel_))
{
    TL_DEBUG("[GRPC] Channel created for " << target_ << (options.secure ? " (tls)" : " (plaintext)"));
}

GrpcChannel::GrpcChannel(std::shared_ptr<::grpc::Channel> channel, std::string target)
    : target_(std::move(target))
    , channel_(std::move(channel))
    , stub_(channel_ ? std::make_shared<::grpc::GenericStub>(channel_) : nullptr)
{
}

GrpcChannel::~GrpcChannel() {
    close();
}

Error GrpcChannel::invoke(const std::string& method,
                          const google::protobuf::Message& request,
                          google::protobuf::Message& reply,
                          const Metadata& metadata,
                          std::chrono::milliseconds timeout) noexcept {
    // 0) PRECONDITION: channel must be open
    std::shared_ptr<::grpc::GenericStub> stub;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stub = stub_;
    }
    if (!stub) {
        TL_WARN("[GRPC] " << method << " called on a closed channel");
        return Error::NotConnected;
    }
    try {
        // 1) Serialize request
        std::string wire;
        if (!request.SerializeToString(&wire)) {
            TL_ERROR("[GRPC] Failed to serialize " << request.GetTypeName());
            return Error::SerializationFailed;
        }
        ::grpc::Slice slice(wire);
        ::grpc::ByteBuffer request_buffer(&slice, 1);

        // 2) Per-call context: deadline + metadata
        ::grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + timeout);
        for (const auto& [key, value] : metadata) {
            context.AddMetadata(key, value);
        }

        // 3) Issue the call and wait for its single completion
        ::grpc::CompletionQueue cq;
        ::grpc::ByteBuffer reply_buffer;
        ::grpc::Status status;
        auto call = stub->PrepareUnaryCall(&context, method, request_buffer, &cq);
        if (!call) {
            TL_ERROR("[GRPC] Failed to prepare call " << method);
            return Error::TransportFailure;
        }
        int finish_tag = 0;
        call->StartCall();
        call->Finish(&reply_buffer, &status, &finish_tag);

        void* tag = nullptr;
        bool ok = false;
        const bool delivered = cq.Next(&tag, &ok) && tag == &finish_tag;
        cq.Shutdown();
        void* drained_tag = nullptr;
        bool drained_ok = false;
        while (cq.Next(&drained_tag, &drained_ok)) {}

        if (!delivered || !ok) {
            TL_WARN("[GRPC] " << method << " completion not delivered");
            return Error::TransportFailure;
        }
        if (!status.ok()) {
            const Error err = from_status(status);
            TL_DEBUG("[GRPC] " << method << " failed: " << to_string(err) << " (" << status.error_message() << ")");
            return err;
        }

        // 4) Deserialize reply
        std::vector<::grpc::Slice> slices;
        if (!reply_buffer.Dump(&slices).ok()) {
            return Error::SerializationFailed;
        }
        std::string payload;
        payload.reserve(reply_buffer.Length());
        for (const auto& s : slices) {
            payload.append(reinterpret_cast<const char*>(s.begin()), s.size());
        }
        if (!reply.ParseFromString(payload)) {
            TL_ERROR("[GRPC] Failed to parse " << reply.GetTypeName() << " from " << method);
            return Error::SerializationFailed;
        }
        return Error::None;
    }
    catch (const std::exception& e) {
        TL_ERROR("[GRPC] " << method << " aborted: " << e.what());
        return Error::TransportFailure;
    }
}

void GrpcChannel::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_) {
        return; // idempotent
    }
    TL_DEBUG("[GRPC] Closing channel " << target_);
    stub_.reset();
    channel_.reset();
}

bool GrpcChannel::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_ != nullptr;
}

} // namespace termlink::core::rpc
