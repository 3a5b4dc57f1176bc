#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/proto/fields.hpp"
#include "termlink/core/rpc/concepts.hpp"
#include "termlink/core/session/outcome.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session {

/*
===============================================================================
 termlink::core::session::Stub<Channel>
===============================================================================

A client bound to one channel, exposing the methods of one gateway service.

The service shape comes from its protobuf descriptor: methods are looked up by
alias, requests are created from the method's input type and filled through
tolerant field assignment, replies are parsed into the output type.

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- A stub never owns the channel exclusively (shared, read-only)
- call() never throws; a reply carrying an error payload is Rejected
- invoke() returns NotApplicable when no alias is exposed by the service

===============================================================================
*/

template<rpc::ChannelConcept Channel>
class Stub {
public:
    using MessagePtr = std::unique_ptr<google::protobuf::Message>;

    Stub(std::string_view key,
         const google::protobuf::ServiceDescriptor* service,
         std::shared_ptr<Channel> channel)
        : key_(key)
        , service_(service)
        , channel_(std::move(channel))
    {}

    [[nodiscard]] inline const std::string& key() const noexcept { return key_; }
    [[nodiscard]] inline const google::protobuf::ServiceDescriptor* service() const noexcept { return service_; }
    [[nodiscard]] inline const std::shared_ptr<Channel>& channel() const noexcept { return channel_; }

    // First method exposed among the aliases
    [[nodiscard]]
    const google::protobuf::MethodDescriptor* find_method(catalog::Aliases aliases) const noexcept {
        for (auto alias : aliases) {
            if (const auto* m = service_->FindMethodByName(std::string(alias))) {
                return m;
            }
        }
        return nullptr;
    }

    // Every distinct method exposed among the aliases, in alias order
    [[nodiscard]]
    std::vector<const google::protobuf::MethodDescriptor*> find_methods(catalog::Aliases aliases) const {
        std::vector<const google::protobuf::MethodDescriptor*> out;
        for (auto alias : aliases) {
            const auto* m = service_->FindMethodByName(std::string(alias));
            if (m != nullptr && std::find(out.begin(), out.end(), m) == out.end()) {
                out.push_back(m);
            }
        }
        return out;
    }

    [[nodiscard]]
    inline bool exposes(catalog::Aliases aliases) const noexcept {
        return find_method(aliases) != nullptr;
    }

    [[nodiscard]]
    static MessagePtr new_message(const google::protobuf::Descriptor* type) {
        const auto* prototype = google::protobuf::MessageFactory::generated_factory()->GetPrototype(type);
        return prototype ? MessagePtr(prototype->New()) : nullptr;
    }

    [[nodiscard]]
    static std::string method_path(const google::protobuf::MethodDescriptor* method) {
        return "/" + method->service()->full_name() + "/" + method->name();
    }

    [[nodiscard]]
    rpc::Error call(const google::protobuf::MethodDescriptor* method,
                    const google::protobuf::Message& request,
                    google::protobuf::Message& reply,
                    const rpc::Metadata& metadata,
                    std::chrono::milliseconds timeout) const noexcept {
        if (!channel_) {
            return rpc::Error::NotConnected;
        }
        const rpc::Error err = channel_->invoke(method_path(method), request, reply, metadata, timeout);
        if (err != rpc::Error::None) {
            return err;
        }
        if (auto description = proto::reply_error(reply)) {
            TL_DEBUG("[STUB] " << method->full_name() << " rejected: " << *description);
            return rpc::Error::Rejected;
        }
        return rpc::Error::None;
    }

    // Builds the request of `method`, lets `fill` set its fields, issues the call.
    // On Success the parsed reply is handed over through `reply_out` (optional).
    template<class Fill>
    [[nodiscard]]
    Outcome invoke(const google::protobuf::MethodDescriptor* method,
                   Fill&& fill,
                   const rpc::Metadata& metadata,
                   std::chrono::milliseconds timeout,
                   MessagePtr* reply_out = nullptr) const {
        if (method == nullptr) {
            return Outcome::NotApplicable;
        }
        MessagePtr request = new_message(method->input_type());
        MessagePtr reply = new_message(method->output_type());
        if (!request || !reply) {
            TL_WARN("[STUB] No generated type for " << method->full_name());
            return Outcome::NotApplicable;
        }
        fill(*request);
        const rpc::Error err = call(method, *request, *reply, metadata, timeout);
        TL_DEBUG("[STUB] " << method->full_name() << " -> " << rpc::to_string(err));
        const Outcome outcome = to_outcome(err);
        if (outcome == Outcome::Success && reply_out != nullptr) {
            *reply_out = std::move(reply);
        }
        return outcome;
    }

    // Same, on the first method exposed among the aliases
    template<class Fill>
    [[nodiscard]]
    Outcome invoke(catalog::Aliases aliases,
                   Fill&& fill,
                   const rpc::Metadata& metadata,
                   std::chrono::milliseconds timeout,
                   MessagePtr* reply_out = nullptr) const {
        return invoke(find_method(aliases), std::forward<Fill>(fill), metadata, timeout, reply_out);
    }

private:
    std::string key_;
    const google::protobuf::ServiceDescriptor* service_;
    std::shared_ptr<Channel> channel_;
};

// Request filler that leaves every field at its default
inline constexpr auto no_fields = [](google::protobuf::Message&) noexcept {};

} // namespace termlink::core::session
