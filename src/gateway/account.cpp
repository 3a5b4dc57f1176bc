#include "termlink/gateway/account.hpp"

#include <algorithm>
#include <stdexcept>

#include <google/protobuf/descriptor.h>

#include "mt5_term_api/connection.pb.h"

#include "termlink/core/proto/fields.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::gateway {

using core::rpc::Error;

namespace {

std::shared_ptr<core::rpc::GrpcChannel> make_channel_(const config::Config& cfg) {
    core::rpc::Endpoint endpoint;
    if (core::rpc::parse_endpoint(cfg.endpoint, endpoint) != Error::None) {
        throw std::invalid_argument("invalid gateway endpoint: " + cfg.endpoint);
    }
    core::rpc::ChannelOptions options;
    options.secure = endpoint.secure && cfg.secure;
    return std::make_shared<core::rpc::GrpcChannel>(endpoint, options);
}

// "/mt5_term_api.Connection/<method>"
std::string connection_path_(std::string_view method) {
    const auto* service = mt5_term_api::ConnectRequest::descriptor()->file()->FindServiceByName("Connection");
    const auto* m = (service != nullptr) ? service->FindMethodByName(std::string(method)) : nullptr;
    if (m == nullptr) {
        return {};
    }
    return "/" + m->service()->full_name() + "/" + m->name();
}

// Shared tail of every Connection call: transport error, reply error, GUID
Error finish_connect_(Error err, const mt5_term_api::ConnectReply& reply, std::string_view method,
                      std::string& guid) {
    if (err != Error::None) {
        TL_WARN("[ACCOUNT] " << method << " failed: " << core::rpc::to_string(err));
        return err;
    }
    if (auto description = core::proto::reply_error(reply)) {
        TL_WARN("[ACCOUNT] " << method << " rejected: " << *description);
        return Error::Rejected;
    }
    if (reply.has_data() && !reply.data().terminal_instance_guid().empty()) {
        guid = reply.data().terminal_instance_guid();
        TL_DEBUG("[ACCOUNT] Terminal instance " << guid);
    }
    return Error::None;
}

} // namespace


Account::Account(const config::Config& cfg)
    : Account(cfg, make_channel_(cfg))
{}

Account::Account(const config::Config& cfg, std::shared_ptr<core::rpc::GrpcChannel> channel)
    : login_(cfg.login)
    , password_(cfg.password)
    , timeout_(cfg.timeout)
    , channel_(std::move(channel))
{}

Account::~Account() {
    close();
}

core::rpc::Metadata Account::headers() const {
    return core::rpc::Metadata{{std::string(core::rpc::IDENTITY_KEY), terminal_instance_guid}};
}

Error Account::reconnect() {
    if (!channel_ || terminal_instance_guid.empty()) {
        return Error::NotConnected;
    }
    mt5_term_api::ReconnectRequest request;
    request.set_terminal_instance_guid(terminal_instance_guid);
    mt5_term_api::ConnectReply reply;
    const Error err = channel_->invoke(connection_path_("Reconnect"), request, reply, headers(),
                                       std::chrono::duration_cast<std::chrono::milliseconds>(timeout_));
    return finish_connect_(err, reply, "Reconnect", terminal_instance_guid);
}

Error Account::connect_by_server_name(std::string_view server_name, std::string_view base_symbol,
                                      int timeout_seconds) {
    if (!channel_) {
        return Error::NotConnected;
    }
    mt5_term_api::ConnectExRequest request;
    request.set_user(login_);
    request.set_password(password_);
    request.set_mt_cluster_name(std::string(server_name));
    request.set_base_chart_symbol(std::string(base_symbol));
    request.set_terminal_readiness_waiting_timeout_seconds(timeout_seconds);
    request.set_terminal_instance_guid(terminal_instance_guid);

    mt5_term_api::ConnectReply reply;
    const Error err = channel_->invoke(connection_path_("ConnectEx"), request, reply, headers(),
                                       call_timeout_(timeout_seconds));
    return finish_connect_(err, reply, "ConnectEx", terminal_instance_guid);
}

Error Account::connect_by_host_port(std::string_view host, int port, std::string_view base_symbol,
                                    int timeout_seconds) {
    if (!channel_) {
        return Error::NotConnected;
    }
    mt5_term_api::ConnectRequest request;
    request.set_user(login_);
    request.set_password(password_);
    request.set_host(std::string(host));
    request.set_port(port);
    request.set_base_chart_symbol(std::string(base_symbol));
    request.set_wait_for_terminal_is_alive(true);
    request.set_terminal_readiness_waiting_timeout_seconds(timeout_seconds);

    mt5_term_api::ConnectReply reply;
    const Error err = channel_->invoke(connection_path_("Connect"), request, reply, headers(),
                                       call_timeout_(timeout_seconds));
    return finish_connect_(err, reply, "Connect", terminal_instance_guid);
}

void Account::close() noexcept {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

// The gateway waits up to timeout_seconds for the terminal; leave room for the reply
std::chrono::milliseconds Account::call_timeout_(int timeout_seconds) const noexcept {
    const auto requested = std::chrono::seconds(std::max(0, timeout_seconds) + 5);
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::max(requested, timeout_));
}

} // namespace termlink::gateway
