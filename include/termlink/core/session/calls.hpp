#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <google/protobuf/message.h>

#include "termlink/config/config.hpp"
#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/proto/fields.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/outcome.hpp"
#include "termlink/core/session/stub.hpp"


namespace termlink::core::session {

// Writes login, password, server name and identity to whichever aliases the
// request exposes
inline void fill_credentials(google::protobuf::Message& req, const config::Config& cfg, const std::string& identity) {
    if (cfg.login != 0) {
        proto::assign_int(req, catalog::field::LOGIN, static_cast<std::int64_t>(cfg.login));
    }
    proto::assign_string(req, catalog::field::PASSWORD, cfg.password);
    if (!cfg.server_name.empty()) {
        proto::assign_string(req, catalog::field::SERVER, cfg.server_name);
    }
    if (!identity.empty()) {
        proto::assign_string(req, catalog::field::IDENTITY, identity);
    }
}

// Issues a table operation on the stub registered for its capability.
// NotApplicable when the capability is not attached or exposes no alias.
template<class Channel, class A, class Fill>
[[nodiscard]]
Outcome invoke_operation(const Context<Channel, A>& ctx, const catalog::Operation& operation,
                         const config::Config& cfg, Fill&& fill) {
    const auto* stub = ctx.stubs.find(operation.capability);
    if (stub == nullptr) {
        return Outcome::NotApplicable;
    }
    return stub->invoke(operation.methods, std::forward<Fill>(fill), ctx.headers, cfg.timeout_for(operation.timeout));
}

} // namespace termlink::core::session
