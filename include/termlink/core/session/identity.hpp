#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "termlink/config/config.hpp"
#include "termlink/core/rpc/metadata.hpp"
#include "termlink/core/session/account_traits.hpp"
#include "termlink/core/session/context.hpp"
#include "termlink/core/session/outcome.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session::identity {

// Random RFC 4122 version 4 UUID, lowercase ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx")
[[nodiscard]]
inline std::string generate_uuid_v4() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        const std::uint64_t r = rng();
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<std::uint8_t>(r >> (8 * j));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);   // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);   // variant 10xx

    constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

// First non-empty identity field the account exposes
template<class A>
[[nodiscard]]
std::optional<std::string> read(const A& a) {
    if constexpr (account::has_string_field_terminal_instance_guid<A>) {
        if (std::string v = a.terminal_instance_guid; !v.empty()) return v;
    }
    if constexpr (account::has_string_field_terminalInstanceGuid<A>) {
        if (std::string v = a.terminalInstanceGuid; !v.empty()) return v;
    }
    if constexpr (account::has_string_field_id<A>) {
        if (std::string v = a.id; !v.empty()) return v;
    }
    return std::nullopt;
}

// Writes the identity into every identity field the account exposes.
// Returns the number of fields written.
template<class A>
std::size_t write(A& a, const std::string& value) {
    std::size_t written = 0;
    if constexpr (account::has_string_field_terminal_instance_guid<A>) {
        a.terminal_instance_guid = value;
        ++written;
    }
    if constexpr (account::has_string_field_terminalInstanceGuid<A>) {
        a.terminalInstanceGuid = value;
        ++written;
    }
    if constexpr (account::has_string_field_id<A>) {
        a.id = value;
        ++written;
    }
    return written;
}

// Reuses the account identity or generates one and writes it back
template<class Channel, class A>
const std::string& ensure(Context<Channel, A>& ctx) {
    if (auto existing = read(*ctx.account)) {
        ctx.identity = std::move(*existing);
        TL_DEBUG("[IDENTITY] Reusing account identity " << ctx.identity);
        return ctx.identity;
    }
    ctx.identity = generate_uuid_v4();
    const std::size_t written = write(*ctx.account, ctx.identity);
    TL_DEBUG("[IDENTITY] Generated " << ctx.identity << " (" << written << " account field(s) updated)");
    return ctx.identity;
}

// Account headers (identity appended when missing) or a synthesized set
template<class Channel, class A>
void build_headers(Context<Channel, A>& ctx, const config::Config& cfg) {
    rpc::Metadata md;
    bool from_account = false;
    if constexpr (account::has_headers<A>) {
        const Outcome o = run_step("[IDENTITY]", "headers()", [&] { md = ctx.account->headers(); });
        from_account = (o == Outcome::Success);
    }
    if (from_account) {
        if (rpc::find(md, rpc::IDENTITY_KEY) == nullptr) {
            md.emplace_back(std::string(rpc::IDENTITY_KEY), ctx.identity);
        }
    }
    else {
        md.clear();
        md.emplace_back(std::string(rpc::IDENTITY_KEY), ctx.identity);
        md.emplace_back("terminal-instance-guid", ctx.identity);
        md.emplace_back("client-id", ctx.identity);
        if (cfg.login != 0) {
            md.emplace_back("user", std::to_string(cfg.login));
        }
        if (!cfg.server_name.empty()) {
            md.emplace_back("server", cfg.server_name);
        }
    }
    ctx.headers = std::move(md);
    TL_DEBUG("[IDENTITY] Headers " << rpc::format_keys(ctx.headers));
}

// Adopts a server-assigned identity. Only honored while Connecting:
// from StubsAttached onward the identity is frozen.
template<class Channel, class A>
bool adopt(Context<Channel, A>& ctx, const std::string& assigned, const config::Config& cfg) {
    if (assigned.empty() || assigned == ctx.identity) {
        return false;
    }
    if (ctx.state != State::Connecting) {
        TL_DEBUG("[IDENTITY] Ignoring server identity " << assigned << " in state " << to_string(ctx.state));
        return false;
    }
    TL_INFO("[IDENTITY] Server assigned identity " << assigned);
    ctx.identity = assigned;
    write(*ctx.account, ctx.identity);
    build_headers(ctx, cfg);
    return true;
}

// Picks up an identity the account learned by itself (e.g. from a connect reply)
template<class Channel, class A>
bool sync_from_account(Context<Channel, A>& ctx, const config::Config& cfg) {
    auto current = read(*ctx.account);
    return current ? adopt(ctx, *current, cfg) : false;
}

// Writes the frozen identity back over anything the account picked up after
// Connecting (a late reconnect reply). Returns true when the account had drifted.
template<class Channel, class A>
bool restore(Context<Channel, A>& ctx) {
    auto current = read(*ctx.account);
    if (current && *current == ctx.identity) {
        return false;
    }
    if (write(*ctx.account, ctx.identity) == 0) {
        return false;
    }
    TL_DEBUG("[IDENTITY] Account identity " << current.value_or("<none>") << " replaced by session identity " << ctx.identity);
    return true;
}

} // namespace termlink::core::session::identity
