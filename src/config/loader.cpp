#include "termlink/config/loader.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>

#include "simdjson.h"

#include "termlink/core/rpc/endpoint.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::config {

namespace {

// ------------------------------------------------------------
// Optional typed keys. Absent -> untouched, wrong type -> false
// ------------------------------------------------------------

[[nodiscard]]
bool read_string_optional(const simdjson::dom::element& root, const char* key, std::string& out) noexcept {
    auto field = root[key];
    if (field.error()) {
        return true; // optional, not present
    }
    std::string_view sv;
    if (field.get(sv)) {
        return false;
    }
    out.assign(sv);
    return true;
}

[[nodiscard]]
bool read_bool_optional(const simdjson::dom::element& root, const char* key, bool& out) noexcept {
    auto field = root[key];
    if (field.error()) {
        return true;
    }
    return !field.get(out);
}

[[nodiscard]]
bool read_int_optional(const simdjson::dom::element& root, const char* key, std::int64_t& out, bool& present) noexcept {
    present = false;
    auto field = root[key];
    if (field.error()) {
        return true;
    }
    if (field.get(out)) {
        return false;
    }
    present = true;
    return true;
}

template<typename T>
[[nodiscard]]
bool read_int_into(const simdjson::dom::element& root, const char* key, T& out) noexcept {
    std::int64_t v = 0;
    bool present = false;
    if (!read_int_optional(root, key, v, present)) {
        return false;
    }
    if (present) {
        if (v < static_cast<std::int64_t>(std::numeric_limits<int>::min()) ||
            v > static_cast<std::int64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = T{static_cast<int>(v)};
    }
    return true;
}

[[nodiscard]]
bool read_login_optional(const simdjson::dom::element& root, std::uint64_t& out) noexcept {
    auto field = root["login"];
    if (field.error()) {
        return true;
    }
    // Accept both 5036292718 and "5036292718"
    std::uint64_t n = 0;
    if (!field.get(n)) {
        out = n;
        return true;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), n);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return false;
    }
    out = n;
    return true;
}

template<typename T>
[[nodiscard]]
bool parse_env_number(const char* name, T& out) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return true; // not set
    }
    const std::string_view sv(raw);
    T n{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), n);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        TL_ERROR("[CONFIG] " << name << " is not a valid number");
        return false;
    }
    out = n;
    return true;
}

void apply_env_string(const char* name, std::string& out) {
    const char* raw = std::getenv(name);
    if (raw != nullptr && *raw != '\0') {
        out = raw;
    }
}

} // namespace


Error load_string(std::string_view json, Config& out) {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(json);
    simdjson::dom::element root;
    if (parser.parse(padded).get(root)) {
        TL_ERROR("[CONFIG] Invalid JSON document");
        return Error::InvalidJson;
    }
    if (root.type() != simdjson::dom::element_type::OBJECT) {
        TL_ERROR("[CONFIG] Root element must be an object");
        return Error::InvalidSchema;
    }

    Config cfg = out;
    int timeout_s = static_cast<int>(cfg.timeout.count());
    int readiness_delay_ms = static_cast<int>(cfg.readiness_delay.count());
    int settle_delay_ms = static_cast<int>(cfg.settle_delay.count());
    int probe_ms = static_cast<int>(cfg.probe_timeout.count());
    int handshake_ms = static_cast<int>(cfg.handshake_timeout.count());
    int ping_ms = static_cast<int>(cfg.ping_timeout.count());
    int logout_ms = static_cast<int>(cfg.logout_timeout.count());

    const bool ok =
        read_login_optional(root, cfg.login) &&
        read_string_optional(root, "password", cfg.password) &&
        read_string_optional(root, "server_name", cfg.server_name) &&
        read_string_optional(root, "host", cfg.host) &&
        read_int_into(root, "port", cfg.port) &&
        read_string_optional(root, "endpoint", cfg.endpoint) &&
        read_bool_optional(root, "secure", cfg.secure) &&
        read_string_optional(root, "base_symbol", cfg.base_symbol) &&
        read_int_into(root, "timeout_seconds", timeout_s) &&
        read_int_into(root, "connect_retries", cfg.connect_retries) &&
        read_int_into(root, "readiness_tries", cfg.readiness_tries) &&
        read_int_into(root, "readiness_delay_ms", readiness_delay_ms) &&
        read_int_into(root, "settle_delay_ms", settle_delay_ms) &&
        read_int_into(root, "probe_timeout_ms", probe_ms) &&
        read_int_into(root, "handshake_timeout_ms", handshake_ms) &&
        read_int_into(root, "ping_timeout_ms", ping_ms) &&
        read_int_into(root, "logout_timeout_ms", logout_ms) &&
        read_string_optional(root, "log_level", cfg.log_level);
    if (!ok) {
        TL_ERROR("[CONFIG] A configuration key has the wrong type");
        return Error::InvalidSchema;
    }

    cfg.timeout = std::chrono::seconds{timeout_s};
    cfg.readiness_delay = std::chrono::milliseconds{readiness_delay_ms};
    cfg.settle_delay = std::chrono::milliseconds{settle_delay_ms};
    cfg.probe_timeout = std::chrono::milliseconds{probe_ms};
    cfg.handshake_timeout = std::chrono::milliseconds{handshake_ms};
    cfg.ping_timeout = std::chrono::milliseconds{ping_ms};
    cfg.logout_timeout = std::chrono::milliseconds{logout_ms};

    out = std::move(cfg);
    return Error::None;
}

Error load_file(const std::string& path, Config& out) {
    simdjson::padded_string content;
    if (simdjson::padded_string::load(path).get(content)) {
        TL_ERROR("[CONFIG] Cannot read " << path);
        return Error::FileNotFound;
    }
    TL_DEBUG("[CONFIG] Loading " << path);
    return load_string(std::string_view(content.data(), content.size()), out);
}

Error apply_env(Config& cfg) {
    std::uint64_t login = cfg.login;
    int timeout_s = static_cast<int>(cfg.timeout.count());
    int retries = cfg.connect_retries;
    if (!parse_env_number("MT5_LOGIN", login) ||
        !parse_env_number("TIMEOUT_SECONDS", timeout_s) ||
        !parse_env_number("CONNECT_RETRIES", retries)) {
        return Error::InvalidValue;
    }
    cfg.login = login;
    cfg.timeout = std::chrono::seconds{timeout_s};
    cfg.connect_retries = retries;
    apply_env_string("MT5_PASSWORD", cfg.password);
    apply_env_string("MT5_SERVER", cfg.server_name);
    apply_env_string("GRPC_SERVER", cfg.endpoint);
    apply_env_string("BASE_SYMBOL", cfg.base_symbol);
    return Error::None;
}

Error validate(const Config& cfg) noexcept {
    if (cfg.login == 0) {
        return Error::InvalidValue;
    }
    core::rpc::Endpoint endpoint;
    if (core::rpc::parse_endpoint(cfg.endpoint, endpoint) != core::rpc::Error::None) {
        return Error::InvalidValue;
    }
    if (cfg.port <= 0 || cfg.port > 65535) {
        return Error::InvalidValue;
    }
    if (cfg.timeout.count() <= 0 || cfg.readiness_tries <= 0 || cfg.connect_retries < 0) {
        return Error::InvalidValue;
    }
    if (cfg.readiness_delay.count() < 0 || cfg.settle_delay.count() < 0) {
        return Error::InvalidValue;
    }
    if (cfg.probe_timeout.count() <= 0 || cfg.handshake_timeout.count() <= 0 ||
        cfg.ping_timeout.count() <= 0 || cfg.logout_timeout.count() <= 0) {
        return Error::InvalidValue;
    }
    lcr::log::Level level;
    if (!lcr::log::parse_level(cfg.log_level, level)) {
        return Error::InvalidValue;
    }
    return Error::None;
}

} // namespace termlink::config
