#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <cstddef>


namespace termlink::core::rpc {

// Ordered (key, value) call metadata. Keys are lowercase (gRPC requirement).
using Metadata = std::vector<std::pair<std::string, std::string>>;

// Well-known key carrying the session identity
inline constexpr std::string_view IDENTITY_KEY = "id";

[[nodiscard]]
inline const std::string* find(const Metadata& md, std::string_view key) noexcept {
    for (const auto& [k, v] : md) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

[[nodiscard]]
inline bool contains(const Metadata& md, std::string_view key, std::string_view value) noexcept {
    const std::string* v = find(md, key);
    return v != nullptr && *v == value;
}

// Renders "[k1, k2]". Keys only: values may carry credentials
[[nodiscard]]
inline std::string format_keys(const Metadata& md) {
    std::string out = "[";
    for (std::size_t i = 0; i < md.size(); ++i) {
        if (i) out += ", ";
        out += md[i].first;
    }
    out += ']';
    return out;
}

} // namespace termlink::core::rpc
