#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <charconv>

#include "termlink/core/rpc/error.hpp"


namespace termlink::core::rpc {

    // Parsed gateway endpoint
    struct Endpoint {
        bool secure{true};        // TLS unless a plaintext scheme was given
        std::string host;
        std::uint16_t port{443};

        // "host:port" as expected by grpc::CreateChannel
        [[nodiscard]]
        inline std::string target() const {
            return host + ":" + std::to_string(port);
        }
    };


    // ---------------------------------------------------------------------
    // NOTE: Minimal endpoint parser for gRPC targets.
    // Accepts an optional scheme and a host with an optional port. Paths are
    // rejected: gRPC targets address a server, not a resource.
    //
    // Example inputs:
    //   mt5.mrpc.pro:443
    //   mt5.mrpc.pro                  (port 443)
    //   grpc://localhost:50051        (plaintext)
    //   https://gateway.example.com
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_endpoint(std::string_view text, Endpoint& out) noexcept {
        out = Endpoint{};
        // 1) Optional scheme
        constexpr std::string_view secure_schemes[]    = {"https://", "grpcs://"};
        constexpr std::string_view plaintext_schemes[] = {"http://", "grpc://"};
        for (auto scheme : secure_schemes) {
            if (text.starts_with(scheme)) {
                text.remove_prefix(scheme.size());
                out.secure = true;
                break;
            }
        }
        for (auto scheme : plaintext_schemes) {
            if (text.starts_with(scheme)) {
                text.remove_prefix(scheme.size());
                out.secure = false;
                break;
            }
        }
        // 2) A trailing slash is tolerated, anything after it is not
        if (!text.empty() && text.back() == '/') {
            text.remove_suffix(1);
        }
        if (text.empty() || text.find('/') != std::string_view::npos) {
            return Error::InvalidEndpoint;
        }
        // 3) Split host and port (last colon wins)
        const std::size_t colon = text.rfind(':');
        std::string_view port_text;
        if (colon != std::string_view::npos) {
            out.host.assign(text.substr(0, colon));
            port_text = text.substr(colon + 1);
        } else {
            out.host.assign(text);
            out.port = out.secure ? 443 : 80;
        }

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty() || out.host.find(':') != std::string::npos) {
            return Error::InvalidEndpoint;
        }
        // Validate port - must be numeric and in range
        if (colon != std::string_view::npos) {
            if (port_text.empty()) {
                return Error::InvalidEndpoint;
            }
            unsigned long p = 0;
            const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), p);
            if (ec != std::errc{} || ptr != port_text.data() + port_text.size()) {
                return Error::InvalidEndpoint;
            }
            if (p == 0 || p > 65535) {
                return Error::InvalidEndpoint;
            }
            out.port = static_cast<std::uint16_t>(p);
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace termlink::core::rpc
