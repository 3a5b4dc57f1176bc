#pragma once

#include <stdexcept>
#include <string>
#include <string_view>


namespace termlink::core::session {

// Stable message callers match on to detect "reconnect / check credentials"
inline constexpr std::string_view CONNECTION_ERROR_MESSAGE = "Please call connect method first";

// The only exception raised by the session engine, from connect() only
class ConnectionError : public std::runtime_error {
public:
    ConnectionError()
        : std::runtime_error(std::string(CONNECTION_ERROR_MESSAGE))
    {}
};

} // namespace termlink::core::session
