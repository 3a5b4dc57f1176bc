#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "termlink/core/catalog/capability.hpp"


namespace termlink::core::proto {

/*
===============================================================================
 Tolerant protobuf field access
===============================================================================

Request and reply shapes differ between gateway builds (snake/camel case,
renamed fields, string vs numeric logins). These helpers read and write
fields by alias lists through protobuf reflection:

  - A field is matched by exact name, then camel-case name, then lowercase name
  - Writes go to every alias the message exposes; absent aliases are skipped
  - Scalar values are converted between string and numeric field types
  - Values that cannot be converted are skipped, never an error

===============================================================================
*/

using catalog::Aliases;

[[nodiscard]]
const google::protobuf::FieldDescriptor*
find_field(const google::protobuf::Descriptor* type, std::string_view name) noexcept;

// True if the message type exposes at least one alias
[[nodiscard]]
bool exposes(const google::protobuf::Descriptor* type, Aliases aliases) noexcept;

// Return the number of fields written
std::size_t assign_string(google::protobuf::Message& msg, Aliases aliases, std::string_view value);
std::size_t assign_int(google::protobuf::Message& msg, Aliases aliases, std::int64_t value);
std::size_t assign_bool(google::protobuf::Message& msg, Aliases aliases, bool value);

// First non-empty scalar among dotted paths ("data.terminal_instance_guid").
// Unset sub-messages are not traversed.
[[nodiscard]]
std::optional<std::string> read_string(const google::protobuf::Message& msg, Aliases paths);

// Description of the "error" payload when the reply carries one
[[nodiscard]]
std::optional<std::string> reply_error(const google::protobuf::Message& reply);

} // namespace termlink::core::proto
