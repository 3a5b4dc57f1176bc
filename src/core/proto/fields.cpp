#include "termlink/core/proto/fields.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <vector>


namespace termlink::core::proto {

namespace {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using google::protobuf::Reflection;

std::string lowercase_(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template<typename T>
bool parse_number_(std::string_view text, T& out) noexcept {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// Collects the distinct singular fields matched by the aliases
std::vector<const FieldDescriptor*> matched_fields_(const Descriptor* type, Aliases aliases) {
    std::vector<const FieldDescriptor*> out;
    for (auto alias : aliases) {
        const FieldDescriptor* f = find_field(type, alias);
        if (f == nullptr || f->is_repeated()) {
            continue;
        }
        if (std::find(out.begin(), out.end(), f) == out.end()) {
            out.push_back(f);
        }
    }
    return out;
}

bool set_from_int_(Message& msg, const FieldDescriptor* f, std::int64_t v) {
    const Reflection* r = msg.GetReflection();
    switch (f->cpp_type()) {
    case FieldDescriptor::CPPTYPE_INT64:
        r->SetInt64(&msg, f, v);
        return true;
    case FieldDescriptor::CPPTYPE_UINT64:
        if (v < 0) return false;
        r->SetUInt64(&msg, f, static_cast<std::uint64_t>(v));
        return true;
    case FieldDescriptor::CPPTYPE_INT32:
        if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) return false;
        r->SetInt32(&msg, f, static_cast<std::int32_t>(v));
        return true;
    case FieldDescriptor::CPPTYPE_UINT32:
        if (v < 0 || v > std::numeric_limits<std::uint32_t>::max()) return false;
        r->SetUInt32(&msg, f, static_cast<std::uint32_t>(v));
        return true;
    case FieldDescriptor::CPPTYPE_DOUBLE:
        r->SetDouble(&msg, f, static_cast<double>(v));
        return true;
    case FieldDescriptor::CPPTYPE_FLOAT:
        r->SetFloat(&msg, f, static_cast<float>(v));
        return true;
    case FieldDescriptor::CPPTYPE_BOOL:
        r->SetBool(&msg, f, v != 0);
        return true;
    case FieldDescriptor::CPPTYPE_STRING:
        r->SetString(&msg, f, std::to_string(v));
        return true;
    default:
        return false; // enums and sub-messages are never written by alias
    }
}

bool set_from_string_(Message& msg, const FieldDescriptor* f, std::string_view v) {
    switch (f->cpp_type()) {
    case FieldDescriptor::CPPTYPE_STRING:
        msg.GetReflection()->SetString(&msg, f, std::string(v));
        return true;
    case FieldDescriptor::CPPTYPE_BOOL:
        if (v == "true" || v == "1") return set_from_int_(msg, f, 1);
        if (v == "false" || v == "0") return set_from_int_(msg, f, 0);
        return false;
    case FieldDescriptor::CPPTYPE_INT32:
    case FieldDescriptor::CPPTYPE_INT64:
    case FieldDescriptor::CPPTYPE_UINT32:
    case FieldDescriptor::CPPTYPE_UINT64:
    case FieldDescriptor::CPPTYPE_DOUBLE:
    case FieldDescriptor::CPPTYPE_FLOAT: {
        std::int64_t n = 0;
        if (!parse_number_(v, n)) {
            return false;
        }
        return set_from_int_(msg, f, n);
    }
    default:
        return false;
    }
}

std::optional<std::string> scalar_to_string_(const Message& msg, const FieldDescriptor* f) {
    const Reflection* r = msg.GetReflection();
    switch (f->cpp_type()) {
    case FieldDescriptor::CPPTYPE_STRING: return r->GetString(msg, f);
    case FieldDescriptor::CPPTYPE_INT32:  return std::to_string(r->GetInt32(msg, f));
    case FieldDescriptor::CPPTYPE_INT64:  return std::to_string(r->GetInt64(msg, f));
    case FieldDescriptor::CPPTYPE_UINT32: return std::to_string(r->GetUInt32(msg, f));
    case FieldDescriptor::CPPTYPE_UINT64: return std::to_string(r->GetUInt64(msg, f));
    case FieldDescriptor::CPPTYPE_BOOL:   return std::string(r->GetBool(msg, f) ? "true" : "false");
    default:                              return std::nullopt;
    }
}

} // namespace


const FieldDescriptor* find_field(const Descriptor* type, std::string_view name) noexcept {
    if (type == nullptr || name.empty()) {
        return nullptr;
    }
    const std::string key(name);
    if (const auto* f = type->FindFieldByName(key)) {
        return f;
    }
    if (const auto* f = type->FindFieldByCamelcaseName(key)) {
        return f;
    }
    return type->FindFieldByLowercaseName(lowercase_(name));
}

bool exposes(const Descriptor* type, Aliases aliases) noexcept {
    for (auto alias : aliases) {
        if (find_field(type, alias) != nullptr) {
            return true;
        }
    }
    return false;
}

std::size_t assign_string(Message& msg, Aliases aliases, std::string_view value) {
    std::size_t written = 0;
    for (const auto* f : matched_fields_(msg.GetDescriptor(), aliases)) {
        if (set_from_string_(msg, f, value)) {
            ++written;
        }
    }
    return written;
}

std::size_t assign_int(Message& msg, Aliases aliases, std::int64_t value) {
    std::size_t written = 0;
    for (const auto* f : matched_fields_(msg.GetDescriptor(), aliases)) {
        if (set_from_int_(msg, f, value)) {
            ++written;
        }
    }
    return written;
}

std::size_t assign_bool(Message& msg, Aliases aliases, bool value) {
    std::size_t written = 0;
    for (const auto* f : matched_fields_(msg.GetDescriptor(), aliases)) {
        if (f->cpp_type() == FieldDescriptor::CPPTYPE_STRING) {
            msg.GetReflection()->SetString(&msg, f, value ? "true" : "false");
            ++written;
        }
        else if (set_from_int_(msg, f, value ? 1 : 0)) {
            ++written;
        }
    }
    return written;
}

std::optional<std::string> read_string(const Message& msg, Aliases paths) {
    for (auto path : paths) {
        const Message* node = &msg;
        std::string_view rest = path;
        bool reachable = true;
        // 1) Walk the sub-messages of the dotted path
        for (std::size_t dot = rest.find('.'); dot != std::string_view::npos; dot = rest.find('.')) {
            const auto* f = find_field(node->GetDescriptor(), rest.substr(0, dot));
            if (f == nullptr || f->is_repeated() || f->cpp_type() != FieldDescriptor::CPPTYPE_MESSAGE
                || !node->GetReflection()->HasField(*node, f)) {
                reachable = false;
                break;
            }
            node = &node->GetReflection()->GetMessage(*node, f);
            rest.remove_prefix(dot + 1);
        }
        if (!reachable) {
            continue;
        }
        // 2) Read the leaf scalar
        const auto* leaf = find_field(node->GetDescriptor(), rest);
        if (leaf == nullptr || leaf->is_repeated()) {
            continue;
        }
        auto value = scalar_to_string_(*node, leaf);
        if (value && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> reply_error(const Message& reply) {
    const auto* f = reply.GetDescriptor()->FindFieldByName("error");
    if (f == nullptr || f->is_repeated() || f->cpp_type() != FieldDescriptor::CPPTYPE_MESSAGE) {
        return std::nullopt;
    }
    const Reflection* r = reply.GetReflection();
    if (!r->HasField(reply, f)) {
        return std::nullopt;
    }
    const Message& error = r->GetMessage(reply, f);
    constexpr std::string_view code_aliases[]    = {"error_code", "code"};
    constexpr std::string_view message_aliases[] = {"error_message", "message"};
    const auto code = read_string(error, code_aliases);
    const auto text = read_string(error, message_aliases);
    std::string out = code.value_or("error");
    if (text) {
        out += ": " + *text;
    }
    return out;
}

} // namespace termlink::core::proto
