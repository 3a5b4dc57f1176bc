#include "termlink/core/catalog/catalog.hpp"

#include <algorithm>
#include <utility>

#include "lcr/log/logger.hpp"


namespace termlink::core::catalog {

namespace {

inline const google::protobuf::DescriptorPool* pool_() noexcept {
    return google::protobuf::DescriptorPool::generated_pool();
}

} // namespace


Catalog::Catalog()
    : restricted_(false)
{
    link_modules();
}

Catalog::Catalog(std::vector<std::string> manifest)
    : restricted_(true)
    , manifest_(std::move(manifest))
{
    link_modules();
    TL_DEBUG("[CATALOG] Restricted to " << manifest_.size() << " module(s)");
}

bool Catalog::deployed(std::string_view module) const noexcept {
    if (!restricted_) {
        return true;
    }
    return std::find(manifest_.begin(), manifest_.end(), module) != manifest_.end();
}

const google::protobuf::ServiceDescriptor* Catalog::find_service(std::string_view full_name) const noexcept {
    const auto* service = pool_()->FindServiceByName(std::string(full_name));
    if (service == nullptr) {
        return nullptr;
    }
    if (!deployed(service->file()->name())) {
        return nullptr;
    }
    return service;
}

const google::protobuf::ServiceDescriptor* Catalog::resolve(std::string_view capability) const noexcept {
    const Capability* cap = find_capability(capability);
    if (cap == nullptr) {
        TL_WARN("[CATALOG] Unknown capability '" << capability << "'");
        return nullptr;
    }
    for (auto alias : cap->services) {
        if (const auto* service = find_service(alias)) {
            return service;
        }
    }
    return nullptr;
}

std::vector<const google::protobuf::ServiceDescriptor*> Catalog::services() const {
    std::vector<const google::protobuf::ServiceDescriptor*> out;
    for (auto module : MODULES) {
        if (!deployed(module)) {
            continue;
        }
        const auto* file = pool_()->FindFileByName(std::string(module));
        if (file == nullptr) {
            continue; // not built
        }
        for (int i = 0; i < file->service_count(); ++i) {
            out.push_back(file->service(i));
        }
    }
    return out;
}

} // namespace termlink::core::catalog
