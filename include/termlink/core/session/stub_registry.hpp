#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "termlink/core/catalog/capability.hpp"
#include "termlink/core/catalog/catalog.hpp"
#include "termlink/core/session/stub.hpp"
#include "lcr/log/logger.hpp"


namespace termlink::core::session {

// -----------------------------------------------------------------------------
// StubRegistry<Channel>
// -----------------------------------------------------------------------------
//
// Capability key -> attached stub. Entries are added, never replaced, until
// the owning context is torn down. The set of populated keys after
// attach_all() is the effective capability set of the session.
//
template<rpc::ChannelConcept Channel>
class StubRegistry {
public:
    using StubT = Stub<Channel>;

    // Attaches every registry capability whose service is deployed.
    // Absent capabilities are skipped; already attached keys are kept as is.
    // Returns the number of newly attached stubs.
    std::size_t attach_all(const catalog::Catalog& catalog, const std::shared_ptr<Channel>& channel) {
        std::size_t attached = 0;
        for (auto key : catalog::REGISTRY_CAPABILITIES) {
            if (attach(catalog, key, channel)) {
                ++attached;
            }
        }
        TL_DEBUG("[REGISTRY] " << attached << " stub(s) attached, " << stubs_.size() << " total");
        return attached;
    }

    // True only if a new stub was attached
    bool attach(const catalog::Catalog& catalog, std::string_view key, const std::shared_ptr<Channel>& channel) {
        if (contains(key)) {
            return false; // idempotent
        }
        const auto* service = catalog.resolve(key);
        if (service == nullptr) {
            TL_DEBUG("[REGISTRY] '" << key << "' not deployed, skipped");
            return false;
        }
        stubs_.emplace(std::string(key), StubT(key, service, channel));
        TL_DEBUG("[REGISTRY] '" << key << "' -> " << service->full_name());
        return true;
    }

    // Binds an externally discovered stub under `key` (no-op if taken)
    bool bind(std::string_view key, StubT stub) {
        if (contains(key)) {
            return false;
        }
        stubs_.emplace(std::string(key), StubT(key, stub.service(), stub.channel()));
        return true;
    }

    [[nodiscard]]
    inline const StubT* find(std::string_view key) const noexcept {
        auto it = stubs_.find(key);
        return it == stubs_.end() ? nullptr : &it->second;
    }

    [[nodiscard]]
    inline bool contains(std::string_view key) const noexcept {
        return stubs_.find(key) != stubs_.end();
    }

    [[nodiscard]]
    inline bool any_of(std::span<const std::string_view> keys) const noexcept {
        for (auto key : keys) {
            if (contains(key)) {
                return true;
            }
        }
        return false;
    }

    template<class F>
    inline void for_each(F&& fn) const {
        for (const auto& [key, stub] : stubs_) {
            fn(key, stub);
        }
    }

    inline void clear() noexcept { stubs_.clear(); }
    [[nodiscard]] inline std::size_t size() const noexcept { return stubs_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return stubs_.empty(); }

private:
    std::map<std::string, StubT, std::less<>> stubs_;
};

} // namespace termlink::core::session
