#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/descriptor.h>

#include "termlink/core/catalog/capability.hpp"


namespace termlink::core::catalog {

/*
===============================================================================
 termlink::core::catalog::Catalog
===============================================================================

Resolves capability keys to protobuf service descriptors.

The catalog looks services up in the generated descriptor pool, i.e. only
API modules compiled into this build can resolve. A catalog may additionally
be restricted to a deployment manifest (list of module files): services of
modules outside the manifest never resolve, exactly as if the module had not
been built.

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- resolve() honors the alias order of the capability table
- services() lists deployed services in MODULES order, then declaration order
- Lookups are const and side-effect-free (safe to call repeatedly)

===============================================================================
*/

class Catalog {
public:
    // Every API module compiled into the build
    Catalog();

    // Restricted to the given module files (e.g. "mt5_term_api/account.proto")
    explicit Catalog(std::vector<std::string> manifest);

    // Capability key -> first deployed service among its aliases
    [[nodiscard]]
    const google::protobuf::ServiceDescriptor* resolve(std::string_view capability) const noexcept;

    // Fully qualified service name -> descriptor, if deployed
    [[nodiscard]]
    const google::protobuf::ServiceDescriptor* find_service(std::string_view full_name) const noexcept;

    // Every deployed service, in login-discovery scan order
    [[nodiscard]]
    std::vector<const google::protobuf::ServiceDescriptor*> services() const;

    [[nodiscard]]
    inline bool has(std::string_view capability) const noexcept {
        return resolve(capability) != nullptr;
    }

    [[nodiscard]]
    bool deployed(std::string_view module) const noexcept;

    [[nodiscard]]
    inline bool restricted() const noexcept {
        return restricted_;
    }

private:
    bool restricted_;
    std::vector<std::string> manifest_;
};


// Forces the generated descriptors of every built module into the binary.
// Defined next to the generated code; called by the Catalog constructors.
void link_modules() noexcept;

} // namespace termlink::core::catalog
