#pragma once

#include "export.hpp"
#include "lifetime.hpp"

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <typeindex>
#include <vector>

namespace capdi {

class container;

/// Literal constructor arguments keyed by parameter name.
using fixed_params = std::map<std::string, std::any, std::less<>>;

/// Type-erased producer.  The returned pointer holds the capability's
/// interface pointer (never the implementation pointer), so that
/// `std::static_pointer_cast<I>` round-trips under multiple inheritance.
using factory_fn = std::function<std::shared_ptr<void>(container&, const fixed_params&)>;

namespace internal {
/// Capture the current call stack (empty when stacktrace support is off).
CAPDI_EXPORT std::any capture_stacktrace();
} // namespace internal

// ---------------------------------------------------------------
// param_info — metadata for a single declared constructor parameter
// ---------------------------------------------------------------

struct param_info {
    std::string name;                            // empty = positional only
    std::optional<std::type_index> capability;   // set for dep<I> parameters
    bool has_default = false;

    bool operator==(const param_info&) const = default;
};

// ---------------------------------------------------------------
// descriptor — one capability registration record
// ---------------------------------------------------------------

struct descriptor {
    std::type_index capability = std::type_index(typeid(void));
    lifetime_kind   lifetime   = lifetime_kind::per_request;
    factory_fn      factory;

    // Empty for plain factories: they capture their own dependencies.
    std::vector<param_info> parameters;
    fixed_params    fixed;
    std::optional<std::type_index> impl_type;

    // Diagnostics
    std::source_location registration_location;
    std::any        registration_stacktrace;
    std::string     api_name;
};

} // namespace capdi
