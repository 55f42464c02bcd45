#pragma once

#include "export.hpp"
#include "container.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "type_traits.hpp"

#include <any>
#include <cstddef>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace capdi {

// ---------------------------------------------------------------
// Helpers: bind a single parameter at construction time
// ---------------------------------------------------------------
namespace detail {

/// Convert a fixed parameter value to the declared parameter type.
/// A `const char*` literal is accepted for any type constructible from it.
template <typename T>
T fixed_param_cast(const std::any& value, const std::string& name) {
    if (const auto* p = std::any_cast<T>(&value)) {
        return *p;
    }
    if constexpr (std::is_constructible_v<T, const char*>) {
        if (const auto* s = std::any_cast<const char*>(&value)) {
            return T(*s);
        }
    }
    throw std::invalid_argument("fixed parameter '" + name + "' holds "
                                + internal::demangle(value.type()) + ", expected "
                                + internal::demangle(typeid(T)));
}

template <typename T>
std::shared_ptr<T> bind_param(const dep_param<T>& p, container& c, const fixed_params& fixed) {
    if (!p.name.empty()) {
        if (auto it = fixed.find(p.name); it != fixed.end()) {
            return fixed_param_cast<std::shared_ptr<T>>(it->second, p.name);
        }
    }
    // Only registered capabilities are injected; anything else falls
    // back to the default or fails the enclosing construction.
    if (c.is_registered<T>()) {
        return c.resolve<T>();
    }
    if (p.fallback.has_value()) {
        return *p.fallback;
    }
    throw std::invalid_argument("no value for parameter "
                                + (p.name.empty() ? std::string() : "'" + p.name + "' ")
                                + "of unregistered capability " + internal::demangle(typeid(T)));
}

template <typename T>
T bind_param(const arg_param<T>& p, container&, const fixed_params& fixed) {
    if (auto it = fixed.find(p.name); it != fixed.end()) {
        return fixed_param_cast<T>(it->second, p.name);
    }
    if (p.fallback.has_value()) {
        return *p.fallback;
    }
    throw std::invalid_argument("no value for parameter '" + p.name + "'");
}

template <typename T>
param_info make_param_info(const dep_param<T>& p) {
    return param_info{p.name, std::type_index(typeid(T)), p.fallback.has_value()};
}

template <typename T>
param_info make_param_info(const arg_param<T>& p) {
    return param_info{p.name, std::nullopt, p.fallback.has_value()};
}

template <typename... Params>
std::vector<param_info> make_param_infos(const param_list<Params...>& list) {
    return std::apply([](const auto&... p) {
        return std::vector<param_info>{ make_param_info(p)... };
    }, list.items);
}

template <typename... Deps>
param_list<dep_param<Deps>...> to_param_list(deps_tag<Deps...>) {
    return param_list<dep_param<Deps>...>{std::tuple<dep_param<Deps>...>(dep<Deps>()...)};
}

/// Producer for a constructible type.  Arguments are bound left to right
/// (braced initialisation fixes the order), then TImpl is constructed and
/// stored as a TInterface pointer.
template <typename TInterface, typename TImpl, typename... Params>
factory_fn make_constructor(param_list<Params...> list) {
    return [list = std::move(list)](container& c, const fixed_params& fixed) -> std::shared_ptr<void> {
        auto args = std::apply([&](const auto&... p) {
            return std::tuple<typename Params::inject_type...>{ bind_param(p, c, fixed)... };
        }, list.items);
        std::shared_ptr<TInterface> instance = std::apply([](auto&&... a) {
            return std::make_shared<TImpl>(std::forward<decltype(a)>(a)...);
        }, std::move(args));
        return std::static_pointer_cast<void>(std::move(instance));
    };
}

} // namespace detail

// ---------------------------------------------------------------
// validation_options
// ---------------------------------------------------------------

struct validation_options {
    /// Every named or unnamed dep<I> parameter must have I registered,
    /// unless its name is supplied through fixed_params or it has a
    /// fallback.
    bool check_missing = true;

    /// Reject dependency cycles in the declared parameter graph.
    bool detect_cycles = true;

    /// Reject captive dependencies: a singleton depending on a scoped or
    /// per_request capability, or a scoped capability depending on a
    /// per_request one.
    bool validate_lifetimes = false;
};

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

/// One registration per capability.  Adding a registration for a
/// capability that is already registered replaces it (last write wins).
class CAPDI_EXPORT registry {
public:
    registry();
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    // ===============================================================
    // Constructible-type registration
    // ===============================================================

    /// Zero-parameter registration with explicit lifetime.
    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add(lifetime_kind lifetime, std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime, param_list<>{}, {}, loc, "add");
    }

    /// Registration with a named parameter list and optional fixed values.
    template <typename TInterface, typename TImpl, typename... Params>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, Params...>
    registry& add(lifetime_kind lifetime, param_list<Params...> parameters, fixed_params fixed = {},
                  std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime, std::move(parameters),
                                                std::move(fixed), loc, "add");
    }

    /// Registration with unnamed capability parameters.
    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, dep_param<Deps>...>
    registry& add(lifetime_kind lifetime, deps_tag<Deps...> tag,
                  std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime, detail::to_param_list(tag), {}, loc, "add");
    }

    // -- per_request ------------------------------------------------

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_per_request(std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::per_request, param_list<>{}, {},
                                                loc, "add_per_request");
    }

    template <typename TInterface, typename TImpl, typename... Params>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, Params...>
    registry& add_per_request(param_list<Params...> parameters, fixed_params fixed = {},
                              std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::per_request, std::move(parameters),
                                                std::move(fixed), loc, "add_per_request");
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, dep_param<Deps>...>
    registry& add_per_request(deps_tag<Deps...> tag, std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::per_request, detail::to_param_list(tag), {},
                                                loc, "add_per_request");
    }

    // -- scoped -----------------------------------------------------

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_scoped(std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::scoped, param_list<>{}, {},
                                                loc, "add_scoped");
    }

    template <typename TInterface, typename TImpl, typename... Params>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, Params...>
    registry& add_scoped(param_list<Params...> parameters, fixed_params fixed = {},
                         std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::scoped, std::move(parameters),
                                                std::move(fixed), loc, "add_scoped");
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, dep_param<Deps>...>
    registry& add_scoped(deps_tag<Deps...> tag, std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::scoped, detail::to_param_list(tag), {},
                                                loc, "add_scoped");
    }

    // -- singleton --------------------------------------------------

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_singleton(std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::singleton, param_list<>{}, {},
                                                loc, "add_singleton");
    }

    template <typename TInterface, typename TImpl, typename... Params>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, Params...>
    registry& add_singleton(param_list<Params...> parameters, fixed_params fixed = {},
                            std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::singleton, std::move(parameters),
                                                std::move(fixed), loc, "add_singleton");
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_params<TImpl, dep_param<Deps>...>
    registry& add_singleton(deps_tag<Deps...> tag, std::source_location loc = std::source_location::current()) {
        return register_type<TInterface, TImpl>(lifetime_kind::singleton, detail::to_param_list(tag), {},
                                                loc, "add_singleton");
    }

    // ===============================================================
    // Plain factories and existing instances
    // ===============================================================

    /// Register a factory callable.  It takes no arguments or the owning
    /// container, and is responsible for its own dependencies: fixed
    /// parameters and injection do not apply.
    template <typename TInterface, typename F>
        requires factory_for<F, TInterface>
    registry& add_factory(F fn, lifetime_kind lifetime = lifetime_kind::per_request,
                          std::source_location loc = std::source_location::current()) {
        descriptor desc;
        desc.capability = typeid(TInterface);
        desc.lifetime = lifetime;
        desc.factory = [fn = std::move(fn)](container& c, const fixed_params&) -> std::shared_ptr<void> {
            std::shared_ptr<TInterface> instance;
            if constexpr (std::is_invocable_v<const F&, container&>) {
                instance = fn(c);
            } else {
                instance = fn();
            }
            return std::static_pointer_cast<void>(std::move(instance));
        };
        desc.registration_location = loc;
        desc.registration_stacktrace = internal::capture_stacktrace();
        desc.api_name = "add_factory";
        return add(std::move(desc));
    }

    /// Register an existing object as a singleton.
    template <typename TInterface>
    registry& add_instance(std::shared_ptr<TInterface> instance,
                           std::source_location loc = std::source_location::current()) {
        if (!instance) {
            throw di_error("add_instance requires a non-null instance", loc);
        }
        descriptor desc;
        desc.capability = typeid(TInterface);
        desc.lifetime = lifetime_kind::singleton;
        desc.factory = [instance = std::move(instance)](container&, const fixed_params&) -> std::shared_ptr<void> {
            return std::static_pointer_cast<void>(instance);
        };
        desc.registration_location = loc;
        desc.api_name = "add_instance";
        return add(std::move(desc));
    }

    // ===============================================================
    // Non-template core
    // ===============================================================

    /// Insert or replace the registration for desc.capability.
    registry& add(descriptor desc);

    /// Throws unregistered_capability if absent.
    const descriptor& lookup(std::type_index type) const;

    /// nullptr if absent.
    const descriptor* find(std::type_index type) const;

    bool contains(std::type_index type) const;

    template <typename T>
    bool contains() const { return contains(typeid(T)); }

    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    /// Registered capabilities in registration order (a replaced
    /// registration keeps its original position).
    std::vector<std::type_index> capabilities() const;

    /// Check the declared parameter graph.  Throws unregistered_capability,
    /// cyclic_dependency or lifetime_mismatch.  Plain factories declare no
    /// parameters and are not inspected.
    void validate(validation_options options = {},
                  std::source_location loc = std::source_location::current()) const;

private:
    friend class container;

    template <typename TInterface, typename TImpl, typename... Params>
    registry& register_type(lifetime_kind lifetime, param_list<Params...> parameters,
                            fixed_params fixed, std::source_location loc, const char* api_name) {
        descriptor desc;
        desc.capability = typeid(TInterface);
        desc.lifetime = lifetime;
        desc.parameters = detail::make_param_infos(parameters);
        desc.factory = detail::make_constructor<TInterface, TImpl>(std::move(parameters));
        desc.fixed = std::move(fixed);
        desc.impl_type = std::type_index(typeid(TImpl));
        desc.registration_location = loc;
        desc.registration_stacktrace = internal::capture_stacktrace();
        desc.api_name = api_name;
        return add(std::move(desc));
    }

    /// Shared handle so that a registration replaced mid-construction
    /// stays alive until its producer returns.
    std::shared_ptr<const descriptor> find_shared(std::type_index type) const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace capdi
