#pragma once

#include <any>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace capdi {

class container;

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// T is default-constructible (for zero-parameter registrations).
template <typename T>
concept default_constructible = std::is_default_constructible_v<T>;

// ---------------------------------------------------------------
// Constructor parameter declarations
// ---------------------------------------------------------------

/// A parameter satisfied by resolving capability T.  The constructor
/// receives `std::shared_ptr<T>`.  A named parameter can be overridden
/// through fixed_params; the value must be exactly a `std::shared_ptr<T>`
/// (use fixed_dep<T>() to store an implementation pointer).  When T is
/// not registered the fallback is used, if one was given.
template <typename T>
struct dep_param {
    using interface_type = T;
    using inject_type    = std::shared_ptr<T>;

    std::string name;
    std::optional<std::shared_ptr<T>> fallback;
};

/// A parameter satisfied only by name: from fixed_params, or else from
/// its default value.  The constructor receives `T`.
template <typename T>
struct arg_param {
    using inject_type = T;

    std::string name;
    std::optional<T> fallback;
};

template <typename T>
dep_param<T> dep(std::string name = {}) {
    return dep_param<T>{std::move(name), std::nullopt};
}

template <typename T>
dep_param<T> dep(std::string name, std::shared_ptr<T> fallback) {
    return dep_param<T>{std::move(name), std::optional<std::shared_ptr<T>>(std::move(fallback))};
}

/// Wrap an instance as the fixed value of a dep<T> parameter.
template <typename T, typename TImpl>
    requires std::is_convertible_v<TImpl*, T*>
std::any fixed_dep(std::shared_ptr<TImpl> instance) {
    return std::any(std::shared_ptr<T>(std::move(instance)));
}

template <typename T>
arg_param<T> arg(std::string name) {
    return arg_param<T>{std::move(name), std::nullopt};
}

template <typename T>
arg_param<T> arg(std::string name, T fallback) {
    return arg_param<T>{std::move(name), std::optional<T>(std::move(fallback))};
}

template <typename P>
struct is_param : std::false_type {};

template <typename T>
struct is_param<dep_param<T>> : std::true_type {};

template <typename T>
struct is_param<arg_param<T>> : std::true_type {};

template <typename P>
concept constructor_param = is_param<P>::value;

/// Ordered constructor parameter list, built with params(...).
template <typename... Params>
struct param_list {
    std::tuple<Params...> items;
};

template <constructor_param... Params>
param_list<Params...> params(Params... ps) {
    return param_list<Params...>{std::tuple<Params...>(std::move(ps)...)};
}

/// A zero-size tag type that carries a compile-time capability list.
/// Each capability becomes an unnamed dep<I>() parameter.
template <typename... Deps>
struct deps_tag {
    using type_list = std::tuple<Deps...>;
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

// ---------------------------------------------------------------
// Constructibility concepts
// ---------------------------------------------------------------

/// TImpl must be constructible from the injection types of all declared parameters.
template <typename TImpl, typename... Params>
concept constructible_from_params =
    std::is_constructible_v<TImpl, typename Params::inject_type...>;

/// F is a plain producer of TInterface: callable with no arguments or
/// with the owning container, yielding something convertible to
/// `std::shared_ptr<TInterface>`.
template <typename F, typename TInterface>
concept factory_for =
    (std::is_invocable_v<const F&>
        && std::is_convertible_v<std::invoke_result_t<const F&>, std::shared_ptr<TInterface>>)
 || (std::is_invocable_v<const F&, container&>
        && std::is_convertible_v<std::invoke_result_t<const F&, container&>, std::shared_ptr<TInterface>>);

} // namespace capdi
