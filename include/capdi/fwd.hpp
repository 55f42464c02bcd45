#pragma once

/// @file fwd.hpp
/// Forward declarations for all public capdi symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace capdi {

// lifetime.hpp
enum class lifetime_kind;

// descriptor.hpp
struct param_info;
struct descriptor;

// type_traits.hpp
template <typename T>
struct dep_param;
template <typename T>
struct arg_param;
template <typename... Params>
struct param_list;
template <typename... Deps>
struct deps_tag;

// exceptions.hpp
class di_error;
class unregistered_capability;
class no_active_scope;
class construction_failed;
class cyclic_dependency;
class lifetime_mismatch;

// scope.hpp
class scope;

// container.hpp
struct container_options;
class container;

// registry.hpp
struct validation_options;
class registry;

} // namespace capdi
