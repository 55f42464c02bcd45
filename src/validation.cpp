#include "capdi/registry.hpp"
#include "capdi/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <map>
#include <source_location>
#include <string>
#include <typeindex>
#include <vector>

namespace capdi {

namespace {

/// Capability parameters that still need the registry: named parameters
/// supplied through fixed_params are satisfied without it.
std::vector<std::type_index> injected_capabilities(const descriptor& desc) {
    std::vector<std::type_index> result;
    for (const auto& p : desc.parameters) {
        if (!p.capability.has_value()) continue;
        if (!p.name.empty() && desc.fixed.contains(p.name)) continue;
        result.push_back(p.capability.value());
    }
    return result;
}

// ------------------------------------------------------------------
// Check that every injected capability is registered
// ------------------------------------------------------------------
void check_missing_dependencies(const registry& reg, std::source_location loc) {
    for (auto type : reg.capabilities()) {
        const auto& desc = reg.lookup(type);
        for (const auto& p : desc.parameters) {
            if (!p.capability.has_value() || p.has_default) continue;
            if (!p.name.empty() && desc.fixed.contains(p.name)) continue;
            const auto dep = p.capability.value();
            if (reg.contains(dep)) continue;

            // Tell the user which consumer requires this missing dependency.
            std::string hint = "required by " + internal::describe(desc)
                + " (" + std::string(to_string(desc.lifetime)) + ")";
            if (desc.registration_location.file_name()[0]) {
                hint += " registered at "
                    + std::string(desc.registration_location.file_name())
                    + ":" + std::to_string(desc.registration_location.line());
            }
            auto ex = unregistered_capability(dep, hint, loc);
            ex.set_diagnostic_detail(internal::format_registration_trace(desc));
            throw ex;
        }
    }
}

// ------------------------------------------------------------------
// Lifetime validation (captive dependency check)
// ------------------------------------------------------------------

int longevity(lifetime_kind lt) {
    switch (lt) {
        case lifetime_kind::per_request: return 0;
        case lifetime_kind::scoped:      return 1;
        case lifetime_kind::singleton:   return 2;
    }
    return 0;
}

void check_lifetime_rules(const registry& reg, std::source_location loc) {
    for (auto type : reg.capabilities()) {
        const auto& desc = reg.lookup(type);
        for (auto dep : injected_capabilities(desc)) {
            const auto* dep_desc = reg.find(dep);
            if (!dep_desc) continue;

            // A longer-lived consumer captures one instance of a
            // shorter-lived dependency and never sees a fresh one.
            if (longevity(dep_desc->lifetime) < longevity(desc.lifetime)) {
                auto ex = lifetime_mismatch(desc.capability, to_string(desc.lifetime),
                                            dep, to_string(dep_desc->lifetime),
                                            desc.impl_type, loc);
                ex.set_diagnostic_detail(internal::format_registration_trace(desc));
                throw ex;
            }
        }
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS on the declared parameter graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

void dfs(std::type_index node,
         const registry& reg,
         std::map<std::type_index, visit_state>& states,
         std::vector<std::type_index>& path,
         std::source_location loc) {
    auto& state = states[node];
    if (state == visit_state::done) return;
    if (state == visit_state::in_progress) {
        // Build cycle path from where the node first appears
        auto it = std::find(path.begin(), path.end(), node);
        std::vector<std::type_index> cycle(it, path.end());
        cycle.push_back(node);
        auto ex = cyclic_dependency(cycle, loc);
        std::string detail;
        for (auto& ti : cycle) {
            if (const auto* d = reg.find(ti)) {
                std::string trace = internal::format_registration_trace(*d);
                if (!trace.empty()) {
                    if (!detail.empty()) detail += "\n";
                    detail += trace;
                }
            }
        }
        if (!detail.empty()) ex.set_diagnostic_detail(detail);
        throw ex;
    }

    const auto* desc = reg.find(node);
    if (!desc) {
        state = visit_state::done;
        return;
    }

    state = visit_state::in_progress;
    path.push_back(node);
    for (auto dep : injected_capabilities(*desc)) {
        dfs(dep, reg, states, path, loc);
    }
    path.pop_back();
    states[node] = visit_state::done;
}

void check_cycles(const registry& reg, std::source_location loc) {
    std::map<std::type_index, visit_state> states;
    std::vector<std::type_index> path;

    for (auto type : reg.capabilities()) {
        if (states[type] == visit_state::unvisited) {
            dfs(type, reg, states, path, loc);
        }
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Entry point called by registry::validate
// ------------------------------------------------------------------
void validate_registry(const registry& reg, const validation_options& options,
                       std::source_location loc) {
    if (options.check_missing) {
        check_missing_dependencies(reg, loc);
    }

    if (options.validate_lifetimes) {
        check_lifetime_rules(reg, loc);
    }

    if (options.detect_cycles) {
        check_cycles(reg, loc);
    }
}

} // namespace capdi
