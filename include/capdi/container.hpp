#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "scope.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <typeindex>

namespace capdi {

class registry;

struct container_options {
    /// Track the capabilities under construction and throw
    /// cyclic_dependency when one is re-entered.  When false a cyclic
    /// registration recurses until the stack is exhausted.
    bool detect_cycles = true;

    /// Emit a trace-level log line on every singleton/scoped cache hit.
    bool log_cache_hits = false;
};

/// Owns a registry, the singleton table, and the stack of scope tables.
///
/// All state is guarded by one recursive mutex held for the whole of a
/// top-level resolve, so singleton construction is compute-once even
/// under contention.  The scope stack is shared by every caller: threads
/// resolving scoped capabilities concurrently see the same active scope.
class CAPDI_EXPORT container {
public:
    explicit container(container_options options = {});
    explicit container(registry reg, container_options options = {});
    ~container();

    container(const container&) = delete;
    container& operator=(const container&) = delete;
    container(container&&) = delete;
    container& operator=(container&&) = delete;

    // ---------------------------------------------------------------
    // Resolution
    // ---------------------------------------------------------------

    /// Resolve capability T according to its lifetime policy.
    /// Throws unregistered_capability, no_active_scope,
    /// construction_failed or cyclic_dependency.  When it throws, every
    /// instance it cached along the way is discarded again.
    template <typename T>
    std::shared_ptr<T> resolve() {
        return std::static_pointer_cast<T>(resolve_impl(typeid(T)));
    }

    /// Like resolve(), but returns nullptr when T is not registered.
    template <typename T>
    std::shared_ptr<T> try_resolve() {
        return std::static_pointer_cast<T>(try_resolve_impl(typeid(T)));
    }

    template <typename T>
    bool is_registered() const {
        return is_registered(typeid(T));
    }

    bool is_registered(std::type_index type) const;

    // ---------------------------------------------------------------
    // Scopes
    // ---------------------------------------------------------------

    /// Push a new, empty scope table and make it the active scope.
    [[nodiscard]] scope enter_scope();

    bool has_active_scope() const;

    /// Number of scopes currently entered (0 = no active scope).
    std::size_t scope_depth() const;

    // ---------------------------------------------------------------
    // Registration passthrough
    // ---------------------------------------------------------------

    /// Registrations may be added or replaced at any time.  Replacing a
    /// registration never evicts an instance that is already cached.
    registry& get_registry() noexcept;
    const registry& get_registry() const noexcept;

    const container_options& options() const noexcept;

private:
    friend class scope;

    std::shared_ptr<void> resolve_impl(std::type_index type);
    std::shared_ptr<void> resolve_entry(std::type_index type);
    std::shared_ptr<void> try_resolve_impl(std::type_index type);
    std::shared_ptr<void> construct(const descriptor& desc);
    void exit_scope(std::uint64_t id) noexcept;

    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace capdi
