#pragma once

#include "export.hpp"

#include <cstdint>

namespace capdi {

class container;

/// RAII scope handle returned by container::enter_scope().  While the
/// handle is active its table is the container's active scope (unless a
/// nested scope was entered after it).  Exiting, explicitly or on
/// destruction, discards the table together with any scope still nested
/// inside it and restores the enclosing scope.
///
/// A scope must not outlive the container that created it.
class CAPDI_EXPORT scope {
public:
    ~scope();

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&&) noexcept;
    scope& operator=(scope&&) noexcept;

    /// Leave the scope now.  Idempotent.
    void exit() noexcept;

    /// False once exited (or moved from).
    bool active() const noexcept { return owner_ != nullptr; }

    std::uint64_t id() const noexcept { return id_; }

    /// The container this scope belongs to.
    container& owner() const noexcept { return *owner_; }

private:
    friend class container;
    scope(container& owner, std::uint64_t id) noexcept;

    container* owner_ = nullptr;
    std::uint64_t id_ = 0;
};

} // namespace capdi
