#include "capdi/scope.hpp"
#include "capdi/container.hpp"

#include <utility>

namespace capdi {

scope::scope(container& owner, std::uint64_t id) noexcept
    : owner_(&owner)
    , id_(id)
{}

scope::~scope() {
    exit();
}

scope::scope(scope&& o) noexcept
    : owner_(std::exchange(o.owner_, nullptr))
    , id_(std::exchange(o.id_, 0))
{}

scope& scope::operator=(scope&& o) noexcept {
    if (this != &o) {
        exit();
        owner_ = std::exchange(o.owner_, nullptr);
        id_ = std::exchange(o.id_, 0);
    }
    return *this;
}

void scope::exit() noexcept {
    if (owner_) {
        owner_->exit_scope(id_);
        owner_ = nullptr;
    }
}

} // namespace capdi
