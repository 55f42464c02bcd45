#include "capdi/registry.hpp"
#include "capdi/logging.hpp"
#include "stacktrace_utils.hpp"

#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace capdi {

void validate_registry(const registry& reg, const validation_options& options,
                       std::source_location loc);

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registry::Impl {
    std::unordered_map<std::type_index, std::shared_ptr<const descriptor>> entries;

    // First-registration order, for capabilities() and validation.
    std::vector<std::type_index> order;
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

registry::registry()
    : impl_(std::make_unique<Impl>())
{}

registry::~registry() = default;

registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

// ---------------------------------------------------------------
// Non-template registration core
// ---------------------------------------------------------------

registry& registry::add(descriptor desc) {
    if (!desc.factory) {
        throw di_error("Component factory cannot be empty", desc.registration_location);
    }

    auto type = desc.capability;
    auto entry = std::make_shared<const descriptor>(std::move(desc));
    auto log = logger();

    auto it = impl_->entries.find(type);
    if (it != impl_->entries.end()) {
        if (log->should_log(spdlog::level::warn)) {
            log->warn("replacing registration for {} ({} -> {})",
                      internal::describe(*it->second),
                      to_string(it->second->lifetime),
                      to_string(entry->lifetime));
        }
        it->second = std::move(entry);
        return *this;
    }

    if (log->should_log(spdlog::level::debug)) {
        log->debug("registered {} ({}, via {})", internal::describe(*entry),
                   to_string(entry->lifetime), entry->api_name);
    }
    impl_->entries.emplace(type, std::move(entry));
    impl_->order.push_back(type);
    return *this;
}

const descriptor& registry::lookup(std::type_index type) const {
    const auto* desc = find(type);
    if (!desc) {
        throw unregistered_capability(type);
    }
    return *desc;
}

const descriptor* registry::find(std::type_index type) const {
    auto it = impl_->entries.find(type);
    if (it == impl_->entries.end()) return nullptr;
    return it->second.get();
}

std::shared_ptr<const descriptor> registry::find_shared(std::type_index type) const {
    auto it = impl_->entries.find(type);
    if (it == impl_->entries.end()) return nullptr;
    return it->second;
}

bool registry::contains(std::type_index type) const {
    return impl_->entries.contains(type);
}

std::size_t registry::size() const noexcept {
    return impl_->entries.size();
}

std::vector<std::type_index> registry::capabilities() const {
    return impl_->order;
}

void registry::validate(validation_options options, std::source_location loc) const {
    validate_registry(*this, options, loc);
}

} // namespace capdi
