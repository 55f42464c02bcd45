#include "capdi/container.hpp"
#include "capdi/registry.hpp"
#include "capdi/logging.hpp"
#include "capdi/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <source_location>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace capdi {

using instance_table = std::unordered_map<std::type_index, std::shared_ptr<void>>;

// ---------------------------------------------------------------
// Impl — container state
// ---------------------------------------------------------------

struct scope_frame {
    std::uint64_t id;
    instance_table instances;
};

struct container::impl {
    registry reg;
    container_options options;

    mutable std::recursive_mutex mutex;

    // Lives as long as the container; populated lazily, never overwritten.
    instance_table singletons;

    // Active scope = back().  Tables nest like a stack.  A list, so that
    // exiting a scope can splice frames out without allocating.
    std::list<scope_frame> scopes;
    std::uint64_t next_scope_id = 1;

    // Capabilities currently under construction, outermost first.
    std::vector<std::type_index> construction_path;

    // Instances cached since the outermost resolve began.  Committed when
    // it returns, discarded when it throws.  Scope id 0 = singleton table.
    struct cached_entry {
        std::uint64_t scope_id;
        std::type_index type;
    };
    std::vector<cached_entry> journal;
    std::size_t resolve_depth = 0;

    impl(registry r, container_options opts)
        : reg(std::move(r))
        , options(opts)
    {}

    scope_frame* find_frame(std::uint64_t id) {
        auto it = std::find_if(scopes.begin(), scopes.end(),
                               [&](const scope_frame& f) { return f.id == id; });
        return it == scopes.end() ? nullptr : &*it;
    }

    void rollback(std::vector<std::shared_ptr<void>>& discarded) {
        for (const auto& entry : journal) {
            instance_table* table = &singletons;
            if (entry.scope_id != 0) {
                auto* frame = find_frame(entry.scope_id);
                if (!frame) continue;   // scope already exited
                table = &frame->instances;
            }
            auto node = table->extract(entry.type);
            if (!node.empty()) {
                discarded.push_back(std::move(node.mapped()));
            }
        }
        journal.clear();
    }
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

container::container(container_options options)
    : impl_(std::make_unique<impl>(registry{}, options))
{}

container::container(registry reg, container_options options)
    : impl_(std::make_unique<impl>(std::move(reg), options))
{}

container::~container() = default;

// ---------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------

std::shared_ptr<void> container::resolve_impl(std::type_index type) {
    // Declared before the lock: instances discarded by a failed resolve
    // are destroyed after the mutex is released.
    std::vector<std::shared_ptr<void>> discarded;

    std::lock_guard lock(impl_->mutex);

    if (impl_->resolve_depth > 0) {
        return resolve_entry(type);
    }

    ++impl_->resolve_depth;
    struct depth_guard {
        std::size_t& depth;
        ~depth_guard() { --depth; }
    } guard{impl_->resolve_depth};

    try {
        auto instance = resolve_entry(type);
        impl_->journal.clear();
        return instance;
    } catch (...) {
        if (!impl_->journal.empty()) {
            logger()->debug("discarding {} instance(s) cached by the failed resolve",
                            impl_->journal.size());
        }
        impl_->rollback(discarded);
        throw;
    }
}

std::shared_ptr<void> container::resolve_entry(std::type_index type) {
    auto desc = impl_->reg.find_shared(type);
    if (!desc) {
        throw unregistered_capability(type);
    }

    switch (desc->lifetime) {
        case lifetime_kind::singleton: {
            auto it = impl_->singletons.find(type);
            if (it != impl_->singletons.end()) {
                if (impl_->options.log_cache_hits) {
                    logger()->trace("singleton hit: {}", internal::describe(*desc));
                }
                return it->second;
            }
            auto instance = construct(*desc);
            auto [slot, inserted] = impl_->singletons.try_emplace(type, std::move(instance));
            if (inserted) {
                impl_->journal.push_back({0, type});
            }
            return slot->second;
        }

        case lifetime_kind::scoped: {
            if (impl_->scopes.empty()) {
                throw no_active_scope(type);
            }
            // The producer may enter or exit scopes of its own, so the
            // active frame is found again by id after construction.
            const auto frame_id = impl_->scopes.back().id;
            auto& table = impl_->scopes.back().instances;
            auto it = table.find(type);
            if (it != table.end()) {
                if (impl_->options.log_cache_hits) {
                    logger()->trace("scoped hit: {} (scope #{})", internal::describe(*desc), frame_id);
                }
                return it->second;
            }
            auto instance = construct(*desc);
            if (auto* frame = impl_->find_frame(frame_id)) {
                auto [slot, inserted] = frame->instances.try_emplace(type, std::move(instance));
                if (inserted) {
                    impl_->journal.push_back({frame_id, type});
                }
                return slot->second;
            }
            return instance;
        }

        case lifetime_kind::per_request:
            return construct(*desc);
    }

    throw di_error("Invalid lifetime_kind");
}

std::shared_ptr<void> container::try_resolve_impl(std::type_index type) {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->reg.contains(type)) {
        return nullptr;
    }
    return resolve_impl(type);
}

std::shared_ptr<void> container::construct(const descriptor& desc) {
    auto& path = impl_->construction_path;

    if (impl_->options.detect_cycles) {
        auto it = std::find(path.begin(), path.end(), desc.capability);
        if (it != path.end()) {
            std::vector<std::type_index> cycle(it, path.end());
            cycle.push_back(desc.capability);
            auto ex = cyclic_dependency(cycle);
            ex.set_diagnostic_detail(internal::format_registration_trace(desc));
            throw ex;
        }
    }

    path.push_back(desc.capability);
    struct path_guard {
        std::vector<std::type_index>& path;
        ~path_guard() { path.pop_back(); }
    } guard{path};

    auto log = logger();
    std::shared_ptr<void> instance;
    try {
        instance = desc.factory(*this, desc.fixed);
    } catch (di_error& e) {
        // Annotate with resolution context so nested failures show the
        // full chain: "... (while resolving C -> B)".  Caught by
        // non-const reference so the exception can be enriched before
        // it is rethrown.
        e.append_resolution_context(internal::describe(desc));
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(desc);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        log->debug("resolution of {} failed: {}", internal::describe(desc), e.what());
        throw;
    } catch (const std::exception& e) {
        auto ex = construction_failed(desc.capability, e, std::current_exception(),
                                      desc.registration_location);
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        log->debug("construction of {} failed: {}", internal::describe(desc), e.what());
        throw ex;
    } catch (...) {
        auto ex = construction_failed(desc.capability, "producer threw a non-standard exception",
                                      std::current_exception(), desc.registration_location);
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }

    if (!instance) {
        throw construction_failed(desc.capability, "producer returned an empty instance",
                                  nullptr, desc.registration_location);
    }

    if (log->should_log(spdlog::level::debug)) {
        log->debug("constructed {} ({})", internal::describe(desc), to_string(desc.lifetime));
    }
    return instance;
}

bool container::is_registered(std::type_index type) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->reg.contains(type);
}

// ---------------------------------------------------------------
// Scopes
// ---------------------------------------------------------------

scope container::enter_scope() {
    std::lock_guard lock(impl_->mutex);
    const auto id = impl_->next_scope_id++;
    impl_->scopes.push_back(scope_frame{id, {}});
    logger()->debug("entered scope #{} (depth {})", id, impl_->scopes.size());
    return scope(*this, id);
}

void container::exit_scope(std::uint64_t id) noexcept {
    // Declared before the lock: scoped instances are destroyed after the
    // mutex is released.
    std::list<scope_frame> released;

    std::lock_guard lock(impl_->mutex);
    auto& frames = impl_->scopes;
    auto it = std::find_if(frames.begin(), frames.end(),
                           [&](const scope_frame& f) { return f.id == id; });
    if (it == frames.end()) {
        return;
    }

    // Scopes still nested inside this one go with it.
    released.splice(released.end(), frames, it, frames.end());
    logger()->debug("exited scope #{} ({} scope(s) released, depth {})",
                    id, released.size(), frames.size());
}

bool container::has_active_scope() const {
    std::lock_guard lock(impl_->mutex);
    return !impl_->scopes.empty();
}

std::size_t container::scope_depth() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->scopes.size();
}

// ---------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------

registry& container::get_registry() noexcept {
    return impl_->reg;
}

const registry& container::get_registry() const noexcept {
    return impl_->reg;
}

const container_options& container::options() const noexcept {
    return impl_->options;
}

} // namespace capdi
