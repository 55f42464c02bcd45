#pragma once

#include <string_view>

namespace capdi {

enum class lifetime_kind {
    per_request,
    scoped,
    singleton
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"per_request", "scoped", "singleton"};
    return names[static_cast<int>(lt)];
}

} // namespace capdi
