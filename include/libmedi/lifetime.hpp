#pragma once

#include <string_view>

namespace libmedi {

enum class lifetime_kind {
    singleton,
    scoped,
    transient
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"singleton", "scoped", "transient"};
    return names[static_cast<int>(lt)];
}

} // namespace libmedi
