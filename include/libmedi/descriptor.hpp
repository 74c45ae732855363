#pragma once

#include "export.hpp"
#include "erased_ptr.hpp"
#include "lifetime.hpp"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <typeindex>
#include <vector>

namespace spdlog {
class logger;
} // namespace spdlog

namespace libmedi {

class resolver;

using factory_fn = std::function<erased_ptr(resolver&)>;

namespace internal {
/// Capture the current call stack (empty std::any when stacktrace support
/// is compiled out).
LIBMEDI_EXPORT std::any capture_stacktrace();
} // namespace internal

// ---------------------------------------------------------------
// build_options: container configuration applied by registry::build()
// ---------------------------------------------------------------

struct build_options {
    /// Run dependency validation (missing deps, lifetimes, cycles).
    bool validate_on_build = true;
    /// Reject singletons that (directly or through transients) depend on
    /// scoped components.
    bool validate_lifetimes = true;
    /// Reject cyclic dependency graphs at build time.
    bool detect_cycles = true;
    /// Turn "last registration wins" overrides into duplicate_registration.
    bool reject_duplicates = false;
    /// Logger for this container; libmedi::logger() when null.
    std::shared_ptr<spdlog::logger> logger;
};

// ---------------------------------------------------------------
// descriptor: one component registration record
// ---------------------------------------------------------------

struct descriptor {
    std::type_index component_type = std::type_index(typeid(void));
    lifetime_kind   lifetime       = lifetime_kind::transient;
    factory_fn      factory;
    std::vector<std::type_index> dependencies;
    std::optional<std::type_index> impl_type;

    std::source_location registration_location;
    std::any        registration_stacktrace;
    std::string     api_name;          // registering API, for diagnostics
};

} // namespace libmedi
