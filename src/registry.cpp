#include "libmedi/registry.hpp"
#include "libmedi/log.hpp"
#include "libmedi/resolver.hpp"
#include "registration_trace.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace libmedi {

void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const build_options& options,
                          std::source_location loc);

namespace {

std::string impl_name(const descriptor& desc) {
    return desc.impl_type.has_value() ? internal::demangle(desc.impl_type.value())
                                      : std::string("factory");
}

} // namespace

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registry::Impl {
    std::vector<descriptor> descriptors;
    bool built = false;

    handler_catalog catalog;

    std::vector<behavior_descriptor> behaviors;
    std::size_t behavior_sequence = 0;

    // Decorator entries stored until build() applies them
    struct DecoratorEntry {
        std::type_index interface_type;
        registry::decorator_wrapper wrapper;
        std::vector<std::type_index> extra_deps;
        std::source_location location;
    };
    std::vector<DecoratorEntry> decorators;

    void ensure_open(const char* what, std::source_location loc) const {
        if (built) {
            throw di_error(std::string("Cannot ") + what + " after build() has been called", loc);
        }
    }
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

registry& registry::register_component(
        std::type_index type, lifetime_kind lifetime,
        factory_fn factory,
        std::vector<std::type_index> dependencies,
        std::optional<std::type_index> impl_type,
        const char* api_name,
        std::source_location loc) {
    impl_->ensure_open("register components", loc);
    if (!factory) {
        throw di_error("Component factory cannot be empty", loc);
    }

    descriptor desc;
    desc.component_type = type;
    desc.lifetime = lifetime;
    desc.factory = std::move(factory);
    desc.dependencies = std::move(dependencies);
    desc.impl_type = std::move(impl_type);
    desc.registration_location = loc;
    desc.registration_stacktrace = internal::capture_stacktrace();
    desc.api_name = api_name;
    impl_->descriptors.push_back(std::move(desc));
    return *this;
}

registry& registry::register_handler(handler_descriptor handler) {
    impl_->ensure_open("register handlers", handler.registration_location);
    impl_->catalog.register_handler(std::move(handler));
    return *this;
}

registry& registry::register_request(std::type_index shape, std::source_location loc) {
    impl_->ensure_open("declare requests", loc);
    impl_->catalog.declare_request(shape, loc);
    return *this;
}

registry& registry::register_behavior(std::type_index behavior_type,
                                      pipeline_behavior* (*as_behavior)(void*),
                                      std::optional<std::type_index> bound_shape,
                                      behavior_options options,
                                      std::source_location loc) {
    impl_->ensure_open("register behaviors", loc);

    std::vector<std::type_index> shapes;
    if (bound_shape.has_value()) {
        bool compatible = options.only.empty()
            || (options.only.size() == 1 && options.only.front() == bound_shape.value());
        if (!compatible) {
            throw configuration_error("Behavior " + internal::demangle(behavior_type)
                                      + " is bound to " + internal::demangle(bound_shape.value())
                                      + " and cannot be restricted to other request shapes", loc);
        }
        shapes.push_back(bound_shape.value());
    } else {
        shapes = std::move(options.only);
        // An explicit subset names shapes that must be handled.
        for (auto shape : shapes) {
            impl_->catalog.declare_request(shape, loc);
        }
    }

    std::erase_if(impl_->behaviors, [&](const behavior_descriptor& b) {
        return b.behavior_type == behavior_type;
    });
    impl_->behaviors.push_back(behavior_descriptor{
        .behavior_type = behavior_type,
        .order = options.order,
        .sequence = impl_->behavior_sequence++,
        .shapes = std::move(shapes),
        .as_behavior = as_behavior,
        .registration_location = loc,
    });
    return *this;
}

registry& registry::register_decorator(
        std::type_index interface_type,
        decorator_wrapper wrapper,
        std::vector<std::type_index> extra_deps,
        std::source_location loc) {
    impl_->ensure_open("register decorators", loc);
    impl_->decorators.push_back({interface_type, std::move(wrapper),
                                 std::move(extra_deps), loc});
    return *this;
}

const std::vector<descriptor>& registry::descriptors() const {
    return impl_->descriptors;
}

const handler_catalog& registry::handlers() const {
    return impl_->catalog;
}

// ---------------------------------------------------------------
// build
// ---------------------------------------------------------------

std::shared_ptr<resolver> registry::build(build_options options, std::source_location loc) {
    if (impl_->built) {
        throw di_error("build() can only be called once", loc);
    }

    auto log = options.logger ? options.logger : libmedi::logger();

    // ① Handler catalog: one handler per shape, declared shapes handled.
    impl_->catalog.validate(loc);

    // ② Collapse to one effective descriptor per capability.  The last
    //    registration wins unless duplicates are rejected.
    std::vector<descriptor> effective;
    std::unordered_map<std::type_index, std::size_t> index;
    for (const auto& desc : impl_->descriptors) {
        auto [it, inserted] = index.try_emplace(desc.component_type, effective.size());
        if (inserted) {
            effective.push_back(desc);
            continue;
        }
        auto& previous = effective[it->second];
        if (options.reject_duplicates) {
            auto ex = duplicate_registration(desc.component_type, desc.registration_location);
            ex.set_diagnostic_detail("first registered at "
                                     + internal::format_location(previous.registration_location));
            throw ex;
        }
        log->warn("{} registered again at {} ({}); it replaces the registration at {} ({})",
                  internal::demangle(desc.component_type),
                  internal::format_location(desc.registration_location), impl_name(desc),
                  internal::format_location(previous.registration_location), impl_name(previous));
        previous = desc;
    }

    // ③ Apply decorators: wrap effective factories in registration order.
    for (const auto& dec : impl_->decorators) {
        auto it = index.find(dec.interface_type);
        if (it == index.end()) {
            throw configuration_error("Cannot decorate "
                                      + internal::demangle(dec.interface_type)
                                      + ": it has no registration", dec.location);
        }
        auto& desc = effective[it->second];
        desc.factory = dec.wrapper(std::move(desc.factory));
        desc.dependencies.insert(desc.dependencies.end(),
                                 dec.extra_deps.begin(), dec.extra_deps.end());
    }

    // ④ Validate the dependency graph before building
    if (options.validate_on_build) {
        validate_descriptors(effective, options, loc);
    }

    auto root = resolver::create(std::move(effective), impl_->catalog,
                                 impl_->behaviors, log);
    impl_->built = true;

    log->debug("container built: {} capabilities, {} handlers, {} behaviors",
               root->descriptors().size(), impl_->catalog.size(), impl_->behaviors.size());
    return root;
}

} // namespace libmedi
