#pragma once

#include "export.hpp"
#include "decorated_ptr.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "handler_catalog.hpp"
#include "pipeline.hpp"
#include "request.hpp"
#include "resolver.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <tuple>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace libmedi {

/// A zero-size tag type that carries a compile-time dependency type list.
template <typename... Deps>
struct deps_tag {
    using type_list = std::tuple<Deps...>;
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

namespace detail {

template <typename D>
inject_type_t<D> resolve_dep(resolver& r) {
    return r.get<D>();
}

template <typename... Deps>
std::vector<std::type_index> make_dep_types() {
    return { std::type_index(typeid(Deps))... };
}

template <typename TInterface, typename TImpl, typename... Deps>
factory_fn component_factory() {
    return [](resolver& r) -> erased_ptr {
        return make_erased_as<TInterface, TImpl>(resolve_dep<Deps>(r)...);
    };
}

template <typename TInterface, typename F>
factory_fn adopt_factory(F factory) {
    return [factory = std::move(factory)](resolver& r) mutable -> erased_ptr {
        std::unique_ptr<TInterface> instance = factory(r);
        return adopt_erased<TInterface>(instance.release());
    };
}

template <typename TInterface, typename TDecorator, typename... Extra>
std::function<factory_fn(factory_fn)> decorator_wrapper() {
    return [](factory_fn inner) -> factory_fn {
        return [inner = std::move(inner)](resolver& r) -> erased_ptr {
            // The inner instance joins the decorator's context first, so it
            // is released after the decorator.
            auto* typed = static_cast<TInterface*>(r.adopt(inner(r), typeid(TInterface)));
            return make_erased_as<TInterface, TDecorator>(
                decorated_ptr<TInterface>(*typed),
                resolve_dep<Extra>(r)...);
        };
    };
}

template <typename TBehavior>
pipeline_behavior* as_behavior(void* p) {
    return static_cast<TBehavior*>(p);
}

template <typename TBehavior>
std::optional<std::type_index> bound_shape() {
    if constexpr (shape_bound_behavior<TBehavior>) {
        return std::type_index(typeid(typename TBehavior::request_type));
    } else {
        return std::nullopt;
    }
}

} // namespace detail

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

class LIBMEDI_EXPORT registry {
public:
    registry();
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    // ===============================================================
    // Singleton registration
    // ===============================================================

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_singleton(std::source_location loc = std::source_location::current()) {
        return add_component<TInterface, TImpl>(lifetime_kind::singleton, "add_singleton", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_singleton(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_component<TInterface, TImpl, Deps...>(lifetime_kind::singleton, "add_singleton", loc);
    }

    /// Singleton built by `factory(resolver&)`, which returns `std::unique_ptr<TInterface>`.
    template <typename TInterface, typename F>
        requires factory_for<F, TInterface>
    registry& add_singleton(F factory, std::source_location loc = std::source_location::current()) {
        return add_factory<TInterface>(lifetime_kind::singleton, std::move(factory), {}, "add_singleton", loc);
    }

    template <typename TInterface, typename... Deps, typename F>
        requires factory_for<F, TInterface>
    registry& add_singleton(deps_tag<Deps...>, F factory, std::source_location loc = std::source_location::current()) {
        return add_factory<TInterface>(lifetime_kind::singleton, std::move(factory),
                                       detail::make_dep_types<Deps...>(), "add_singleton", loc);
    }

    // ===============================================================
    // Scoped registration
    // ===============================================================

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_scoped(std::source_location loc = std::source_location::current()) {
        return add_component<TInterface, TImpl>(lifetime_kind::scoped, "add_scoped", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_scoped(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_component<TInterface, TImpl, Deps...>(lifetime_kind::scoped, "add_scoped", loc);
    }

    template <typename TInterface, typename F>
        requires factory_for<F, TInterface>
    registry& add_scoped(F factory, std::source_location loc = std::source_location::current()) {
        return add_factory<TInterface>(lifetime_kind::scoped, std::move(factory), {}, "add_scoped", loc);
    }

    template <typename TInterface, typename... Deps, typename F>
        requires factory_for<F, TInterface>
    registry& add_scoped(deps_tag<Deps...>, F factory, std::source_location loc = std::source_location::current()) {
        return add_factory<TInterface>(lifetime_kind::scoped, std::move(factory),
                                       detail::make_dep_types<Deps...>(), "add_scoped", loc);
    }

    // ===============================================================
    // Transient registration
    // ===============================================================

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_transient(std::source_location loc = std::source_location::current()) {
        return add_component<TInterface, TImpl>(lifetime_kind::transient, "add_transient", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_transient(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_component<TInterface, TImpl, Deps...>(lifetime_kind::transient, "add_transient", loc);
    }

    template <typename TInterface, typename F>
        requires factory_for<F, TInterface>
    registry& add_transient(F factory, std::source_location loc = std::source_location::current()) {
        return add_factory<TInterface>(lifetime_kind::transient, std::move(factory), {}, "add_transient", loc);
    }

    template <typename TInterface, typename... Deps, typename F>
        requires factory_for<F, TInterface>
    registry& add_transient(deps_tag<Deps...>, F factory, std::source_location loc = std::source_location::current()) {
        return add_factory<TInterface>(lifetime_kind::transient, std::move(factory),
                                       detail::make_dep_types<Deps...>(), "add_transient", loc);
    }

    // ===============================================================
    // Decorator registration
    // ===============================================================

    /// Wrap the effective registration of I with D.  Decorators compose in
    /// registration order; the last one registered is outermost.
    template <typename TInterface, typename TDecorator>
        requires derived_from_base<TDecorator, TInterface>
              && decorator_constructible<TDecorator, TInterface>
    registry& decorate(std::source_location loc = std::source_location::current()) {
        static_assert(std::has_virtual_destructor_v<TInterface>,
            "decorate<I,D>: I must have a virtual destructor for decorator registration");
        return register_decorator(typeid(TInterface),
                                  detail::decorator_wrapper<TInterface, TDecorator>(),
                                  {}, loc);
    }

    template <typename TInterface, typename TDecorator, typename... Extra>
        requires derived_from_base<TDecorator, TInterface>
              && decorator_constructible_with_deps<TDecorator, TInterface, Extra...>
    registry& decorate(deps_tag<Extra...>, std::source_location loc = std::source_location::current()) {
        static_assert(std::has_virtual_destructor_v<TInterface>,
            "decorate<I,D>: I must have a virtual destructor for decorator registration");
        return register_decorator(typeid(TInterface),
                                  detail::decorator_wrapper<TInterface, TDecorator, Extra...>(),
                                  detail::make_dep_types<Extra...>(), loc);
    }

    // ===============================================================
    // Handlers and requests
    // ===============================================================

    /// Register THandler as the handler for TRequest.  The handler is
    /// resolved as `request_handler<TRequest>`.
    template <request_shape TRequest, typename THandler>
        requires derived_from_base<THandler, request_handler<TRequest>>
              && default_constructible<THandler>
    registry& add_handler(lifetime_kind lifetime = lifetime_kind::scoped,
                          std::source_location loc = std::source_location::current()) {
        add_component<request_handler<TRequest>, THandler>(lifetime, "add_handler", loc);
        return register_handler(make_handler_descriptor<TRequest, THandler>(loc));
    }

    template <request_shape TRequest, typename THandler, typename... Deps>
        requires derived_from_base<THandler, request_handler<TRequest>>
              && constructible_from_deps<THandler, Deps...>
    registry& add_handler(deps_tag<Deps...>, lifetime_kind lifetime = lifetime_kind::scoped,
                          std::source_location loc = std::source_location::current()) {
        add_component<request_handler<TRequest>, THandler, Deps...>(lifetime, "add_handler", loc);
        return register_handler(make_handler_descriptor<TRequest, THandler>(loc));
    }

    /// Declare a request shape that must have exactly one handler at build.
    template <request_shape TRequest>
    registry& add_request(std::source_location loc = std::source_location::current()) {
        return register_request(typeid(TRequest), loc);
    }

    // ===============================================================
    // Pipeline behaviors
    // ===============================================================

    /// Register a behavior.  Behaviors deriving from typed_behavior<R>
    /// apply to R only; others apply to every shape unless
    /// `options.only` restricts them.  Registering the same behavior type
    /// again replaces the earlier entry.
    template <typename TBehavior>
        requires derived_from_base<TBehavior, pipeline_behavior>
              && default_constructible<TBehavior>
    registry& add_behavior(behavior_options options = {},
                           std::source_location loc = std::source_location::current()) {
        add_component<TBehavior, TBehavior>(options.lifetime, "add_behavior", loc);
        return register_behavior(typeid(TBehavior), &detail::as_behavior<TBehavior>,
                                 detail::bound_shape<TBehavior>(), std::move(options), loc);
    }

    template <typename TBehavior, typename... Deps>
        requires derived_from_base<TBehavior, pipeline_behavior>
              && constructible_from_deps<TBehavior, Deps...>
    registry& add_behavior(deps_tag<Deps...>, behavior_options options = {},
                           std::source_location loc = std::source_location::current()) {
        add_component<TBehavior, TBehavior, Deps...>(options.lifetime, "add_behavior", loc);
        return register_behavior(typeid(TBehavior), &detail::as_behavior<TBehavior>,
                                 detail::bound_shape<TBehavior>(), std::move(options), loc);
    }

    // ===============================================================
    // Build
    // ===============================================================

    /// Validate the registrations and produce the container.  Callable
    /// once; the registry is closed afterwards.
    std::shared_ptr<resolver> build(build_options options = {},
                                    std::source_location loc = std::source_location::current());

    /// Every registration in order, including overridden ones.
    const std::vector<descriptor>& descriptors() const;

    const handler_catalog& handlers() const;

private:
    template <typename TInterface, typename TImpl, typename... Deps>
    registry& add_component(lifetime_kind lifetime, const char* api_name, std::source_location loc) {
        static_assert(std::is_same_v<TInterface, TImpl>
                   || std::has_virtual_destructor_v<TInterface>,
            "I must have a virtual destructor when I != T");
        return register_component(typeid(TInterface), lifetime,
                                  detail::component_factory<TInterface, TImpl, Deps...>(),
                                  detail::make_dep_types<Deps...>(),
                                  std::type_index(typeid(TImpl)), api_name, loc);
    }

    template <typename TInterface, typename F>
    registry& add_factory(lifetime_kind lifetime, F factory,
                          std::vector<std::type_index> dependencies,
                          const char* api_name, std::source_location loc) {
        return register_component(typeid(TInterface), lifetime,
                                  detail::adopt_factory<TInterface>(std::move(factory)),
                                  std::move(dependencies), std::nullopt, api_name, loc);
    }

    template <typename TRequest, typename THandler>
    static handler_descriptor make_handler_descriptor(std::source_location loc) {
        return handler_descriptor{
            .request_type = typeid(TRequest),
            .handler_type = typeid(request_handler<TRequest>),
            .result_type = typeid(response_t<TRequest>),
            .impl_type = std::type_index(typeid(THandler)),
            .registration_location = loc,
        };
    }

    registry& register_component(std::type_index type, lifetime_kind lifetime,
                                 factory_fn factory,
                                 std::vector<std::type_index> dependencies,
                                 std::optional<std::type_index> impl_type,
                                 const char* api_name,
                                 std::source_location loc);

    registry& register_handler(handler_descriptor handler);

    registry& register_request(std::type_index shape, std::source_location loc);

    registry& register_behavior(std::type_index behavior_type,
                                pipeline_behavior* (*as_behavior)(void*),
                                std::optional<std::type_index> bound_shape,
                                behavior_options options,
                                std::source_location loc);

    using decorator_wrapper = std::function<factory_fn(factory_fn)>;

    registry& register_decorator(std::type_index interface_type,
                                 decorator_wrapper wrapper,
                                 std::vector<std::type_index> extra_deps,
                                 std::source_location loc);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace libmedi
