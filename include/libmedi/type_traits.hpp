#pragma once

#include "decorated_ptr.hpp"

#include <memory>
#include <type_traits>

namespace libmedi {

class resolver;

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// T is default-constructible (for zero-dependency registrations).
template <typename T>
concept default_constructible = std::is_default_constructible_v<T>;

/// Dependencies are injected as `D&`; the owning context keeps them alive.
template <typename D>
using inject_type_t = D&;

/// TImpl must be constructible from the injection types of all declared deps.
template <typename TImpl, typename... Deps>
concept constructible_from_deps =
    std::is_constructible_v<TImpl, inject_type_t<Deps>...>;

/// F builds a TInterface from the resolver: `std::unique_ptr<TInterface>(resolver&)`.
template <typename F, typename TInterface>
concept factory_for =
    std::is_copy_constructible_v<F>
    && std::is_invocable_r_v<std::unique_ptr<TInterface>, F&, resolver&>;

// ---------------------------------------------------------------
// Decorator concepts
// ---------------------------------------------------------------

/// TDecorator(decorated_ptr<TInterface>) constructible.
template <typename TDecorator, typename TInterface>
concept decorator_constructible =
    std::is_constructible_v<TDecorator, decorated_ptr<TInterface>>;

/// TDecorator(decorated_ptr<TInterface>, inject_type_t<Extra>...) constructible.
template <typename TDecorator, typename TInterface, typename... TExtra>
concept decorator_constructible_with_deps =
    std::is_constructible_v<TDecorator, decorated_ptr<TInterface>, inject_type_t<TExtra>...>;

} // namespace libmedi
