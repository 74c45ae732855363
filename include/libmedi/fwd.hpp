#pragma once

/// @file fwd.hpp
/// Forward declarations for the public libmedi types, for headers that only
/// pass them by pointer or reference.

#include "export.hpp"

namespace libmedi {

// lifetime.hpp
enum class lifetime_kind;

// disposable.hpp, erased_ptr.hpp, decorated_ptr.hpp
struct disposable;
struct erased_ptr;
template <typename I>
class decorated_ptr;

// descriptor.hpp
struct build_options;
struct descriptor;

// exceptions.hpp
class di_error;
class configuration_error;
class resolution_error;
class not_found;
class cyclic_dependency;
class pipeline_error;
class disposal_error;

// result.hpp, request.hpp
struct handler_error;
struct unit;
template <typename T>
class result;
template <typename TResponse>
struct request;
struct request_context;

// handler_catalog.hpp, pipeline.hpp
struct handler_descriptor;
class handler_catalog;
struct pipeline_behavior;
struct behavior_options;
struct behavior_descriptor;
class pipeline_composer;

// resolver.hpp, scope.hpp, registry.hpp, mediator.hpp
class resolver;
class scope;
template <typename... Deps>
struct deps_tag;
class registry;
class mediator;

} // namespace libmedi
