#pragma once

#include "export.hpp"
#include "lifetime.hpp"
#include "request.hpp"
#include "result.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <shared_mutex>
#include <source_location>
#include <stop_token>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libmedi {

/// Response as it travels through the type-erased pipeline.
using erased_result = result<std::any>;

/// Continuation handed to a behavior.  Call it at most once.
using next_fn = std::function<erased_result()>;

// ---------------------------------------------------------------
// pipeline_behavior: cross-cutting wrapper around handler execution
// ---------------------------------------------------------------

/// A behavior either calls `next` exactly once (pass-through or augment)
/// or returns its own result without calling it (short-circuit).
/// Post-processing placed after `next()` runs once the rest of the chain
/// has completed or thrown.
struct pipeline_behavior {
    virtual ~pipeline_behavior() = default;
    virtual erased_result handle(const request_context& ctx, const next_fn& next) = 0;
};

template <typename T>
erased_result erase_result(result<T>&& r) {
    if (!r.ok()) return std::move(r).error();
    return erased_result(std::any(std::move(r).value()));
}

/// Recover the typed response from the erased pipeline.  A behavior that
/// produced a value of the wrong type is a pipeline_error.
template <typename T>
result<T> unerase_result(erased_result&& r) {
    if (!r.ok()) return std::move(r).error();
    if (auto* v = std::any_cast<T>(&r.value())) {
        return result<T>(std::move(*v));
    }
    throw pipeline_error("pipeline produced a response of type "
                         + internal::demangle(std::type_index(r.value().type()))
                         + ", expected " + internal::demangle(typeid(T)));
}

/// Behavior bound to one request shape.  Registered behaviors deriving
/// from this apply to `TRequest` only.
template <request_shape TRequest>
struct typed_behavior : pipeline_behavior {
    using request_type  = TRequest;
    using response_type = response_t<TRequest>;
    using next_delegate = std::function<result<response_type>()>;

    virtual result<response_type> handle_request(const TRequest& request,
                                                 std::stop_token stop,
                                                 const next_delegate& next) = 0;

    erased_result handle(const request_context& ctx, const next_fn& next) final {
        next_delegate typed_next = [&next]() {
            return unerase_result<response_type>(next());
        };
        return erase_result(handle_request(ctx.as<TRequest>(), ctx.stop_token, typed_next));
    }
};

template <typename TBehavior>
concept shape_bound_behavior = requires {
    typename TBehavior::request_type;
} && std::is_base_of_v<typed_behavior<typename TBehavior::request_type>, TBehavior>;

/// Build a shape list for behavior_options::only.
template <request_shape... TRequests>
std::vector<std::type_index> request_types() {
    return { std::type_index(typeid(TRequests))... };
}

// ---------------------------------------------------------------
// behavior registration records
// ---------------------------------------------------------------

struct behavior_options {
    /// Lower runs first (outermost).  Ties run in registration order.
    int order = 0;
    lifetime_kind lifetime = lifetime_kind::transient;
    /// Restrict to these request shapes; empty applies to every shape.
    std::vector<std::type_index> only;
};

struct LIBMEDI_EXPORT behavior_descriptor {
    std::type_index behavior_type = std::type_index(typeid(void));
    int order = 0;
    std::size_t sequence = 0;
    std::vector<std::type_index> shapes;   // empty = all request shapes
    pipeline_behavior* (*as_behavior)(void*) = nullptr;
    std::source_location registration_location;

    bool applies_to(std::type_index shape) const;
};

// ---------------------------------------------------------------
// pipeline_composer: ordered behavior chain per request shape
// ---------------------------------------------------------------

class LIBMEDI_EXPORT pipeline_composer {
public:
    pipeline_composer() = default;
    explicit pipeline_composer(std::vector<behavior_descriptor> behaviors);

    pipeline_composer(const pipeline_composer&) = delete;
    pipeline_composer& operator=(const pipeline_composer&) = delete;

    /// Behaviors applying to `shape`, outermost first.  Sorted by ordering
    /// key, ties by registration order.  The chain is computed once per
    /// shape and cached; the returned reference stays valid for the
    /// composer's lifetime.
    const std::vector<const behavior_descriptor*>& compose(std::type_index shape) const;

    /// Fill the cache for known shapes up front.
    void precompute(const std::vector<std::type_index>& shapes);

    const std::vector<behavior_descriptor>& behaviors() const noexcept { return behaviors_; }

private:
    std::vector<const behavior_descriptor*> build_chain(std::type_index shape) const;

    std::vector<behavior_descriptor> behaviors_;
    mutable std::shared_mutex cache_mutex_;
    mutable std::unordered_map<std::type_index, std::vector<const behavior_descriptor*>> cache_;
};

} // namespace libmedi
