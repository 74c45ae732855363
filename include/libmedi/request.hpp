#pragma once

#include "export.hpp"
#include "exceptions.hpp"
#include "result.hpp"

#include <memory>
#include <stop_token>
#include <string>
#include <typeindex>

namespace spdlog {
class logger;
} // namespace spdlog

namespace libmedi {

// ---------------------------------------------------------------
// Request shapes
// ---------------------------------------------------------------

/// Optional base for request shapes.  A shape is any type exposing a
/// `response_type`; the static type of the request value is its identity.
template <typename TResponse>
struct request {
    using response_type = TResponse;
};

/// Shorthand for requests that produce no value.
using command = request<unit>;

template <typename TRequest>
concept request_shape = requires { typename TRequest::response_type; };

template <request_shape TRequest>
using response_t = typename TRequest::response_type;

// ---------------------------------------------------------------
// request_context: what behaviors see of the request in flight
// ---------------------------------------------------------------

struct request_context {
    const void*     request = nullptr;
    std::type_index shape = std::type_index(typeid(void));
    std::stop_token stop_token;
    /// Logger of the container dispatching the request.
    std::shared_ptr<spdlog::logger> logger;

    /// Typed view of the request.  Throws pipeline_error on shape mismatch.
    template <typename TRequest>
    const TRequest& as() const {
        if (shape != std::type_index(typeid(TRequest))) {
            throw pipeline_error("request is a " + internal::demangle(shape)
                                 + ", not a " + internal::demangle(typeid(TRequest)));
        }
        return *static_cast<const TRequest*>(request);
    }

    template <typename TRequest>
    bool is() const noexcept {
        return shape == std::type_index(typeid(TRequest));
    }

    std::string shape_name() const { return internal::demangle(shape); }

    bool stop_requested() const noexcept { return stop_token.stop_requested(); }
};

// ---------------------------------------------------------------
// request_handler<TRequest>: the capability resolved for a shape
// ---------------------------------------------------------------

template <request_shape TRequest>
struct request_handler {
    using request_type  = TRequest;
    using response_type = response_t<TRequest>;

    virtual ~request_handler() = default;

    /// Handle the request.  Business failures are returned as handler_error;
    /// long-running work should observe `stop`.
    virtual result<response_type> handle(const TRequest& request, std::stop_token stop) = 0;
};

} // namespace libmedi
