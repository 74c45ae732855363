#pragma once

#include "exceptions.hpp"

#include <string>
#include <utility>
#include <variant>

namespace libmedi {

/// Business-level failure returned by a handler or a short-circuiting
/// behavior.  Not an exception: it travels back to the caller as a value.
struct handler_error {
    std::string code;
    std::string message;

    bool operator==(const handler_error&) const = default;
};

/// Response type for requests that produce no value.
struct unit {
    bool operator==(const unit&) const = default;
};

// ---------------------------------------------------------------
// result<T>: either the handler's response or a handler_error
// ---------------------------------------------------------------

template <typename T>
class result {
public:
    using value_type = T;

    result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    result(handler_error error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /// Access the response.  Throws di_error when the result holds a failure.
    T& value() & {
        check_value();
        return std::get<0>(state_);
    }
    const T& value() const& {
        check_value();
        return std::get<0>(state_);
    }
    T&& value() && {
        check_value();
        return std::get<0>(std::move(state_));
    }

    /// Access the failure.  Throws di_error when the result holds a response.
    const handler_error& error() const& {
        if (ok()) throw di_error("result holds a value, not a handler_error");
        return std::get<1>(state_);
    }
    handler_error&& error() && {
        if (ok()) throw di_error("result holds a value, not a handler_error");
        return std::get<1>(std::move(state_));
    }

private:
    void check_value() const {
        if (!ok()) {
            const auto& err = std::get<1>(state_);
            throw di_error("result holds handler_error [" + err.code + "]: " + err.message);
        }
    }

    std::variant<T, handler_error> state_;
};

} // namespace libmedi
