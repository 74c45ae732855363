#pragma once

#include "export.hpp"

#include <stdexcept>
#include <optional>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace libmedi {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
LIBMEDI_EXPORT std::string demangle(std::type_index type);
} // namespace internal

class LIBMEDI_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a factory throws
    /// during dependency resolution, each enclosing resolver layer appends
    /// its component info so that the final what() message shows the full
    /// resolution chain, e.g.:
    ///   "... (while resolving B [impl: BImpl] -> A [impl: AImpl])"
    /// May be called multiple times for nested resolution chains.
    void append_resolution_context(const std::string& component_info);

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

// ---------------------------------------------------------------
// Configuration errors: raised by registry::build(), abort startup
// ---------------------------------------------------------------

class LIBMEDI_EXPORT configuration_error : public di_error {
public:
    explicit configuration_error(const std::string& message,
                                 std::source_location loc = std::source_location::current());
};

class LIBMEDI_EXPORT duplicate_registration : public configuration_error {
public:
    explicit duplicate_registration(std::type_index type,
                                    std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class LIBMEDI_EXPORT lifetime_mismatch : public configuration_error {
public:
    lifetime_mismatch(std::type_index consumer, std::string_view consumer_lifetime,
                      std::type_index dependency, std::string_view dependency_lifetime,
                      std::optional<std::type_index> consumer_impl = std::nullopt,
                      std::source_location loc = std::source_location::current());

    std::type_index consumer() const noexcept { return consumer_; }
    std::type_index dependency() const noexcept { return dependency_; }

private:
    std::type_index consumer_;
    std::type_index dependency_;

    static std::string build_message(std::type_index consumer, std::string_view consumer_lt,
                                     std::type_index dependency, std::string_view dep_lt,
                                     std::optional<std::type_index> consumer_impl);
};

class LIBMEDI_EXPORT duplicate_handler : public configuration_error {
public:
    duplicate_handler(std::type_index request_type,
                      const std::vector<std::type_index>& handler_impls,
                      std::source_location loc = std::source_location::current());

    std::type_index request_type() const noexcept { return request_type_; }

private:
    std::type_index request_type_;
};

class LIBMEDI_EXPORT missing_handler : public configuration_error {
public:
    explicit missing_handler(std::type_index request_type,
                             std::source_location loc = std::source_location::current());

    std::type_index request_type() const noexcept { return request_type_; }

private:
    std::type_index request_type_;
};

// ---------------------------------------------------------------
// Resolution errors: fatal to the current resolution or dispatch
// ---------------------------------------------------------------

class LIBMEDI_EXPORT resolution_error : public di_error {
public:
    explicit resolution_error(const std::string& message,
                              std::source_location loc = std::source_location::current());
};

class LIBMEDI_EXPORT not_found : public resolution_error {
public:
    explicit not_found(std::type_index type,
                       std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    not_found(std::type_index type, std::string_view hint,
              std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class LIBMEDI_EXPORT cyclic_dependency : public resolution_error {
public:
    explicit cyclic_dependency(const std::vector<std::type_index>& cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<std::type_index>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::type_index> cycle_;
    static std::string build_message(const std::vector<std::type_index>& cycle);
};

class LIBMEDI_EXPORT no_active_scope : public resolution_error {
public:
    explicit no_active_scope(std::type_index type,
                             std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class LIBMEDI_EXPORT handler_not_found : public resolution_error {
public:
    explicit handler_not_found(std::type_index request_type,
                               std::source_location loc = std::source_location::current());

    std::type_index request_type() const noexcept { return request_type_; }

private:
    std::type_index request_type_;
};

/// A component factory threw a non-libmedi exception.
class LIBMEDI_EXPORT construction_error : public resolution_error {
public:
    construction_error(std::type_index type, const std::exception& inner,
                       std::source_location registration_loc);

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

// ---------------------------------------------------------------
// Dispatch and teardown
// ---------------------------------------------------------------

/// A behavior broke the pipeline contract (e.g. called next twice).
class LIBMEDI_EXPORT pipeline_error : public di_error {
public:
    explicit pipeline_error(const std::string& message,
                            std::source_location loc = std::source_location::current());
};

class LIBMEDI_EXPORT operation_cancelled : public di_error {
public:
    explicit operation_cancelled(std::type_index request_type,
                                 std::source_location loc = std::source_location::current());

    std::type_index request_type() const noexcept { return request_type_; }

private:
    std::type_index request_type_;
};

/// One or more dispose() calls failed while a scope or container was
/// released.  Every owned instance was still released.
class LIBMEDI_EXPORT disposal_error : public di_error {
public:
    explicit disposal_error(std::vector<std::string> failures,
                            std::source_location loc = std::source_location::current());

    const std::vector<std::string>& failures() const noexcept { return failures_; }

private:
    std::vector<std::string> failures_;
    static std::string build_message(const std::vector<std::string>& failures);
};

} // namespace libmedi
