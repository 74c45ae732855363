#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"

#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace libmedi {

class scope;
class handler_catalog;
class pipeline_composer;
struct behavior_descriptor;

/// Resolution context.  The resolver returned by registry::build() is the
/// root (the container): it owns the singleton cache.  Each scope carries
/// its own resolver that owns the scoped and transient instances it made.
class LIBMEDI_EXPORT resolver : public std::enable_shared_from_this<resolver> {
public:
    ~resolver();

    resolver(const resolver&) = delete;
    resolver& operator=(const resolver&) = delete;

    // ---------------------------------------------------------------
    // Resolution
    // ---------------------------------------------------------------

    /// Resolve a component by interface.  Throws not_found if not registered,
    /// no_active_scope for scoped components requested from the root.
    /// Transients are owned by the resolver that made them: one resolved
    /// directly from the root lives until the container is released, so
    /// repeated transient requests belong on a scope.
    template <typename T>
    T& get() {
        void* p = get_impl(typeid(T));
        if (!p) throw not_found(typeid(T));
        return *static_cast<T*>(p);
    }

    /// Resolve a component; returns nullptr if not registered.  Every other
    /// failure still throws.
    template <typename T>
    T* try_get() {
        return static_cast<T*>(get_impl(typeid(T)));
    }

    /// Resolve by runtime identity.  The pointer is the registered interface
    /// type, erased.  Throws not_found if not registered.
    void* get_by_type(std::type_index type);

    // ---------------------------------------------------------------
    // Scopes
    // ---------------------------------------------------------------

    /// Open a new scope on the container.  Scopes created from a scoped
    /// resolver are siblings, not children: every scope belongs to the root.
    std::unique_ptr<scope> create_scope();

    bool is_root() const noexcept { return parent_ == nullptr; }

    /// True when both resolvers belong to the same container.
    bool shares_container_with(const resolver& other) const noexcept;

    // ---------------------------------------------------------------
    // Container metadata
    // ---------------------------------------------------------------

    const handler_catalog& handlers() const noexcept;
    const pipeline_composer& pipelines() const noexcept;
    const std::vector<descriptor>& descriptors() const noexcept;

    /// Logger this container was built with.
    const std::shared_ptr<spdlog::logger>& get_logger() const noexcept;

    // ---------------------------------------------------------------
    // Internal: used by generated factories (decorators)
    // ---------------------------------------------------------------

    /// Transfer ownership of an instance to this context.  It is released
    /// with the context, in reverse creation order.
    void* adopt(erased_ptr instance, std::type_index type);

private:
    friend class registry;
    friend class scope;

    struct impl;
    struct context;

    static std::shared_ptr<resolver> create(std::vector<descriptor> descriptors,
                                            handler_catalog catalog,
                                            std::vector<behavior_descriptor> behaviors,
                                            std::shared_ptr<spdlog::logger> logger);

    resolver(std::shared_ptr<impl> shared, std::shared_ptr<resolver> parent);

    resolver& root() noexcept;

    // Non-template core implementations
    void* get_impl(std::type_index type);
    void* resolve_index(std::size_t idx);
    void* resolve_cached(std::size_t idx);
    erased_ptr construct(std::size_t idx);

    /// Release every owned instance in reverse creation order, exactly once.
    /// Returns the dispose() failures (also logged).
    std::vector<std::string> release_owned();

    std::shared_ptr<impl> impl_;
    std::shared_ptr<resolver> parent_;   // null for the root
    std::unique_ptr<context> context_;
};

} // namespace libmedi
