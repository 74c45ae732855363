#pragma once

#include "export.hpp"
#include "resolver.hpp"

#include <memory>

namespace libmedi {

/// RAII unit of work.  Owns every scoped instance and every transient it
/// resolved; they are released exactly once, in reverse creation order,
/// by dispose() or by the destructor, whichever runs first.
class LIBMEDI_EXPORT scope {
public:
    /// Releases owned instances if dispose() was not called.  dispose()
    /// failures are logged, never thrown from here.
    ~scope();

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&&) noexcept;
    scope& operator=(scope&&) noexcept;

    /// Get the scoped resolver associated with this scope.
    resolver& get_resolver() noexcept;
    const resolver& get_resolver() const noexcept;

    template <typename T>
    T& get() {
        return get_resolver().get<T>();
    }

    /// Release every owned instance now.  Throws disposal_error listing
    /// every failing dispose() after all instances have been released.
    /// Further calls do nothing.
    void dispose();

    bool disposed() const noexcept { return disposed_; }

private:
    friend class resolver;
    explicit scope(std::shared_ptr<resolver> scoped_resolver);

    void release() noexcept;

    std::shared_ptr<resolver> resolver_;
    bool disposed_ = false;
};

} // namespace libmedi
