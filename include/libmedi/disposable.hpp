#pragma once

namespace libmedi {

/// Implemented by components that hold resources needing explicit release.
///
/// The owning scope (or the container, for singletons) calls dispose()
/// exactly once, in reverse creation order, before destroying the object.
/// dispose() may throw; the failure is collected and the remaining
/// instances are still released.
struct disposable {
    virtual ~disposable() = default;
    virtual void dispose() = 0;
};

} // namespace libmedi
