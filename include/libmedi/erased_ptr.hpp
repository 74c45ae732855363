#pragma once

#include "disposable.hpp"

#include <type_traits>
#include <utility>

namespace libmedi {

using dispose_fn = void (*)(void*);

// ---------------------------------------------------------------
// erased_ptr: type-erased owning pointer
// ---------------------------------------------------------------

/// Type-erased owning pointer.  Wraps a raw `void*` with a custom deleter
/// and, for components deriving from `disposable`, a dispose hook.
/// `unique_ptr<void, D>` is ill-formed because `void` is incomplete, so we
/// use a thin RAII wrapper instead.
struct erased_ptr {
    void* ptr = nullptr;
    void (*deleter)(void*) = nullptr;
    dispose_fn disposer = nullptr;

    erased_ptr() = default;
    erased_ptr(void* p, void (*d)(void*), dispose_fn disp = nullptr) noexcept
        : ptr(p), deleter(d), disposer(disp) {}

    erased_ptr(erased_ptr&& o) noexcept
        : ptr(o.ptr), deleter(o.deleter), disposer(o.disposer) {
        o.ptr = nullptr;
        o.deleter = nullptr;
        o.disposer = nullptr;
    }
    erased_ptr& operator=(erased_ptr&& o) noexcept {
        if (this != &o) {
            reset();
            ptr = o.ptr;
            deleter = o.deleter;
            disposer = o.disposer;
            o.ptr = nullptr;
            o.deleter = nullptr;
            o.disposer = nullptr;
        }
        return *this;
    }

    erased_ptr(const erased_ptr&) = delete;
    erased_ptr& operator=(const erased_ptr&) = delete;

    ~erased_ptr() { reset(); }

    void reset() noexcept {
        if (ptr && deleter) deleter(ptr);
        ptr = nullptr;
        deleter = nullptr;
        disposer = nullptr;
    }

    /// Run the component's dispose() if it has one.  Memory is not released;
    /// call reset() afterwards.  Exceptions from dispose() propagate.
    void dispose() const {
        if (ptr && disposer) disposer(ptr);
    }

    void* get() const noexcept { return ptr; }
    explicit operator bool() const noexcept { return ptr != nullptr; }
};

namespace detail {

/// Dispose hook for an object stored as `TInterface*`, or nullptr when
/// TImpl is not disposable.
template <typename TInterface, typename TImpl>
dispose_fn disposer_for() noexcept {
    if constexpr (std::is_base_of_v<disposable, TImpl>) {
        return [](void* p) {
            auto* iface = static_cast<TInterface*>(p);
            if constexpr (std::is_base_of_v<disposable, TInterface>) {
                static_cast<disposable*>(iface)->dispose();
            } else {
                dynamic_cast<disposable&>(*iface).dispose();
            }
        };
    } else {
        return nullptr;
    }
}

} // namespace detail

/// Create an erased_ptr that owns a `new TImpl(args...)`, storing the pointer
/// as `TInterface*` in the void*.  This ensures that `static_cast<TInterface*>(void*)`
/// round-trips correctly even under multiple or virtual inheritance.
/// Requires TInterface to have a virtual destructor (when TInterface != TImpl)
/// so that `delete static_cast<TInterface*>(p)` correctly destroys the full object.
template <typename TInterface, typename TImpl, typename... Args>
    requires std::is_base_of_v<TInterface, TImpl>
erased_ptr make_erased_as(Args&&... args) {
    static_assert(std::is_same_v<TInterface, TImpl>
               || std::has_virtual_destructor_v<TInterface>,
        "TInterface must have a virtual destructor when TInterface != TImpl "
        "(required for correct polymorphic deletion via base pointer)");
    auto* impl = new TImpl(std::forward<Args>(args)...);
    return erased_ptr(
        static_cast<void*>(static_cast<TInterface*>(impl)),
        [](void* p) { delete static_cast<TInterface*>(p); },
        detail::disposer_for<TInterface, TImpl>()
    );
}

/// Adopt an object released from a `std::unique_ptr<TInterface>` (user
/// factories).  Deletion goes through `TInterface*`, as the unique_ptr would.
template <typename TInterface>
erased_ptr adopt_erased(TInterface* instance) {
    dispose_fn disp = nullptr;
    if constexpr (std::is_polymorphic_v<TInterface>) {
        if (dynamic_cast<disposable*>(instance) != nullptr) {
            disp = [](void* p) {
                dynamic_cast<disposable&>(*static_cast<TInterface*>(p)).dispose();
            };
        }
    }
    return erased_ptr(
        static_cast<void*>(instance),
        [](void* p) { delete static_cast<TInterface*>(p); },
        disp
    );
}

} // namespace libmedi
