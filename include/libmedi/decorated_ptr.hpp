#pragma once

namespace libmedi {

// ---------------------------------------------------------------
// decorated_ptr<I>: decorator receives this for the wrapped instance
// ---------------------------------------------------------------

/// Non-owning handle to the instance a decorator wraps.
///
/// The inner instance is owned by the same resolution context as the
/// decorator (the container for singletons, the scope otherwise).  It is
/// created first, so it is released after the decorator.
template <typename I>
class decorated_ptr {
public:
    explicit decorated_ptr(I& inner) noexcept : ptr_(&inner) {}

    decorated_ptr(decorated_ptr&& o) noexcept : ptr_(o.ptr_) { o.ptr_ = nullptr; }

    decorated_ptr& operator=(decorated_ptr&& o) noexcept {
        if (this != &o) {
            ptr_ = o.ptr_;
            o.ptr_ = nullptr;
        }
        return *this;
    }

    decorated_ptr(const decorated_ptr&) = delete;
    decorated_ptr& operator=(const decorated_ptr&) = delete;

    I& get() const noexcept { return *ptr_; }
    I* operator->() const noexcept { return ptr_; }
    I& operator*() const noexcept { return *ptr_; }

private:
    I* ptr_ = nullptr;
};

} // namespace libmedi
