#include "libmedi/scope.hpp"
#include "libmedi/exceptions.hpp"
#include "libmedi/log.hpp"
#include "libmedi/resolver.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace libmedi {

scope::scope(std::shared_ptr<resolver> scoped_resolver)
    : resolver_(std::move(scoped_resolver))
{}

scope::~scope() {
    release();
}

scope::scope(scope&& other) noexcept
    : resolver_(std::move(other.resolver_))
    , disposed_(std::exchange(other.disposed_, true))
{}

scope& scope::operator=(scope&& other) noexcept {
    if (this != &other) {
        release();
        resolver_ = std::move(other.resolver_);
        disposed_ = std::exchange(other.disposed_, true);
    }
    return *this;
}

resolver& scope::get_resolver() noexcept {
    return *resolver_;
}

const resolver& scope::get_resolver() const noexcept {
    return *resolver_;
}

void scope::dispose() {
    if (disposed_ || !resolver_) return;
    disposed_ = true;
    auto failures = resolver_->release_owned();
    if (!failures.empty()) {
        throw disposal_error(std::move(failures));
    }
}

void scope::release() noexcept {
    if (disposed_ || !resolver_) return;
    disposed_ = true;
    // Failures were already logged by release_owned().
    try {
        resolver_->release_owned();
    } catch (const std::exception& e) {
        logger()->error("scope release failed: {}", e.what());
    }
}

} // namespace libmedi
