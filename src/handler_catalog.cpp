#include "libmedi/handler_catalog.hpp"
#include "libmedi/exceptions.hpp"

#include <algorithm>
#include <map>

namespace libmedi {

void handler_catalog::register_handler(handler_descriptor handler) {
    index_[handler.request_type] = handlers_.size();
    handlers_.push_back(std::move(handler));
}

void handler_catalog::declare_request(std::type_index shape, std::source_location loc) {
    declared_.emplace_back(shape, loc);
}

void handler_catalog::validate(std::source_location loc) const {
    // Group in registration order so the first offending shape is reported.
    std::map<std::type_index, std::vector<std::type_index>> impls_by_shape;
    std::vector<std::type_index> order;
    for (const auto& h : handlers_) {
        auto [it, inserted] = impls_by_shape.try_emplace(h.request_type);
        if (inserted) order.push_back(h.request_type);
        it->second.push_back(h.impl_type.value_or(h.handler_type));
    }

    for (auto shape : order) {
        const auto& impls = impls_by_shape.at(shape);
        if (impls.size() > 1) {
            const auto& last = handlers_[index_.at(shape)];
            throw duplicate_handler(shape, impls,
                last.registration_location.file_name()[0] ? last.registration_location : loc);
        }
    }

    for (const auto& [shape, declared_at] : declared_) {
        if (!index_.contains(shape)) {
            throw missing_handler(shape, declared_at.file_name()[0] ? declared_at : loc);
        }
    }
}

const handler_descriptor* handler_catalog::lookup(std::type_index shape) const noexcept {
    auto it = index_.find(shape);
    if (it == index_.end()) return nullptr;
    return &handlers_[it->second];
}

const handler_descriptor& handler_catalog::find(std::type_index shape,
                                                std::source_location loc) const {
    const auto* h = lookup(shape);
    if (!h) throw handler_not_found(shape, loc);
    return *h;
}

std::vector<std::type_index> handler_catalog::shapes() const {
    std::vector<std::type_index> result;
    result.reserve(index_.size());
    for (const auto& h : handlers_) {
        if (std::find(result.begin(), result.end(), h.request_type) == result.end()) {
            result.push_back(h.request_type);
        }
    }
    return result;
}

} // namespace libmedi
