#pragma once

#include "export.hpp"

#include <cstddef>
#include <optional>
#include <source_location>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libmedi {

struct handler_descriptor {
    std::type_index request_type = std::type_index(typeid(void));
    std::type_index handler_type = std::type_index(typeid(void));   // request_handler<R>
    std::type_index result_type  = std::type_index(typeid(void));
    std::optional<std::type_index> impl_type;
    std::source_location registration_location;
};

// ---------------------------------------------------------------
// handler_catalog: request shape → its single handler
// ---------------------------------------------------------------

class LIBMEDI_EXPORT handler_catalog {
public:
    /// Record a handler.  Duplicates are kept so validate() can report them.
    void register_handler(handler_descriptor handler);

    /// Declare a shape that must end up with exactly one handler.
    void declare_request(std::type_index shape, std::source_location loc);

    /// Reject shapes with more than one handler (duplicate_handler) and
    /// declared shapes with none (missing_handler).
    void validate(std::source_location loc = std::source_location::current()) const;

    /// Handler for `shape`, or nullptr.
    const handler_descriptor* lookup(std::type_index shape) const noexcept;

    /// Handler for `shape`; throws handler_not_found.
    const handler_descriptor& find(std::type_index shape,
                                   std::source_location loc = std::source_location::current()) const;

    /// Every shape with a handler, in registration order.
    std::vector<std::type_index> shapes() const;

    std::size_t size() const noexcept { return index_.size(); }

private:
    std::vector<handler_descriptor> handlers_;
    std::unordered_map<std::type_index, std::size_t> index_;   // last registration
    std::vector<std::pair<std::type_index, std::source_location>> declared_;
};

} // namespace libmedi
