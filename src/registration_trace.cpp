#include "registration_trace.hpp"
#include "libmedi/exceptions.hpp"

#include <sstream>

#ifdef LIBMEDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libmedi::internal {

std::any capture_stacktrace() {
#ifdef LIBMEDI_HAS_STACKTRACE
    // Drop this frame and registry::register_component.
    return std::any(boost::stacktrace::stacktrace(2, static_cast<std::size_t>(-1)));
#else
    return {};
#endif
}

std::string format_stacktrace(const std::any& st) {
#ifdef LIBMEDI_HAS_STACKTRACE
    const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st);
    if (trace != nullptr && !trace->empty()) {
        std::ostringstream oss;
        oss << *trace;
        return oss.str();
    }
#else
    (void)st;
#endif
    return {};
}

std::string format_location(const std::source_location& loc) {
    if (loc.file_name()[0] == '\0') return "<unknown>";
    return std::string(loc.file_name()) + ":" + std::to_string(loc.line());
}

std::string format_registration_trace(const descriptor& desc) {
    std::string trace = format_stacktrace(desc.registration_stacktrace);
    if (trace.empty()) return {};

    std::ostringstream header;
    header << "Registered";
    if (desc.registration_location.file_name()[0] != '\0') {
        header << " at " << format_location(desc.registration_location);
    }
    if (!desc.api_name.empty()) {
        header << " via " << desc.api_name;
    }
    header << " (" << demangle(desc.component_type);
    if (desc.impl_type.has_value()) {
        header << " [impl: " << demangle(desc.impl_type.value()) << "]";
    }
    header << ")\n";
    return header.str() + trace;
}

} // namespace libmedi::internal
