#pragma once

// Where a registration came from, for diagnostics.  Shared by the
// registry, the resolver and build validation.  Not installed.

#include "libmedi/descriptor.hpp"

#include <any>
#include <source_location>
#include <string>

namespace libmedi::internal {

/// Render a stacktrace captured by capture_stacktrace().  Empty when none
/// was captured or support is compiled out.
std::string format_stacktrace(const std::any& st);

/// "Registered at file.cpp:42 via add_scoped (IRepo [impl: SqlRepo])"
/// followed by the captured call stack.  Empty without a call stack.
std::string format_registration_trace(const descriptor& desc);

/// "file.cpp:42", or "<unknown>" for a default source_location.
std::string format_location(const std::source_location& loc);

} // namespace libmedi::internal
