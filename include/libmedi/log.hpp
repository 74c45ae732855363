#pragma once

#include "export.hpp"

#include <memory>

namespace spdlog {
class logger;
} // namespace spdlog

namespace libmedi {

/// Library-wide default logger (spdlog logger named "libmedi", created on
/// first use with a colored stdout sink unless one is already registered).
LIBMEDI_EXPORT std::shared_ptr<spdlog::logger> logger();

/// Replace the default logger.  Containers built afterwards pick it up;
/// build_options::logger overrides it per container.
LIBMEDI_EXPORT void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace libmedi
