#pragma once

#include "export.hpp"
#include "pipeline.hpp"

#include <memory>

namespace spdlog {
class logger;
} // namespace spdlog

namespace libmedi {

/// Logs every dispatch: request shape, outcome and elapsed time.  Register
/// with a low order so it wraps the rest of the chain.
class LIBMEDI_EXPORT logging_behavior : public pipeline_behavior {
public:
    /// Logs through the logger of the container dispatching the request.
    logging_behavior();
    explicit logging_behavior(std::shared_ptr<spdlog::logger> log);

    erased_result handle(const request_context& ctx, const next_fn& next) override;

private:
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace libmedi
