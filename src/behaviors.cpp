#include "libmedi/behaviors.hpp"
#include "libmedi/log.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <utility>

namespace libmedi {

namespace {

long long elapsed_us(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

logging_behavior::logging_behavior() = default;

logging_behavior::logging_behavior(std::shared_ptr<spdlog::logger> log)
    : log_(std::move(log))
{}

erased_result logging_behavior::handle(const request_context& ctx, const next_fn& next) {
    const auto log = log_ ? log_ : ctx.logger ? ctx.logger : libmedi::logger();
    const auto shape = ctx.shape_name();
    const auto start = std::chrono::steady_clock::now();
    log->debug("handling {}", shape);

    try {
        auto outcome = next();
        if (outcome.ok()) {
            log->info("{} handled in {} us", shape, elapsed_us(start));
        } else {
            log->warn("{} failed with [{}] {} after {} us", shape,
                       outcome.error().code, outcome.error().message, elapsed_us(start));
        }
        return outcome;
    } catch (const std::exception& e) {
        log->error("{} threw after {} us: {}", shape, elapsed_us(start), e.what());
        throw;
    }
}

} // namespace libmedi
