#include "libmedi/log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace libmedi {

namespace {

constexpr const char* default_logger_name = "libmedi";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current_logger) {
        current_logger = spdlog::get(default_logger_name);
        if (!current_logger) {
            current_logger = spdlog::stdout_color_mt(default_logger_name);
        }
    }
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger = std::move(logger);
}

} // namespace libmedi
