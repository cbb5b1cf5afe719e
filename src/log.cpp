// =============================================================================
// log.cpp - spdlog logger for the oracle library
// =============================================================================

#include "omni/log.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace omni {
namespace log {

namespace {

constexpr const char* LOGGER_NAME = "omni";
constexpr const char* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::mutex init_mutex;

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(PATTERN);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(init_mutex);
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = make_logger({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()});
        spdlog::register_logger(logger);
    }
    return logger;
}

void init(const std::string& level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
    }

    auto logger = make_logger(std::move(sinks));
    logger->set_level(spdlog::level::from_str(level));

    std::lock_guard<std::mutex> lock(init_mutex);
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
}

} // namespace log
} // namespace omni
