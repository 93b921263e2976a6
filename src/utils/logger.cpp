#include "logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace puzzlemint::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::mutex Logger::init_mutex_;

namespace {
    constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
    constexpr size_t LOG_FILE_ROTATIONS = 3;
}

std::shared_ptr<spdlog::logger> Logger::build(const std::string& level, bool log_to_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console);

    if (log_to_file) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "puzzlemint.log", LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("puzzlemint", sinks.begin(), sinks.end());

    // from_str maps unknown names to off
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::err);
    return logger;
}

void Logger::init(const std::string& level, bool log_to_file) {
    auto logger = build(level, log_to_file);

    std::lock_guard<std::mutex> lock(init_mutex_);
    std::atomic_store(&logger_, logger);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    auto logger = std::atomic_load(&logger_);
    if (logger) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(init_mutex_);
    logger = std::atomic_load(&logger_);
    if (!logger) {
        logger = build("info", false);
        std::atomic_store(&logger_, logger);
        spdlog::set_default_logger(logger);
    }
    return logger;
}

} // namespace puzzlemint::utils
