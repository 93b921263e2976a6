#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace puzzlemint::utils {

/**
 * Process-wide spdlog logger named "puzzlemint".
 *
 * Safe to call from any thread: the logger pointer is swapped atomically by
 * init(), and the first get() without a prior init() builds the default
 * console logger exactly once.
 */
class Logger {
public:
    /**
     * (Re)build the logger
     * @param level trace, debug, info, warn, error, critical or off; anything else means info
     * @param log_to_file Also write to a rotating puzzlemint.log
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> build(const std::string& level, bool log_to_file);

    static std::shared_ptr<spdlog::logger> logger_;
    static std::mutex init_mutex_;
};

} // namespace puzzlemint::utils

#define PUZZLEMINT_LOG_TRACE(...)    puzzlemint::utils::Logger::get()->trace(__VA_ARGS__)
#define PUZZLEMINT_LOG_DEBUG(...)    puzzlemint::utils::Logger::get()->debug(__VA_ARGS__)
#define PUZZLEMINT_LOG_INFO(...)     puzzlemint::utils::Logger::get()->info(__VA_ARGS__)
#define PUZZLEMINT_LOG_WARN(...)     puzzlemint::utils::Logger::get()->warn(__VA_ARGS__)
#define PUZZLEMINT_LOG_ERROR(...)    puzzlemint::utils::Logger::get()->error(__VA_ARGS__)
#define PUZZLEMINT_LOG_CRITICAL(...) puzzlemint::utils::Logger::get()->critical(__VA_ARGS__)
