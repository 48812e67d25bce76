#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace clewdr {

/// Process-wide spdlog logger. Colored stdout always; an additional plain
/// file sink when a log file is configured.
class Logger {
public:
    static void init(std::string_view name = "clewdr",
                     std::string_view level = "info",
                     std::string_view log_file = {});
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace clewdr

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::clewdr::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::clewdr::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::clewdr::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::clewdr::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::clewdr::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::clewdr::Logger::get(), __VA_ARGS__)
