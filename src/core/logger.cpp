#include "clewdr/core/logger.hpp"

#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clewdr {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    constexpr auto kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";
}

void Logger::init(std::string_view name, std::string_view level, std::string_view log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                std::string(log_file)));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", log_file, e.what());
        }
    }

    // Re-initialising replaces the previous logger (config reload, tests).
    spdlog::drop(std::string(name));
    g_logger = std::make_shared<spdlog::logger>(std::string(name), sinks.begin(), sinks.end());
    g_logger->set_pattern(kPattern);
    spdlog::register_logger(g_logger);
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    auto lvl = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off; treat those as info instead.
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    get()->set_level(lvl);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace clewdr
