/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <reel/core/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace reel {

static std::shared_ptr<spdlog::logger> s_logger;
static std::mutex s_loggerMutex;

void initLogging(const std::string& appName, spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);

    auto logger = std::make_shared<spdlog::logger>(appName, console_sink);
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    std::lock_guard lock(s_loggerMutex);
    s_logger = logger;
}

std::shared_ptr<spdlog::logger> getLogger() {
    {
        std::lock_guard lock(s_loggerMutex);
        if (s_logger) {
            return s_logger;
        }
    }
    initLogging("reel", spdlog::level::info);
    std::lock_guard lock(s_loggerMutex);
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    auto logger = getLogger();
    logger->set_level(level);
    for (auto& sink : logger->sinks()) {
        sink->set_level(level);
    }
}

} // namespace reel
