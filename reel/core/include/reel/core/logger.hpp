/**
 * @file logger.hpp
 * @brief Logging utilities wrapping spdlog
 *
 * Provides a thin wrapper around spdlog with convenient macros.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace reel {

/// Initialize logging system (call once at startup)
void initLogging(const std::string& appName, spdlog::level::level_enum level = spdlog::level::info);

/// Get default logger
std::shared_ptr<spdlog::logger> getLogger();

/// Set log level at runtime
void setLogLevel(spdlog::level::level_enum level);

} // namespace reel

#define REEL_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(reel::getLogger(), __VA_ARGS__)
#define REEL_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(reel::getLogger(), __VA_ARGS__)
#define REEL_LOG_INFO(...)     SPDLOG_LOGGER_INFO(reel::getLogger(), __VA_ARGS__)
#define REEL_LOG_WARN(...)     SPDLOG_LOGGER_WARN(reel::getLogger(), __VA_ARGS__)
#define REEL_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(reel::getLogger(), __VA_ARGS__)
#define REEL_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(reel::getLogger(), __VA_ARGS__)
