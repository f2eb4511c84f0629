#pragma once

/// @file logging.h
/// @brief promptguard logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace promptguard {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "promptguard";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    /// Console sink writes to stderr instead of stdout
    bool console_stderr = false;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "promptguard.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
///
/// Only the first call takes effect until ShutdownLogging() is called.
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off"). Unknown names map to kInfo.
LogLevel ParseLogLevel(std::string_view name);

/// @brief Lowercase name of a level, inverse of ParseLogLevel
std::string LogLevelToString(LogLevel level);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define PROMPTGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::promptguard::GetLogger(), __VA_ARGS__)
#define PROMPTGUARD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::promptguard::GetLogger(), __VA_ARGS__)

}  // namespace promptguard
