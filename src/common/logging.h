#pragma once

/// @file logging.h
/// @brief Aegis logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace aegis {

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
    std::string name = "aegis";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    /// Write console output to stderr, keeping stdout free for results
    bool console_stderr = false;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "aegis.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;

    /// Separate file for guardrail audit records (empty = share the main sinks)
    std::string audit_file_path;
};

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Get the logger that receives guardrail audit records
///
/// Named "<name>.audit". Writes to LogConfig::audit_file_path when set,
/// otherwise to the same sinks as the global logger.
std::shared_ptr<spdlog::logger> GetAuditLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define AEGIS_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::aegis::GetLogger(), __VA_ARGS__)
#define AEGIS_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::aegis::GetLogger(), __VA_ARGS__)
#define AEGIS_LOG_INFO(...) SPDLOG_LOGGER_INFO(::aegis::GetLogger(), __VA_ARGS__)
#define AEGIS_LOG_WARN(...) SPDLOG_LOGGER_WARN(::aegis::GetLogger(), __VA_ARGS__)
#define AEGIS_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::aegis::GetLogger(), __VA_ARGS__)
#define AEGIS_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::aegis::GetLogger(), __VA_ARGS__)

}  // namespace aegis
