#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace aegis {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<spdlog::logger> g_audit_logger;
std::once_flag g_init_flag;

}  // namespace

void InitLogging(const LogConfig& config) {
    std::call_once(g_init_flag, [&config]() {
        const auto level = static_cast<spdlog::level::level_enum>(config.level);
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (always enabled)
        spdlog::sink_ptr console_sink;
        if (config.console_stderr) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        }
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        // File sink (optional)
        if (config.enable_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(level);
            sinks.push_back(file_sink);
        }

        // Create logger with all sinks
        g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        g_logger->set_level(level);
        g_logger->set_pattern(config.pattern);

        // Audit records go to their own file when one is configured
        if (!config.audit_file_path.empty()) {
            auto audit_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.audit_file_path,
                config.max_file_size,
                config.max_files
            );
            g_audit_logger = std::make_shared<spdlog::logger>(
                absl::StrCat(config.name, ".audit"), audit_sink);
        } else {
            g_audit_logger = std::make_shared<spdlog::logger>(
                absl::StrCat(config.name, ".audit"), sinks.begin(), sinks.end());
        }
        g_audit_logger->set_level(spdlog::level::info);
        g_audit_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

        // Register as default logger
        spdlog::set_default_logger(g_logger);

        // Flush on warn and above
        g_logger->flush_on(spdlog::level::warn);
        g_audit_logger->flush_on(spdlog::level::warn);
    });
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        InitLogging();
    }
    return g_logger;
}

std::shared_ptr<spdlog::logger> GetAuditLogger() {
    if (!g_audit_logger) {
        InitLogging();
    }
    return g_audit_logger;
}

void SetLogLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lower == "trace") return LogLevel::kTrace;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "info") return LogLevel::kInfo;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    if (lower == "critical") return LogLevel::kCritical;
    if (lower == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", absl::string_view(name.data(), name.size())));
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
    if (g_audit_logger) {
        g_audit_logger->flush();
    }
}

void ShutdownLogging() {
    if (g_logger) {
        FlushLogs();
        spdlog::shutdown();
        g_logger.reset();
        g_audit_logger.reset();
    }
}

}  // namespace aegis
