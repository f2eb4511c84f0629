#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>

namespace promptguard {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;

}  // namespace

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always enabled)
    spdlog::sink_ptr console_sink;
    if (config.console_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
    sinks.push_back(console_sink);

    // File sink (optional)
    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        sinks.push_back(file_sink);
    }

    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(static_cast<spdlog::level::level_enum>(config.level));
    g_logger->set_pattern(config.pattern);

    spdlog::set_default_logger(g_logger);

    // Flush on warn and above
    g_logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    InitLogging();
    std::lock_guard<std::mutex> lock(g_init_mutex);
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    if (g_logger) {
        const auto spd_level = static_cast<spdlog::level::level_enum>(level);
        g_logger->set_level(spd_level);
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(spd_level);
        }
    }
}

LogLevel ParseLogLevel(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "trace") {
        return LogLevel::kTrace;
    } else if (lowered == "debug") {
        return LogLevel::kDebug;
    } else if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    } else if (lowered == "error") {
        return LogLevel::kError;
    } else if (lowered == "critical") {
        return LogLevel::kCritical;
    } else if (lowered == "off") {
        return LogLevel::kOff;
    }
    return LogLevel::kInfo;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace: return "trace";
        case LogLevel::kDebug: return "debug";
        case LogLevel::kInfo: return "info";
        case LogLevel::kWarn: return "warn";
        case LogLevel::kError: return "error";
        case LogLevel::kCritical: return "critical";
        case LogLevel::kOff: return "off";
    }
    return "info";
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace promptguard
