#include "LiveReload/Logging.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace ReloadLogging {

    // Static instances
    static std::shared_ptr<spdlog::logger> logger;
    static std::mutex loggerMutex;
    static bool initialized = false;

    static spdlog::level::level_enum ToSpdlog(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    bool Initialize(const LogSettings& settings) {
        std::lock_guard<std::mutex> lock(loggerMutex);
        if (initialized) {
            return true;
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(console_sink);

            if (!settings.filePath.empty()) {
                std::filesystem::path logPath(settings.filePath);
                if (logPath.has_parent_path()) {
                    std::filesystem::create_directories(logPath.parent_path());
                }

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.filePath, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            logger = std::make_shared<spdlog::logger>("livereload", sinks.begin(), sinks.end());
            logger->set_level(ToSpdlog(settings.level));
            logger->flush_on(spdlog::level::warn);

            initialized = true;
        }
        catch (const std::exception& ex) {
            // Fall back to spdlog's default logger so messages are not lost.
            logger.reset();
            spdlog::error("Failed to initialize logging system: {}", ex.what());
            return false;
        }

        logger->info("LiveReload logging system initialized");
        return true;
    }

    void Shutdown() {
        std::lock_guard<std::mutex> lock(loggerMutex);
        if (!initialized) {
            return;
        }

        if (logger) {
            logger->info("Shutting down logging system");
            logger->flush();
            logger.reset();
        }
        initialized = false;
    }

    bool IsInitialized() {
        std::lock_guard<std::mutex> lock(loggerMutex);
        return initialized;
    }

    void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(loggerMutex);
        if (logger) {
            logger->set_level(ToSpdlog(level));
        }
        else {
            spdlog::set_level(ToSpdlog(level));
        }
    }

    bool ParseLogLevel(const std::string& text, LogLevel& out) {
        std::string lower(text);
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "trace")         out = LogLevel::Trace;
        else if (lower == "debug")    out = LogLevel::Debug;
        else if (lower == "info")     out = LogLevel::Info;
        else if (lower == "warn" || lower == "warning") out = LogLevel::Warn;
        else if (lower == "error")    out = LogLevel::Error;
        else if (lower == "critical") out = LogLevel::Critical;
        else return false;
        return true;
    }

    const char* ToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return "trace";
            case LogLevel::Debug:    return "debug";
            case LogLevel::Info:     return "info";
            case LogLevel::Warn:     return "warn";
            case LogLevel::Error:    return "error";
            case LogLevel::Critical: return "critical";
        }
        return "info";
    }

    void LogInternal(LogLevel level, const std::string& message) {
        if (message.empty()) {
            return;
        }

        // Callers often end messages with '\n'; spdlog adds its own.
        std::string text = message;
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }

        std::shared_ptr<spdlog::logger> target;
        {
            std::lock_guard<std::mutex> lock(loggerMutex);
            target = logger ? logger : spdlog::default_logger();
        }
        if (!target) {
            return;
        }

        target->log(ToSpdlog(level), text);
    }

    // Public logging functions
    void LogTrace(const std::string& message) {
        LogInternal(LogLevel::Trace, message);
    }

    void LogDebug(const std::string& message) {
        LogInternal(LogLevel::Debug, message);
    }

    void LogInfo(const std::string& message) {
        LogInternal(LogLevel::Info, message);
    }

    void LogWarn(const std::string& message) {
        LogInternal(LogLevel::Warn, message);
    }

    void LogError(const std::string& message) {
        LogInternal(LogLevel::Error, message);
    }

    void LogCritical(const std::string& message) {
        LogInternal(LogLevel::Critical, message);
    }

}
