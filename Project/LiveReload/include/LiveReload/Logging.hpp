#pragma once

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace ReloadLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    struct LogSettings {
        LogLevel level = LogLevel::Info;
        std::string filePath;   // empty = console only
    };

    // Initialize the logging system. Safe to call again after Shutdown().
    bool Initialize(const LogSettings& settings = LogSettings{});

    // Shutdown the logging system
    void Shutdown();

    bool IsInitialized();

    void SetLevel(LogLevel level);

    // "trace", "debug", "info", "warn", "error", "critical" (case-insensitive).
    bool ParseLogLevel(const std::string& text, LogLevel& out);
    const char* ToString(LogLevel level);

    // Logging functions
    void LogTrace(const std::string& message);
    void LogDebug(const std::string& message);
    void LogInfo(const std::string& message);
    void LogWarn(const std::string& message);
    void LogError(const std::string& message);
    void LogCritical(const std::string& message);

    void LogInternal(LogLevel level, const std::string& message);

    template <typename... Args>
    std::string Concat(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    // Print("a", 1) logs at Info; Print(LogLevel::Warn, "a", 1) at the given level.
    template <typename First, typename... Rest>
    void Print(First&& first, Rest&&... rest) {
        if constexpr (std::is_same_v<std::decay_t<First>, LogLevel>) {
            LogInternal(first, Concat(std::forward<Rest>(rest)...));
        }
        else {
            LogInternal(LogLevel::Info, Concat(std::forward<First>(first), std::forward<Rest>(rest)...));
        }
    }

}

/**
 * @brief Streams all arguments into one message and logs it.
 *
 * The first argument may be a ReloadLogging::LogLevel; otherwise Info is used.
 * LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Loader] dlopen failed: ", err);
 */
#define LIVERELOAD_PRINT(...) ::ReloadLogging::Print(__VA_ARGS__)
