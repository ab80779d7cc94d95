#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace codeloop::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(std::string value, LogLevel fallback = LogLevel::kInfo) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (value == "debug") {
        return LogLevel::kDebug;
    }
    if (value == "info") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

namespace detail {

inline std::atomic<LogLevel>& MinLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace detail

inline void ConfigureLogging(const LogConfig& config) {
    detail::MinLevel().store(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(detail::MinLevel().load());
}

// Writes "[tag] message" to stderr. Sessions log from several threads, so
// whole lines are serialized.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] ";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        line << ToString(level) << " ";
    }
    line << message;
    std::lock_guard<std::mutex> lock(detail::SinkMutex());
    std::cerr << line.str() << std::endl;
}

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace codeloop::utils
