#pragma once

#include <initializer_list>
#include <string>
#include <utility>

namespace reportd::utils {

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

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

using LogField = std::pair<std::string, std::string>;

// Set once at startup; lines below min_level are dropped.
void ConfigureLogging(const LogConfig& config);
bool IsEnabled(LogLevel level);

// Writes "[tag] message key=value ..." to stderr.
void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::initializer_list<LogField> fields = {});

inline void LogDebug(const std::string& tag, const std::string& message,
                     std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kDebug, tag, message, fields);
}

inline void LogInfo(const std::string& tag, const std::string& message,
                    std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kInfo, tag, message, fields);
}

inline void LogWarn(const std::string& tag, const std::string& message,
                    std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kWarn, tag, message, fields);
}

inline void LogError(const std::string& tag, const std::string& message,
                     std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kError, tag, message, fields);
}

std::string MaskSecret(const std::string& value);

}  // namespace reportd::utils
