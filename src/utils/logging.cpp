#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace reportd::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

}  // namespace

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::initializer_list<LogField> fields) {
    if (!IsEnabled(level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        line << ToString(level) << " ";
    }
    line << message;
    for (const auto& field : fields) {
        line << " " << field.first << "=" << (field.second.empty() ? "(empty)" : field.second);
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

std::string MaskSecret(const std::string& value) {
    if (value.empty()) {
        return "(empty)";
    }
    if (value.size() <= 4) {
        return "***";
    }
    return value.substr(0, 4) + "***";
}

}  // namespace reportd::utils
