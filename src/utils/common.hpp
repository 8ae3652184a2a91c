#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace reportd::utils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline TimePoint Now() {
    return Clock::now();
}

inline long long ToMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint FromMs(long long ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

inline std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

// strftime in UTC, shifted by offset.
inline std::string FormatTime(TimePoint tp, const char* format,
                              std::chrono::minutes offset = std::chrono::minutes(0)) {
    const auto shifted = Clock::to_time_t(tp + offset);
    std::tm tm{};
    gmtime_r(&shifted, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

inline std::string FormatIso8601(TimePoint tp) {
    return FormatTime(tp, "%Y-%m-%dT%H:%M:%SZ");
}

inline std::string HumanBytes(std::uint64_t bytes) {
    static const char* kUnits[] = {"bytes", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1000.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " " << kUnits[0];
    } else {
        oss << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
    }
    return oss.str();
}

std::filesystem::path GetHomePath();
std::string GetEnv(const char* name);
std::string ReadFile(const std::filesystem::path& path);
// Writes to a sibling temp file and renames it over the target.
void WriteFileAtomic(const std::filesystem::path& path, const std::string& content);
std::string RandomHex(std::size_t bytes);

}  // namespace reportd::utils
