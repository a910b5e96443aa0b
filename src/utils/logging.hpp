#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace compass::utils {

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

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void Configure(const LogConfig& config);
LogConfig CurrentLogConfig();
bool IsEnabled(LogLevel level);

// Writes "[tag] message key=value ..." to stderr when the level is enabled.
void Log(const LogMessage& message);

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::vector<std::pair<std::string, std::string>> fields = {});

}  // namespace compass::utils
