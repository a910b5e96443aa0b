#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace compass::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& GlobalConfig() {
    static LogConfig config{};
    return config;
}

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

void Configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    GlobalConfig() = config;
}

LogConfig CurrentLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return GlobalConfig();
}

bool IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(LogMutex());
    return static_cast<int>(level) >= static_cast<int>(GlobalConfig().min_level);
}

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(message.level) < static_cast<int>(GlobalConfig().min_level)) {
        return;
    }
    std::cerr << "[" << message.tag << "] ";
    if (message.level != LogLevel::kInfo) {
        std::cerr << ToString(message.level) << " ";
    }
    std::cerr << message.message;
    for (const auto& [key, value] : message.fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::vector<std::pair<std::string, std::string>> fields) {
    LogMessage entry{};
    entry.level = level;
    entry.tag = tag;
    entry.message = message;
    entry.fields = std::move(fields);
    Log(entry);
}

}  // namespace compass::utils
