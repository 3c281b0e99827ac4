#pragma once

#include <map>
#include <optional>
#include <string>

namespace mailkeep::utils {

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

std::optional<LogLevel> ParseLogLevel(const std::string& value);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] message key=value ..." to stderr when level passes the filter.
void Log(const LogMessage& message);

inline void LogDebug(std::string tag, std::string message, std::map<std::string, std::string> fields = {}) {
    Log(LogMessage{LogLevel::kDebug, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogInfo(std::string tag, std::string message, std::map<std::string, std::string> fields = {}) {
    Log(LogMessage{LogLevel::kInfo, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogWarn(std::string tag, std::string message, std::map<std::string, std::string> fields = {}) {
    Log(LogMessage{LogLevel::kWarn, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogError(std::string tag, std::string message, std::map<std::string, std::string> fields = {}) {
    Log(LogMessage{LogLevel::kError, std::move(tag), std::move(message), std::move(fields)});
}

}  // namespace mailkeep::utils
