#include "utils/logging.hpp"

#include <iostream>
#include <mutex>

#include "utils/common.hpp"

namespace mailkeep::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config{};

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    const auto lowered = ToLower(value);
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
    return std::nullopt;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_config;
}

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(message.level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    std::cerr << "[" << message.tag << "] ";
    if (message.level == LogLevel::kWarn || message.level == LogLevel::kError) {
        std::cerr << ToString(message.level) << " ";
    }
    std::cerr << message.message;
    for (const auto& [key, value] : message.fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace mailkeep::utils
