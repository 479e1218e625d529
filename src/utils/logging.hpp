#pragma once

#include <string>
#include <utility>
#include <vector>

namespace threatweaver::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

// Fields keep insertion order so log lines read the same way every time.
struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

void Log(const LogMessage& msg);
void Log(LogLevel level, const std::string& tag, const std::string& message);

}  // namespace threatweaver::utils
