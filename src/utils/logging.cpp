#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace threatweaver::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_write_mutex;

bool NeedsQuoting(const std::string& value) {
    return value.empty() || std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '=';
    });
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
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

void SetLogConfig(const LogConfig& config) {
    g_min_level = config.min_level;
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = g_min_level.load();
    return config;
}

void Log(const LogMessage& msg) {
    if (static_cast<int>(msg.level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << msg.tag << "] ";
    if (msg.level != LogLevel::kInfo) {
        std::cerr << ToString(msg.level) << " ";
    }
    std::cerr << msg.message;
    for (const auto& [key, value] : msg.fields) {
        std::cerr << " " << key << "=";
        if (NeedsQuoting(value)) {
            std::cerr << "\"" << value << "\"";
        } else {
            std::cerr << value;
        }
    }
    std::cerr << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    Log(LogMessage{level, tag, message, {}});
}

}  // namespace threatweaver::utils
