#include "utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include "utils/common.hpp"

namespace scriptbox::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_output_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
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
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << "[" << tag << "] " << ToString(level) << ": " << message << std::endl;
        return;
    }
    std::cerr << "[" << tag << "] " << message << std::endl;
}

}  // namespace scriptbox::utils
