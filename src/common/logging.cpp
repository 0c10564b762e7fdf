#include "parcel/common/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace parcel {
namespace logging {

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off")   return LogLevel::OFF;
    return std::nullopt;
}

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "?????";
    }
}

LogOutput& LogOutput::Instance() {
    static LogOutput instance;
    return instance;
}

LogOutput::LogOutput() : min_level_(LogLevel::INFO) {
    const char* env = std::getenv("PARCEL_LOG_LEVEL");
    if (env != nullptr) {
        if (auto level = ParseLogLevel(env)) {
            min_level_.store(*level);
        }
    }
}

void LogOutput::Write(const LogTag& tag, LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[" << LogLevelToString(level) << "] "
              << "[" << tag.name << "] "
              << message << "\n";
}

void LogOutput::SetMinLevel(LogLevel level) {
    min_level_.store(level, std::memory_order_relaxed);
}

} // namespace logging
} // namespace parcel
