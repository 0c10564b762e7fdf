/**
 * Tagged stream logging for parcel
 *
 * Usage:
 *   PARCEL_LOG_TAG(Executor);
 *   PARCEL_LOG_INFO(Executor) << "Executing job " << handle;
 *
 * Control:
 *   Compile-time: cmake -DPARCEL_ENABLE_LOGGING=OFF removes every statement
 *   Runtime:      export PARCEL_LOG_LEVEL=debug   (trace|debug|info|warn|error|off)
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace parcel {
namespace logging {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    OFF   = 5
};

struct LogTag {
    const char* name;

    constexpr explicit LogTag(const char* n) : name(n) {}
};

/**
 * @brief Parse a level name as accepted by PARCEL_LOG_LEVEL
 */
std::optional<LogLevel> ParseLogLevel(const std::string& name);

const char* LogLevelToString(LogLevel level);

// Single output point; every line goes to stderr under one mutex
class LogOutput {
public:
    static LogOutput& Instance();

    void Write(const LogTag& tag, LogLevel level, const std::string& message);

    bool ShouldLog(LogLevel level) const {
        return level != LogLevel::OFF && level >= min_level_.load(std::memory_order_relaxed);
    }

    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }
    void SetMinLevel(LogLevel level);

private:
    LogOutput();

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_;
};

inline void SetMinLogLevel(LogLevel level) {
    LogOutput::Instance().SetMinLevel(level);
}

#ifdef PARCEL_ENABLE_LOGGING

template<LogLevel Level>
class LogStream {
public:
    explicit LogStream(const LogTag& tag)
        : tag_(tag), enabled_(LogOutput::Instance().ShouldLog(Level)) {}

    ~LogStream() {
        if (enabled_) {
            LogOutput::Instance().Write(tag_, Level, oss_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            oss_ << value;
        }
        return *this;
    }

private:
    const LogTag& tag_;
    bool enabled_;
    std::ostringstream oss_;
};

#else

template<LogLevel Level>
class LogStream {
public:
    explicit LogStream(const LogTag&) {}

    template<typename T>
    LogStream& operator<<(const T&) {
        return *this;
    }
};

#endif // PARCEL_ENABLE_LOGGING

} // namespace logging
} // namespace parcel

#define PARCEL_LOG_TAG(name) \
    static constexpr ::parcel::logging::LogTag name##Tag(#name)

#define PARCEL_LOG_TRACE(component) \
    ::parcel::logging::LogStream<::parcel::logging::LogLevel::TRACE>(component##Tag)

#define PARCEL_LOG_DEBUG(component) \
    ::parcel::logging::LogStream<::parcel::logging::LogLevel::DEBUG>(component##Tag)

#define PARCEL_LOG_INFO(component) \
    ::parcel::logging::LogStream<::parcel::logging::LogLevel::INFO>(component##Tag)

#define PARCEL_LOG_WARN(component) \
    ::parcel::logging::LogStream<::parcel::logging::LogLevel::WARN>(component##Tag)

#define PARCEL_LOG_ERROR(component) \
    ::parcel::logging::LogStream<::parcel::logging::LogLevel::ERROR>(component##Tag)
