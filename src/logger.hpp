// Facewatch controller.
// Leveled, thread-safe console logging.

#pragma once

#include <atomic>
#include <cstdarg>
#include <chrono>
#include <mutex>
#include <string>

// Log levels
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

class Logger {
public:
    Logger();

    void setLevel(LogLevel level);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Printf-style logging
    void debugf(const char* format, ...);
    void infof(const char* format, ...);
    void warnf(const char* format, ...);
    void errorf(const char* format, ...);

private:
    void log(LogLevel level, const std::string& message);
    void logv(LogLevel level, const char* format, va_list args);
    std::string formatTimestamp() const;
    static const char* levelName(LogLevel level);

    std::atomic<LogLevel> threshold;
    std::chrono::steady_clock::time_point start;
    std::mutex outputMutex;
};

// Parse "debug", "info", "warn" or "error". Throws std::runtime_error otherwise.
LogLevel parseLogLevel(const std::string& name);

// Global logger instance
extern Logger logger;

// Convenience macros
#define LOG_DEBUG(msg) logger.debug(msg)
#define LOG_INFO(msg) logger.info(msg)
#define LOG_WARN(msg) logger.warn(msg)
#define LOG_ERROR(msg) logger.error(msg)

#define LOG_DEBUGF(...) logger.debugf(__VA_ARGS__)
#define LOG_INFOF(...) logger.infof(__VA_ARGS__)
#define LOG_WARNF(...) logger.warnf(__VA_ARGS__)
#define LOG_ERRORF(...) logger.errorf(__VA_ARGS__)
