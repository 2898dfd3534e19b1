#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <stdexcept>

using namespace std;

// Global logger instance
Logger logger;

Logger::Logger() : threshold(LogLevel::Info), start(chrono::steady_clock::now()) {}

void Logger::setLevel(LogLevel level) {
    threshold = level;
}

void Logger::debug(const string& message) { log(LogLevel::Debug, message); }
void Logger::info(const string& message)  { log(LogLevel::Info, message); }
void Logger::warn(const string& message)  { log(LogLevel::Warn, message); }
void Logger::error(const string& message) { log(LogLevel::Error, message); }

// Expand a printf format into a string
static string vformat(const char* format, va_list args) {
    char buffer[512];
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(buffer, sizeof(buffer), format, copy);
    va_end(copy);
    if (needed < 0) return string(format);
    if (static_cast<size_t>(needed) < sizeof(buffer)) return string(buffer, needed);

    // Too long for the stack buffer
    string result(needed + 1, '\0');
    vsnprintf(&result[0], result.size(), format, args);
    result.resize(needed);
    return result;
}

void Logger::debugf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Debug, format, args);
    va_end(args);
}

void Logger::infof(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Info, format, args);
    va_end(args);
}

void Logger::warnf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Warn, format, args);
    va_end(args);
}

void Logger::errorf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Error, format, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* format, va_list args) {
    if (level < threshold) return;
    log(level, vformat(format, args));
}

void Logger::log(LogLevel level, const string& message) {
    if (level < threshold) return;

    string line = "[" + formatTimestamp() + "] " + levelName(level) + ": " + message;
    lock_guard<mutex> lock(outputMutex);
    if (level >= LogLevel::Warn) {
        cerr << line << endl;
    } else {
        cout << line << endl;
    }
}

// Format time since start as H:MM:SS.mmm
string Logger::formatTimestamp() const {
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
    long long ms = elapsed % 1000;
    long long seconds = (elapsed / 1000) % 60;
    long long minutes = (elapsed / 60000) % 60;
    long long hours = elapsed / 3600000;
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%lld:%02lld:%02lld.%03lld", hours, minutes, seconds, ms);
    return buffer;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel parseLogLevel(const string& name) {
    string lower = name;
    transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return tolower(c); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    throw runtime_error("Unknown log level: " + name);
}
