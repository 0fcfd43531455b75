#include "log.hpp"
#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {

std::mutex log_mutex;
std::atomic<LogLevel> min_level{LogLevel::Info};

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string isoTimestamp() {
    time_t now = time(0);
    struct tm utc;
    gmtime_r(&now, &utc);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace

LogLevel parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw std::invalid_argument("Invalid log level: " + name);
}

void setLogLevel(LogLevel level) {
    min_level = level;
}

void logMessage(LogLevel level, const std::string& module, const std::string& message) {
    if (level < min_level.load()) return;

    std::string line = isoTimestamp() + " " + levelName(level) + " [" + module + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (level >= LogLevel::Warn) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}
