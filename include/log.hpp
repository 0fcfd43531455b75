#ifndef LOG_H
#define LOG_H

#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/**
 * @brief Parses a level name (debug, info, warn, error).
 * @throw std::invalid_argument for any other name.
 */
LogLevel parseLogLevel(const std::string& name);

/// @brief Sets the process-wide minimum level. Lines below it are dropped.
void setLogLevel(LogLevel level);

/**
 * @brief Writes one timestamped line for the given module.
 *
 * Debug and info lines go to std::cout, warn and error lines to std::cerr.
 * Safe to call from any thread.
 */
void logMessage(LogLevel level, const std::string& module, const std::string& message);

inline void logDebug(const std::string& module, const std::string& message) {
    logMessage(LogLevel::Debug, module, message);
}
inline void logInfo(const std::string& module, const std::string& message) {
    logMessage(LogLevel::Info, module, message);
}
inline void logWarn(const std::string& module, const std::string& message) {
    logMessage(LogLevel::Warn, module, message);
}
inline void logError(const std::string& module, const std::string& message) {
    logMessage(LogLevel::Error, module, message);
}

#endif // LOG_H
