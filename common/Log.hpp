#pragma once
#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Console log shared by all worker threads. Debug/info lines go to stdout,
// warnings and errors to stderr, one whole line at a time.
void setLogLevel(LogLevel level);
bool logEnabled(LogLevel level);
void logLine(LogLevel level, const std::string& message);

inline void logDebug(const std::string& message)   { logLine(LogLevel::Debug, message); }
inline void logInfo(const std::string& message)    { logLine(LogLevel::Info, message); }
inline void logWarning(const std::string& message) { logLine(LogLevel::Warning, message); }
inline void logError(const std::string& message)   { logLine(LogLevel::Error, message); }
