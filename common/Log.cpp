#include "Log.hpp"
#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_logMutex;

static const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

void logLine(LogLevel level, const std::string& message) {
    if (!logEnabled(level)) return;

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;
    out << stamp << " [" << levelName(level) << "] " << message << "\n";
    out.flush();
}
