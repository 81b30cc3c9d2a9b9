#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <optional>

namespace callsync {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime
// Default to INFO for release, DEBUG for debug builds
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Log category enable flags for fine-grained control
struct LogCategories {
    bool tracker = true;    // Poll diff and command arbitration
    bool call = true;       // Call aggregation
    bool radio = true;      // Radio link commands and results
    bool loop = false;      // Event loop scheduling (very verbose)
};

inline LogCategories g_log_categories;

// Set log level
inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::NONE:  return "none";
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::TRACE: return "trace";
        default: return "unknown";
    }
}

// Parse a level name as written in settings files ("info", "debug", ...)
inline std::optional<LogLevel> parseLogLevel(const char* name) {
    for (LogLevel level : {LogLevel::NONE, LogLevel::ERROR, LogLevel::WARN,
                           LogLevel::INFO, LogLevel::DEBUG, LogLevel::TRACE}) {
        if (strcmp(name, logLevelToString(level)) == 0) {
            return level;
        }
    }
    return std::nullopt;
}

// Core logging function
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    const char* level_str = "";
    switch (level) {
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::WARN:  level_str = "WARN "; break;
        case LogLevel::INFO:  level_str = "INFO "; break;
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::TRACE: level_str = "TRACE"; break;
        default: break;
    }

    fprintf(stderr, "[%s][%s] ", level_str, category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Convenience macros - these compile to nothing when CALLSYNC_LOG_DISABLE is defined
#ifdef CALLSYNC_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    callsync::log(callsync::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    callsync::log(callsync::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    callsync::log(callsync::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (callsync::g_log_level >= callsync::LogLevel::DEBUG) \
        callsync::log(callsync::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (callsync::g_log_level >= callsync::LogLevel::TRACE) \
        callsync::log(callsync::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_TRACKER(level, fmt, ...) \
    do { if (callsync::g_log_categories.tracker) LOG_##level("TRACKER", fmt, ##__VA_ARGS__); } while(0)

#define LOG_CALL(level, fmt, ...) \
    do { if (callsync::g_log_categories.call) LOG_##level("CALL", fmt, ##__VA_ARGS__); } while(0)

#define LOG_RADIO(level, fmt, ...) \
    do { if (callsync::g_log_categories.radio) LOG_##level("RADIO", fmt, ##__VA_ARGS__); } while(0)

#define LOG_LOOP(level, fmt, ...) \
    do { if (callsync::g_log_categories.loop) LOG_##level("LOOP", fmt, ##__VA_ARGS__); } while(0)

} // namespace callsync
