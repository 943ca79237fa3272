#pragma once

#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace fileio {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime (-v raises it to DEBUG)
inline LogLevel g_log_level = LogLevel::WARN;

// Log category enable flags for fine-grained control
struct LogCategories {
    bool arq = true;        // Selective repeater
    bool fileio = true;     // File sessions
    bool link = true;       // Framing, dispatch, transports
    bool sim = false;       // Device simulator (very verbose)
};

inline LogCategories g_log_categories;

// Link receive thread and caller both log; keep their lines whole
inline std::mutex g_log_mutex;

// Set log level
inline void setLogLevel(LogLevel level) {
    g_log_level = level;
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

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "[%s][%s] ", level_str, category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Convenience macros - these compile to nothing when FILEIO_LOG_DISABLE is defined
#ifdef FILEIO_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    fileio::log(fileio::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    fileio::log(fileio::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    fileio::log(fileio::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (fileio::g_log_level >= fileio::LogLevel::DEBUG) \
        fileio::log(fileio::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (fileio::g_log_level >= fileio::LogLevel::TRACE) \
        fileio::log(fileio::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_ARQ(level, fmt, ...) \
    do { if (fileio::g_log_categories.arq) LOG_##level("ARQ", fmt, ##__VA_ARGS__); } while(0)

#define LOG_FILEIO(level, fmt, ...) \
    do { if (fileio::g_log_categories.fileio) LOG_##level("FILEIO", fmt, ##__VA_ARGS__); } while(0)

#define LOG_LINK(level, fmt, ...) \
    do { if (fileio::g_log_categories.link) LOG_##level("LINK", fmt, ##__VA_ARGS__); } while(0)

#define LOG_SIM(level, fmt, ...) \
    do { if (fileio::g_log_categories.sim) LOG_##level("SIM", fmt, ##__VA_ARGS__); } while(0)

} // namespace fileio
