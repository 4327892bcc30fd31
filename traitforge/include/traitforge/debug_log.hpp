#ifndef TRAITFORGE_DEBUG_LOG_HPP
#define TRAITFORGE_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace traitforge {
namespace logging {

enum class Level {
    Debug,
    Info,
    Warn
};

// Receives a formatted line (no trailing newline)
using LogCallback = void (*)(Level level, const char* message);

// When null, output goes to stdout (debug/info) or stderr (warn)
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
    }
    return "?";
}

inline void log_output(Level level, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s",
             level_tag(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else {
        FILE* stream = level == Level::Warn ? stderr : stdout;
        fprintf(stream, "%s\n", full_message);
        fflush(stream);
    }
}

} // namespace logging
} // namespace traitforge

#ifdef TRAITFORGE_ENABLE_DEBUG_OUTPUT
    #define TRAITFORGE_DEBUG(fmt, ...) ::traitforge::logging::log_output(::traitforge::logging::Level::Debug, fmt, ##__VA_ARGS__)
#else
    #define TRAITFORGE_DEBUG(fmt, ...) ((void)0)
#endif

#define TRAITFORGE_INFO(fmt, ...) ::traitforge::logging::log_output(::traitforge::logging::Level::Info, fmt, ##__VA_ARGS__)
#define TRAITFORGE_WARN(fmt, ...) ::traitforge::logging::log_output(::traitforge::logging::Level::Warn, fmt, ##__VA_ARGS__)

#endif // TRAITFORGE_DEBUG_LOG_HPP
