#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>
#include <string>

namespace silo {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide threshold, defined in SiloCore/src/store.cpp. Every store
/// applies configuration::level to it on construction.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

inline const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
        case log_level::off: break;
    }
    return "off";
}

/// Inverse of log_level_name (case-insensitive, "warning" accepted).
/// Throws silo::error for unknown names. Defined in configuration.cpp.
log_level parse_log_level(const std::string& name);

}  // namespace silo

// Lines read "silo/<component> <level>: message", e.g.
//   silo/connection info: Initializing table guild#42:presets
#define SILO_LOG(level, tag, fmt, ...) \
    do { \
        if (silo::log_enabled(level)) { \
            std::fprintf(stderr, "silo/%s %s: " fmt "\n", tag, silo::log_level_name(level), ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) SILO_LOG(silo::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  SILO_LOG(silo::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  SILO_LOG(silo::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) SILO_LOG(silo::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
