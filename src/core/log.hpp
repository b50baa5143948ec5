// src/core/log.hpp
// Tagged stderr logging shared by the pump, transport and tool code
//
// Output format matches the rest of the tree:
//   [TAG] LEVEL: message
//
// Runtime level (default WARN) can be raised with set_level() or the
// WSPUMP_LOG_LEVEL environment variable (error|warn|info|debug).
// DEBUG_PRINT is compiled in only with -DDEBUG.

#pragma once

// Debug printing - enable with -DDEBUG
#ifdef DEBUG
#define DEBUG_PRINT(...) do { fprintf(stderr, __VA_ARGS__); fflush(stderr); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#endif

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace wspump {

// Compile-time debug flag - use if constexpr (debug_enabled) instead of #ifdef DEBUG
constexpr bool debug_enabled =
#ifdef DEBUG
    true;
#else
    false;
#endif

namespace log {

enum class Level : int {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    VERBOSE = 3,  // "debug" (DEBUG is a build macro)
};

inline std::atomic<int>& level_storage() {
    static std::atomic<int> level{static_cast<int>(Level::WARN)};
    return level;
}

inline void set_level(Level level) {
    level_storage().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level get_level() {
    return static_cast<Level>(level_storage().load(std::memory_order_relaxed));
}

inline bool enabled(Level level) {
    return static_cast<int>(level) <= level_storage().load(std::memory_order_relaxed);
}

/**
 * Parse a level name (case-sensitive, lower case)
 *
 * @return true and sets out if recognised
 */
inline bool parse_level(const char* name, Level& out) {
    if (!name) return false;
    if (strcmp(name, "error") == 0) { out = Level::ERROR; return true; }
    if (strcmp(name, "warn") == 0)  { out = Level::WARN;  return true; }
    if (strcmp(name, "info") == 0)  { out = Level::INFO;  return true; }
    if (strcmp(name, "debug") == 0) { out = Level::VERBOSE; return true; }
    return false;
}

/**
 * Apply WSPUMP_LOG_LEVEL if set. Unknown values are reported and ignored.
 */
inline void init_from_env() {
    const char* value = getenv("WSPUMP_LOG_LEVEL");
    if (!value) return;

    Level level;
    if (parse_level(value, level)) {
        set_level(level);
    } else {
        fprintf(stderr, "[LOG] WARN: Unknown WSPUMP_LOG_LEVEL '%s' (ignored)\n", value);
    }
}

inline const char* level_name(Level level) {
    switch (level) {
        case Level::ERROR: return "ERROR";
        case Level::WARN:  return "WARN";
        case Level::INFO:  return "INFO";
        case Level::VERBOSE: return "DEBUG";
    }
    return "?";
}

[[gnu::format(printf, 3, 4)]]
inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (!enabled(level)) return;

    // Single fprintf per line so concurrent threads do not interleave mid-line
    char msg[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    fprintf(stderr, "[%s] %s: %s\n", tag, level_name(level), msg);
}

/**
 * Log and terminate the process with exit code 1.
 *
 * Only for the top-level tool. Library code reports failures by return value.
 */
[[noreturn]] [[gnu::format(printf, 1, 2)]]
inline void crash(const char* fmt, ...) {
    char msg[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    fprintf(stderr, "[WSPUMP] FATAL: %s\n", msg);
    fflush(stderr);
    exit(1);
}

}  // namespace log
}  // namespace wspump

#define WSPUMP_LOG_ERROR(tag, ...) ::wspump::log::write(::wspump::log::Level::ERROR, tag, __VA_ARGS__)
#define WSPUMP_LOG_WARN(tag, ...)  ::wspump::log::write(::wspump::log::Level::WARN, tag, __VA_ARGS__)
#define WSPUMP_LOG_INFO(tag, ...)  ::wspump::log::write(::wspump::log::Level::INFO, tag, __VA_ARGS__)
#define WSPUMP_LOG_DEBUG(tag, ...) ::wspump::log::write(::wspump::log::Level::VERBOSE, tag, __VA_ARGS__)
