#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
// Prevent Windows ERROR macro from corrupting LOG_* macros in translation units
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace radex {

// Ordered by verbosity: a message is printed when its level <= g_log_level
enum class LogLevel : int {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4,
};

// Per-category switches, all enabled by default
struct LogCategories {
    bool tlan = true;   // Controller language (TARLAN) interpreter
    bool elan = true;   // Console language (EROS/Tcl) interpreter
    bool exp = true;    // Experiment assembly and CLI
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Redirect all log output to an already opened file (nullptr = stderr).
// The caller keeps ownership of the FILE.
void setLogFile(FILE* file);

// Parse "ERROR", "WARN", "INFO", "DEBUG", "TRACE" (case-insensitive).
// Returns false and leaves level untouched for anything else.
bool parseLogLevel(const char* name, LogLevel& level);
const char* logLevelToString(LogLevel level);

// printf-style logging: "[   1.234] [WARN ] [TLAN] message"
void log(LogLevel level, const char* category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

void vlog(LogLevel level, const char* category, const char* fmt, va_list args);

} // namespace radex

#define RADEX_LOG_CAT(enabled, cat, level, ...)                                \
    do {                                                                        \
        if ((enabled) && ::radex::LogLevel::level <= ::radex::g_log_level) {    \
            ::radex::log(::radex::LogLevel::level, cat, __VA_ARGS__);           \
        }                                                                       \
    } while (0)

#define LOG_TLAN(level, ...) RADEX_LOG_CAT(::radex::g_log_categories.tlan, "TLAN", level, __VA_ARGS__)
#define LOG_ELAN(level, ...) RADEX_LOG_CAT(::radex::g_log_categories.elan, "ELAN", level, __VA_ARGS__)
#define LOG_EXP(level, ...)  RADEX_LOG_CAT(::radex::g_log_categories.exp, "EXP", level, __VA_ARGS__)
