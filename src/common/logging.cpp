#include "radex/logging.hpp"

#include <cctype>
#include <cstring>
#include <mutex>

namespace radex {

LogLevel g_log_level = LogLevel::WARN;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

static FILE* g_log_file = nullptr;
static std::mutex g_log_mutex;

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

LogLevel getLogLevel() {
    return g_log_level;
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "?????";
    }
}

bool parseLogLevel(const char* name, LogLevel& level) {
    if (!name) return false;

    char upper[16] = {0};
    size_t n = std::strlen(name);
    if (n == 0 || n >= sizeof(upper)) return false;
    for (size_t i = 0; i < n; i++) {
        upper[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[i])));
    }

    if (std::strcmp(upper, "ERROR") == 0) {
        level = LogLevel::ERROR;
    } else if (std::strcmp(upper, "WARN") == 0 || std::strcmp(upper, "WARNING") == 0) {
        level = LogLevel::WARN;
    } else if (std::strcmp(upper, "INFO") == 0) {
        level = LogLevel::INFO;
    } else if (std::strcmp(upper, "DEBUG") == 0) {
        level = LogLevel::DEBUG;
    } else if (std::strcmp(upper, "TRACE") == 0) {
        level = LogLevel::TRACE;
    } else {
        return false;
    }
    return true;
}

void vlog(LogLevel level, const char* category, const char* fmt, va_list args) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - g_log_start_time).count();
    int secs = static_cast<int>(elapsed / 1000);
    int ms = static_cast<int>(elapsed % 1000);

    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;
    std::fprintf(out, "[%4d.%03d] [%s] [%s] %s\n", secs, ms,
                 logLevelToString(level), category ? category : "-", buf);
    std::fflush(out);
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

} // namespace radex
