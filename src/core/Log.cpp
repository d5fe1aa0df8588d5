// =============================================================================
// NeuroField - Logging System Implementation
// =============================================================================

#include "Log.h"

#if NEUROFIELD_PLATFORM_WINDOWS
#include <windows.h>
#endif

namespace NeuroField {

Logger& Logger::instance() {
    static Logger s_instance;
    return s_instance;
}

Logger::Logger()
    : m_output(stderr)
    , m_minLevel(LogLevel::Info)
    , m_useColors(true)
    , m_showTimestamps(true)
{
    m_startTime = std::chrono::steady_clock::now();

#if NEUROFIELD_PLATFORM_WINDOWS
    // Enable ANSI escape sequences on Windows 10+
    HANDLE hConsole = GetStdHandle(STD_ERROR_HANDLE);
    if (hConsole != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(hConsole, &mode)) {
            SetConsoleMode(hConsole, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
        }
    }
#endif
}

void Logger::log(LogLevel level, const char* category, const char* file, int line,
                 const char* format, ...) {
    if (!isEnabled(level)) return;

    va_list args;
    va_start(args, format);
    logImpl(level, category, file, line, format, args);
    va_end(args);
}

void Logger::resetCounters() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_warningCount = 0;
    m_errorCount = 0;
}

void Logger::logImpl(LogLevel level, const char* category, const char* file, int line,
                     const char* format, va_list args) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (level == LogLevel::Warn) {
        ++m_warningCount;
    } else if (level >= LogLevel::Error) {
        ++m_errorCount;
    }

    if (m_showTimestamps) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - m_startTime
        ).count();
        std::fprintf(m_output, "[%8lld.%03lld] ",
            static_cast<long long>(elapsed / 1000), static_cast<long long>(elapsed % 1000));
    }

    if (m_useColors) {
        std::fprintf(m_output, "%s[%s]\033[0m ",
            logLevelColor(level), logLevelToString(level));
    } else {
        std::fprintf(m_output, "[%s] ", logLevelToString(level));
    }

    if (category && category[0] != '\0') {
        std::fprintf(m_output, "[%s] ", category);
    }

    std::vfprintf(m_output, format, args);

    // File and line for warnings and above
    if (level >= LogLevel::Warn && file) {
        const char* filename = file;
        for (const char* p = file; *p; ++p) {
            if (*p == '/' || *p == '\\') filename = p + 1;
        }
        std::fprintf(m_output, " (%s:%d)", filename, line);
    }

    std::fprintf(m_output, "\n");
    std::fflush(m_output);
}

} // namespace NeuroField
