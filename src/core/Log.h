// =============================================================================
// NeuroField - Logging System
// =============================================================================
// Thread-safe logging with severity levels, categories and printf formatting
// =============================================================================

#pragma once

#include "Types.h"
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <chrono>

namespace NeuroField {

// =============================================================================
// Log Severity Levels
// =============================================================================

enum class LogLevel : u8 {
    Trace = 0,   // Per-step detail
    Debug,       // Kernel/grid construction details
    Info,        // Run lifecycle
    Warn,        // Non-fatal numerical concerns
    Error,       // Failed steps and rejected configurations
    Fatal,
    Off          // Disable logging
};

constexpr const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default:              return "?????";
    }
}

constexpr const char* logLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";    // Gray
        case LogLevel::Debug: return "\033[36m";    // Cyan
        case LogLevel::Info:  return "\033[32m";    // Green
        case LogLevel::Warn:  return "\033[33m";    // Yellow
        case LogLevel::Error: return "\033[31m";    // Red
        case LogLevel::Fatal: return "\033[35;1m";  // Bright Magenta
        default:              return "\033[0m";     // Reset
    }
}

// =============================================================================
// Logger Class
// =============================================================================

class Logger : public NonCopyable {
public:
    static Logger& instance();

    void setLevel(LogLevel level) { m_minLevel = level; }
    LogLevel getLevel() const { return m_minLevel; }
    bool isEnabled(LogLevel level) const { return level >= m_minLevel && level != LogLevel::Off; }

    void enableColors(bool enable) { m_useColors = enable; }
    void enableTimestamps(bool enable) { m_showTimestamps = enable; }

    void setOutput(FILE* file) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_output = file;
    }

    void log(LogLevel level, const char* category, const char* file, int line,
             const char* format, ...)
#if !NEUROFIELD_COMPILER_MSVC
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    // Counters let tests and the headless driver check that warnings were raised
    u64 getWarningCount() const { return m_warningCount; }
    u64 getErrorCount() const { return m_errorCount; }
    void resetCounters();

private:
    Logger();

    void logImpl(LogLevel level, const char* category, const char* file, int line,
                 const char* format, va_list args);

    FILE* m_output;
    std::mutex m_mutex;
    LogLevel m_minLevel;
    bool m_useColors;
    bool m_showTimestamps;
    u64 m_warningCount = 0;
    u64 m_errorCount = 0;
    std::chrono::steady_clock::time_point m_startTime;
};

} // namespace NeuroField

// =============================================================================
// Logging Macros
// =============================================================================

#define NEUROFIELD_LOG(level, category, ...) \
    ::NeuroField::Logger::instance().log(level, category, __FILE__, __LINE__, __VA_ARGS__)

#define NEUROFIELD_LOG_TRACE(category, ...) NEUROFIELD_LOG(::NeuroField::LogLevel::Trace, category, __VA_ARGS__)
#define NEUROFIELD_LOG_DEBUG(category, ...) NEUROFIELD_LOG(::NeuroField::LogLevel::Debug, category, __VA_ARGS__)
#define NEUROFIELD_LOG_INFO(category, ...)  NEUROFIELD_LOG(::NeuroField::LogLevel::Info, category, __VA_ARGS__)
#define NEUROFIELD_LOG_WARN(category, ...)  NEUROFIELD_LOG(::NeuroField::LogLevel::Warn, category, __VA_ARGS__)
#define NEUROFIELD_LOG_ERROR(category, ...) NEUROFIELD_LOG(::NeuroField::LogLevel::Error, category, __VA_ARGS__)
#define NEUROFIELD_LOG_FATAL(category, ...) NEUROFIELD_LOG(::NeuroField::LogLevel::Fatal, category, __VA_ARGS__)
