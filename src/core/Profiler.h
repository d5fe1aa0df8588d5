// =============================================================================
// NeuroField - Profiler Integration
// =============================================================================
// Tracy profiler integration and custom profiling utilities
// =============================================================================

#pragma once

#include "Types.h"
#include "Log.h"
#include "math/MathUtils.h"
#include <chrono>
#include <cmath>

// =============================================================================
// Tracy Profiler Integration
// =============================================================================

#if NEUROFIELD_ENABLE_PROFILING
    #include <tracy/Tracy.hpp>
    #define NEUROFIELD_PROFILER_ENABLED 1
#else
    #define NEUROFIELD_PROFILER_ENABLED 0
#endif

// =============================================================================
// Profiling Macros
// =============================================================================

#if NEUROFIELD_PROFILER_ENABLED

    #define NEUROFIELD_PROFILE_FRAME()           FrameMark
    #define NEUROFIELD_PROFILE_SCOPE()           ZoneScoped
    #define NEUROFIELD_PROFILE_SCOPE_NAMED(name) ZoneScopedN(name)
    #define NEUROFIELD_PROFILE_PLOT(name, value) TracyPlot(name, value)

#else

    #define NEUROFIELD_PROFILE_FRAME()
    #define NEUROFIELD_PROFILE_SCOPE()
    #define NEUROFIELD_PROFILE_SCOPE_NAMED(name)
    #define NEUROFIELD_PROFILE_PLOT(name, value)

#endif

namespace NeuroField {

// =============================================================================
// Scoped Timer (for custom timing without Tracy)
// =============================================================================

class ScopedTimer {
public:
    using Clock = std::chrono::high_resolution_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    explicit ScopedTimer(const char* name, f64* outMs = nullptr)
        : m_name(name)
        , m_start(Clock::now())
        , m_outMs(outMs)
    {}

    ~ScopedTimer() {
        auto end = Clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start);
        f64 ms = static_cast<f64>(duration.count()) / 1000.0;

        if (m_outMs) {
            *m_outMs = ms;
        }

        NEUROFIELD_LOG_TRACE("Timer", "%s: %.3f ms", m_name, ms);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* m_name;
    TimePoint m_start;
    f64* m_outMs;
};

// =============================================================================
// Statistics Accumulator
// =============================================================================

class StatisticsAccumulator {
public:
    void addSample(f64 value) {
        m_count++;
        m_sum += value;
        m_sumSquares += value * value;
        m_min = Math::min(m_min, value);
        m_max = Math::max(m_max, value);
    }

    void reset() {
        m_count = 0;
        m_sum = 0;
        m_sumSquares = 0;
        m_min = Math::LARGE_NUM;
        m_max = -Math::LARGE_NUM;
    }

    u64 count() const { return m_count; }
    f64 sum() const { return m_sum; }
    f64 mean() const { return m_count > 0 ? m_sum / static_cast<f64>(m_count) : 0; }
    f64 min() const { return m_min; }
    f64 max() const { return m_max; }

    f64 variance() const {
        if (m_count < 2) return 0;
        f64 m = mean();
        f64 n = static_cast<f64>(m_count);
        return Math::max(0.0, (m_sumSquares - n * m * m) / (n - 1));
    }

    f64 stdDev() const {
        return std::sqrt(variance());
    }

private:
    u64 m_count = 0;
    f64 m_sum = 0;
    f64 m_sumSquares = 0;
    f64 m_min = Math::LARGE_NUM;
    f64 m_max = -Math::LARGE_NUM;
};

} // namespace NeuroField

#define NEUROFIELD_TIMED_SCOPE(name) \
    ::NeuroField::ScopedTimer NEUROFIELD_CONCAT(_nfTimer, __LINE__)(name)
