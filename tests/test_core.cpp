// =============================================================================
// NeuroField - Core Tests
// =============================================================================

#include <cmath>
#include <limits>
#include <string>
#include <catch2/catch.hpp>
#include "core/Types.h"
#include "core/Assert.h"
#include "core/Log.h"
#include "core/Profiler.h"
#include "core/math/MathUtils.h"
#include "field/Errors.h"

using namespace NeuroField;

// =============================================================================
// Math Utilities
// =============================================================================

TEST_CASE("Scalar helpers", "[core][math]") {
    SECTION("min/max/clamp") {
        REQUIRE(Math::min(3, 5) == 3);
        REQUIRE(Math::max(3.0, -5.0) == 3.0);
        REQUIRE(Math::clamp(12.0, 0.0, 10.0) == 10.0);
        REQUIRE(Math::clamp(-1, 0, 10) == 0);
    }

    SECTION("Finite checks") {
        REQUIRE(Math::isPositiveFinite(1e-9));
        REQUIRE_FALSE(Math::isPositiveFinite(0.0));
        REQUIRE_FALSE(Math::isPositiveFinite(std::numeric_limits<f64>::infinity()));
        REQUIRE_FALSE(Math::isFinite(std::numeric_limits<f64>::quiet_NaN()));
    }

    SECTION("Gaussian is one at the origin and falls off with width") {
        REQUIRE(Math::gaussian(0.0, 2.0) == 1.0);
        REQUIRE(Math::gaussian(4.0, 2.0) == Catch::Detail::Approx(std::exp(-0.5)));
        REQUIRE(Math::gaussian(4.0, 1.0) < Math::gaussian(4.0, 3.0));
    }

    SECTION("Sigmoid is centered on the threshold") {
        REQUIRE(Math::sigmoid(0.5, 4.0, 0.5) == Catch::Detail::Approx(0.5));
        REQUIRE(Math::sigmoid(100.0, 4.0, 0.5) == Catch::Detail::Approx(1.0));
        REQUIRE(Math::sigmoid(-100.0, 4.0, 0.5) == Catch::Detail::Approx(0.0).margin(1e-12));
    }
}

// =============================================================================
// Statistics
// =============================================================================

TEST_CASE("StatisticsAccumulator", "[core][profiler]") {
    StatisticsAccumulator stats;
    REQUIRE(stats.count() == 0);
    REQUIRE(stats.mean() == 0.0);

    for (f64 v : { 2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0 }) {
        stats.addSample(v);
    }

    REQUIRE(stats.count() == 8);
    REQUIRE(stats.sum() == Catch::Detail::Approx(40.0));
    REQUIRE(stats.mean() == Catch::Detail::Approx(5.0));
    REQUIRE(stats.min() == 2.0);
    REQUIRE(stats.max() == 9.0);
    REQUIRE(stats.variance() == Catch::Detail::Approx(32.0 / 7.0));

    stats.reset();
    REQUIRE(stats.count() == 0);
    REQUIRE(stats.variance() == 0.0);
}

TEST_CASE("ScopedTimer reports elapsed time", "[core][profiler]") {
    f64 ms = -1.0;
    {
        ScopedTimer timer("test", &ms);
    }
    REQUIRE(ms >= 0.0);
}

// =============================================================================
// Logging
// =============================================================================

TEST_CASE("Logger filters by level and counts problems", "[core][log]") {
    Logger& logger = Logger::instance();
    const LogLevel previous = logger.getLevel();

    logger.setLevel(LogLevel::Error);
    logger.resetCounters();

    SECTION("Messages below the level are dropped") {
        REQUIRE_FALSE(logger.isEnabled(LogLevel::Warn));
        NEUROFIELD_LOG_WARN("Test", "filtered %d", 1);
        REQUIRE(logger.getWarningCount() == 0);
    }

    SECTION("Errors are counted") {
        REQUIRE(logger.isEnabled(LogLevel::Fatal));
        NEUROFIELD_LOG_ERROR("Test", "counted %s", "error");
        REQUIRE(logger.getErrorCount() == 1);
    }

    SECTION("Off disables everything") {
        logger.setLevel(LogLevel::Off);
        REQUIRE_FALSE(logger.isEnabled(LogLevel::Fatal));
        REQUIRE_FALSE(logger.isEnabled(LogLevel::Off));
    }

    logger.setLevel(previous);
    logger.resetCounters();
}

// =============================================================================
// Assertions
// =============================================================================

namespace {

int g_recordedLine = 0;

void recordAssert(const char*, const char*, const char*, int line) {
    g_recordedLine = line;
}

} // namespace

TEST_CASE("Assert handler can be replaced and restored", "[core][assert]") {
    const AssertHandler original = getAssertHandler();

    REQUIRE(setAssertHandler(recordAssert) == original);
    REQUIRE(getAssertHandler() == &recordAssert);

    g_recordedLine = 0;
    getAssertHandler()("size == 3", "kernel shape", "Kernel.cpp", 55);
    REQUIRE(g_recordedLine == 55);

    REQUIRE(setAssertHandler(original) == &recordAssert);
    REQUIRE(getAssertHandler() == original);
}

TEST_CASE("Default assert handler reports through the logger", "[core][assert]") {
    Logger& logger = Logger::instance();
    const LogLevel previous = logger.getLevel();
    logger.setLevel(LogLevel::Fatal);
    logger.resetCounters();

    defaultAssertHandler("next.size() == size", nullptr, __FILE__, __LINE__);
    defaultAssertHandler("input.size() == points", "convolution input", __FILE__, __LINE__);
    REQUIRE(logger.getErrorCount() == 2);

    logger.setLevel(LogLevel::Off);
    defaultAssertHandler("silenced", nullptr, __FILE__, __LINE__);
    REQUIRE(logger.getErrorCount() == 2);

    logger.setLevel(previous);
    logger.resetCounters();
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("Simulation errors carry their code", "[core][errors]") {
    try {
        throw UnstableStepSizeError("dt");
    } catch (const SimulationError& e) {
        REQUIRE(e.code() == ErrorCode::UnstableStepSize);
        REQUIRE(std::string(errorCodeToString(e.code())) == "UnstableStepSize");
    }

    NumericalDivergenceError divergence("boom", 1.5, 42);
    REQUIRE(divergence.time() == 1.5);
    REQUIRE(divergence.firstBadIndex() == 42);
    REQUIRE(divergence.code() == ErrorCode::NumericalDivergence);
}
