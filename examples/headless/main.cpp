// =============================================================================
// NeuroField - Headless Example
// =============================================================================
// Runs a Mexican-hat field from a central bump without any visualization,
// logging peak activity, energy flow and batch timing as it goes.
//
// Usage: neurofield_headless [steps] [euler|rk2|rk4] [resolution]
// =============================================================================

#include "NeuroField.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>

using namespace NeuroField;

namespace {

IntegrationMethod parseMethod(const char* name) {
    if (std::strcmp(name, "rk2") == 0) return IntegrationMethod::RK2;
    if (std::strcmp(name, "rk4") == 0) return IntegrationMethod::RK4;
    if (std::strcmp(name, "euler") != 0) {
        NEUROFIELD_LOG_WARN("Headless", "Unknown method '%s', using euler", name);
    }
    return IntegrationMethod::Euler;
}

// Accepts a plain decimal count in [minimum, maximum]
bool parseCount(const char* text, const char* what, u32 minimum, u32 maximum, u32& out) {
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || text[0] == '-' ||
        value < minimum || value > maximum) {
        NEUROFIELD_LOG_ERROR("Headless", "Invalid %s '%s', expected an integer in [%u, %u]",
            what, text, minimum, maximum);
        return false;
    }
    out = static_cast<u32>(value);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Logger::instance().setLevel(LogLevel::Info);

    NEUROFIELD_LOG_INFO("Headless", "=== NeuroField %s - Headless Example ===", NEUROFIELD_VERSION_STRING);

    SimulationParameters params;
    params.kernel.excitatoryAmplitude = 1.0;
    params.kernel.excitatoryWidth = 1.0;
    params.kernel.inhibitoryAmplitude = 0.5;
    params.kernel.inhibitoryWidth = 3.0;
    params.dynamics.dt = 0.05;
    params.seed = SeedPattern::bump(1.0, 2.0);
    params.iterations = 100;

    if (argc > 1 && !parseCount(argv[1], "step count", 1, 1000000, params.iterations)) {
        return 1;
    }
    if (argc > 2) {
        params.dynamics.method = parseMethod(argv[2]);
    }
    if (argc > 3) {
        u32 n = 0;
        if (!parseCount(argv[3], "resolution", 1, 128, n)) {
            return 1;
        }
        params.grid.dimensions = { n, n, n };
    }

    ControllerSettings settings;
    settings.maxBatchSteps = 10;
    settings.captureEnergyFlow = true;

    SimulationController controller(settings);

    controller.setBatchCallback([](SimulationController& c, u32 done, u32 requested) {
        const FieldState* field = c.getField();
        NEUROFIELD_LOG_INFO("Headless", "%3u/%u  t=%.3f  peak=%.5f  min=%.5f",
            done, requested, field->getTime(), field->peak(), field->minimum());
    });

    try {
        controller.configure(params);
        controller.start();
        controller.run();
    } catch (const NumericalDivergenceError& e) {
        NEUROFIELD_LOG_ERROR("Headless", "Diverged at t=%.4f: %s", e.time(), e.what());
        return 2;
    } catch (const SimulationError& e) {
        NEUROFIELD_LOG_ERROR("Headless", "%s: %s", errorCodeToString(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        NEUROFIELD_LOG_FATAL("Headless", "Unexpected failure: %s", e.what());
        return 1;
    }

    // -------------------------------------------------------------------------
    // Summary
    // -------------------------------------------------------------------------
    const Snapshot& last = *controller.latestSnapshot();
    NEUROFIELD_LOG_INFO("Headless", "Final t=%.3f after %llu steps, activity in [%.5f, %.5f]",
        last.time, static_cast<unsigned long long>(last.step), last.activityMin, last.activityMax);

    if (last.hasEnergyFlow()) {
        NEUROFIELD_LOG_INFO("Headless", "Energy flow (%s): total=%.5f range=[%.5f, %.5f]",
            energyFlowModeToString(last.energyFlow->mode), last.energyFlow->total,
            last.energyFlow->minimum, last.energyFlow->maximum);
    }

    controller.setEnergyFlowMode(EnergyFlowMode::GradientMagnitude);
    const EnergyFlowField gradient = controller.computeEnergyFlow();
    NEUROFIELD_LOG_INFO("Headless", "Gradient flow range=[%.3f, %.3f]", gradient.minimum, gradient.maximum);

    const StatisticsAccumulator& timing = controller.getBatchTiming();
    NEUROFIELD_LOG_INFO("Headless", "Batches: %llu, mean %.3f ms (min %.3f, max %.3f, stddev %.3f)",
        static_cast<unsigned long long>(timing.count()), timing.mean(),
        timing.min(), timing.max(), timing.stdDev());

    controller.reset();
    NEUROFIELD_LOG_INFO("Headless", "=== Example Complete ===");
    return 0;
}
