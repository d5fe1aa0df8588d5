// =============================================================================
// NeuroField - Simulation Controller Implementation
// =============================================================================

#include "SimulationController.h"
#include "Errors.h"
#include "core/Log.h"
#include "core/Profiler.h"
#include "core/math/MathUtils.h"
#include <string>
#include <utility>

namespace NeuroField {

SimulationController::SimulationController(const ControllerSettings& settings)
    : m_settings(settings)
    , m_analyzer(settings.energyFlowMode)
    , m_history(settings.historyDepth)
{
    if (m_settings.maxBatchSteps == 0) {
        throw InvalidParameterError("Controller sub-batch size must be at least 1");
    }
}

SimulationController::~SimulationController() = default;

// =============================================================================
// State Machine
// =============================================================================

void SimulationController::requireState(SimulationState expected, const char* operation) const {
    if (m_state != expected) {
        throw InvalidTransitionError(std::string(operation) + "() requires state " +
                                     simulationStateToString(expected) + " but controller is " +
                                     simulationStateToString(m_state));
    }
}

void SimulationController::transition(SimulationState next) {
    NEUROFIELD_LOG_INFO("Controller", "%s -> %s",
        simulationStateToString(m_state), simulationStateToString(next));
    m_state = next;
}

void SimulationController::configure(const SimulationParameters& params) {
    if (m_state == SimulationState::Running) {
        throw InvalidTransitionError("configure() is not allowed while Running; pause first");
    }

    // Build everything before touching controller state
    try {
        params.validate();
    } catch (const SimulationError& e) {
        NEUROFIELD_LOG_ERROR("Controller", "Rejected configuration: %s", e.what());
        throw;
    }

    Grid grid = params.grid.build();
    Kernel kernel = KernelBuilder::build(grid, params.kernel);
    auto integrator = std::make_unique<Integrator>(kernel, params.dynamics, params.nonlinearity);

    // A paused run continues from its current field when the grid is unchanged
    std::unique_ptr<FieldState> field;
    const bool keepField = m_state == SimulationState::Paused && m_field && m_field->sameGrid(grid);
    if (!keepField) {
        field = std::make_unique<FieldState>(grid, params.seed);
    }

    m_params = params;
    m_integrator = std::move(integrator);
    if (field) {
        m_field = std::move(field);
        m_history.clear();
        m_latest.reset();
    }
    m_diverged = false;
    m_batchTiming.reset();

    NEUROFIELD_LOG_INFO("Controller", "Configured %s, method=%s, convolution=%s, dt=%.4g%s",
        grid.describe().c_str(),
        integrationMethodToString(params.dynamics.method),
        convolutionMethodToString(m_integrator->getConvolutionMethod()),
        params.dynamics.dt,
        keepField ? " (field kept)" : "");

    transition(SimulationState::Configured);
}

void SimulationController::start() {
    requireState(SimulationState::Configured, "start");
    transition(SimulationState::Running);
}

void SimulationController::pause() {
    requireState(SimulationState::Running, "pause");
    transition(SimulationState::Paused);
}

void SimulationController::resume() {
    requireState(SimulationState::Paused, "resume");
    if (m_diverged) {
        throw InvalidTransitionError("resume() after numerical divergence; configure() or reset() first");
    }
    transition(SimulationState::Running);
}

void SimulationController::reset() {
    m_params.reset();
    m_integrator.reset();
    m_field.reset();
    m_latest.reset();
    m_history.clear();
    m_batchTiming.reset();
    m_diverged = false;

    if (m_state != SimulationState::Idle) {
        transition(SimulationState::Idle);
    }
}

// =============================================================================
// Stepping
// =============================================================================

u32 SimulationController::step() {
    return run(1);
}

u32 SimulationController::run() {
    requireState(SimulationState::Running, "run");
    return run(m_params->iterations);
}

u32 SimulationController::run(u32 steps) {
    requireState(SimulationState::Running, "run");
    if (steps == 0) {
        throw InvalidParameterError("run() needs a positive step count");
    }

    NEUROFIELD_PROFILE_SCOPE();

    u32 done = 0;
    while (done < steps) {
        const u32 chunk = Math::min(m_settings.maxBatchSteps, steps - done);
        runSubBatch(chunk);
        done += chunk;

        if (m_batchCallback) {
            m_batchCallback(*this, done, steps);
        }
        if (m_state != SimulationState::Running) {
            NEUROFIELD_LOG_INFO("Controller", "Run interrupted after %u of %u steps", done, steps);
            break;
        }
    }

    // reset() from the callback leaves nothing to report
    if (m_field) {
        emitSnapshot();
    }

    NEUROFIELD_PROFILE_FRAME();
    return done;
}

void SimulationController::runSubBatch(u32 steps) {
    FieldState checkpoint = *m_field;
    f64 elapsedMs = 0.0;

    try {
        ScopedTimer timer("SimulationController::runSubBatch", &elapsedMs);
        for (u32 i = 0; i < steps; ++i) {
            m_integrator->step(*m_field);
        }
    } catch (const NumericalDivergenceError& e) {
        *m_field = std::move(checkpoint);
        m_diverged = true;
        NEUROFIELD_LOG_ERROR("Controller", "Run halted: %s; field restored to t=%.4f",
            e.what(), m_field->getTime());
        transition(SimulationState::Paused);
        throw;
    }

    m_batchTiming.addSample(elapsedMs);
    NEUROFIELD_PROFILE_PLOT("NeuroField peak activity", m_field->peak());
}

// =============================================================================
// Snapshots
// =============================================================================

Snapshot SimulationController::snapshot(bool includeEnergyFlow) const {
    if (!m_field || !m_integrator) {
        throw InvalidTransitionError("snapshot() requires a configured simulation");
    }

    Snapshot s;
    s.time = m_field->getTime();
    s.step = m_field->getStepCount();
    s.dimensions = m_field->getGrid().getDimensions();
    s.extents = m_field->getGrid().getExtents();
    s.activity = m_field->getActivity();
    s.activityMin = m_field->minimum();
    s.activityMax = m_field->peak();
    if (includeEnergyFlow) {
        s.energyFlow = m_analyzer.compute(*m_field, *m_integrator);
    }
    return s;
}

EnergyFlowField SimulationController::computeEnergyFlow() const {
    if (!m_field || !m_integrator) {
        throw InvalidTransitionError("computeEnergyFlow() requires a configured simulation");
    }
    return m_analyzer.compute(*m_field, *m_integrator);
}

void SimulationController::setEnergyFlowMode(EnergyFlowMode mode) {
    m_settings.energyFlowMode = mode;
    m_analyzer.setMode(mode);
}

void SimulationController::emitSnapshot() {
    m_latest = snapshot(m_settings.captureEnergyFlow);
    m_history.push(*m_latest);

    NEUROFIELD_LOG_DEBUG("Controller", "Snapshot t=%.4f step=%llu range=[%.4f, %.4f]",
        m_latest->time, static_cast<unsigned long long>(m_latest->step),
        m_latest->activityMin, m_latest->activityMax);

    if (m_snapshotCallback) {
        m_snapshotCallback(*m_latest);
    }
}

} // namespace NeuroField
