// =============================================================================
// NeuroField - Simulation Controller
// =============================================================================
// Owns grid, kernel, integrator and field for one simulation instance and
// guards them with an explicit state machine:
//
//   Idle --configure--> Configured --start--> Running --pause--> Paused
//    ^                      ^                                      |
//    |                      +-------------configure----------------+
//    +------------------------- reset (from any state) ------------+
//
// Runs are chunked into atomic sub-batches; pause()/reset() issued from the
// batch callback take effect at the next sub-batch boundary.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "core/Profiler.h"
#include "SimulationParameters.h"
#include "Kernel.h"
#include "FieldState.h"
#include "Integrator.h"
#include "EnergyFlow.h"
#include "Snapshot.h"
#include <functional>
#include <memory>
#include <optional>

namespace NeuroField {

enum class SimulationState : u8 {
    Idle = 0,
    Configured,
    Running,
    Paused
};

constexpr const char* simulationStateToString(SimulationState state) {
    switch (state) {
        case SimulationState::Idle:       return "Idle";
        case SimulationState::Configured: return "Configured";
        case SimulationState::Running:    return "Running";
        case SimulationState::Paused:     return "Paused";
        default:                          return "Unknown";
    }
}

struct ControllerSettings {
    // Largest number of steps executed as one atomic unit
    u32 maxBatchSteps = 16;

    // Attach an energy-flow field to every emitted snapshot
    bool captureEnergyFlow = false;
    EnergyFlowMode energyFlowMode = EnergyFlowMode::PowerDissipation;

    // Number of emitted snapshots kept for time-stacked views
    u32 historyDepth = 50;
};

class SimulationController : public NonCopyable {
public:
    // Called after every completed sub-batch with (steps done, steps requested)
    using BatchCallback = std::function<void(SimulationController&, u32, u32)>;
    using SnapshotCallback = std::function<void(const Snapshot&)>;

    explicit SimulationController(const ControllerSettings& settings = {});
    ~SimulationController();

    // State transitions
    void configure(const SimulationParameters& params);
    void start();
    void pause();
    void resume();
    void reset();

    // Stepping (Running only). Returns the number of steps completed.
    u32 step();
    u32 run();
    u32 run(u32 steps);

    // On-demand views
    Snapshot snapshot(bool includeEnergyFlow = false) const;
    EnergyFlowField computeEnergyFlow() const;
    const std::optional<Snapshot>& latestSnapshot() const { return m_latest; }
    const SnapshotHistory& history() const { return m_history; }

    // Accessors
    SimulationState getState() const { return m_state; }
    bool hasDiverged() const { return m_diverged; }
    bool isConfigured() const { return m_integrator != nullptr; }
    const FieldState* getField() const { return m_field.get(); }
    const Kernel* getKernel() const { return m_integrator ? &m_integrator->getKernel() : nullptr; }
    const Integrator* getIntegrator() const { return m_integrator.get(); }
    const std::optional<SimulationParameters>& getParameters() const { return m_params; }
    const ControllerSettings& getSettings() const { return m_settings; }
    const StatisticsAccumulator& getBatchTiming() const { return m_batchTiming; }

    void setEnergyFlowMode(EnergyFlowMode mode);
    void setCaptureEnergyFlow(bool capture) { m_settings.captureEnergyFlow = capture; }

    void setBatchCallback(BatchCallback callback) { m_batchCallback = std::move(callback); }
    void setSnapshotCallback(SnapshotCallback callback) { m_snapshotCallback = std::move(callback); }

private:
    void requireState(SimulationState expected, const char* operation) const;
    void transition(SimulationState next);
    void runSubBatch(u32 steps);
    void emitSnapshot();

    ControllerSettings m_settings;
    SimulationState m_state = SimulationState::Idle;
    bool m_diverged = false;

    std::optional<SimulationParameters> m_params;
    std::unique_ptr<Integrator> m_integrator;
    std::unique_ptr<FieldState> m_field;
    EnergyFlowAnalyzer m_analyzer;

    std::optional<Snapshot> m_latest;
    SnapshotHistory m_history;
    StatisticsAccumulator m_batchTiming;

    BatchCallback m_batchCallback;
    SnapshotCallback m_snapshotCallback;
};

} // namespace NeuroField
