// =============================================================================
// NeuroField - Neural Field Integrator
// =============================================================================
// Advances du/dt = -decay * u + (K * f(u)) + I(x, t) with explicit Euler,
// Heun (RK2) or classic RK4. A step is computed into scratch storage and
// committed only when every value is finite.
//
// A noise drive draws one sample per grid point at the start of each step;
// every Runge-Kutta stage of that step sees the same sample.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Kernel.h"
#include "Convolution.h"
#include "FieldState.h"
#include "SimulationParameters.h"
#include <memory>
#include <random>
#include <vector>

namespace NeuroField {

class Integrator : public NonCopyable {
public:
    // Throws UnstableStepSizeError for dt <= 0, InvalidParameterError for
    // other bad dynamics. Logs a warning when dt exceeds the stability bound.
    Integrator(const Kernel& kernel,
               const DynamicsParameters& dynamics,
               const NonlinearityParameters& nonlinearity);

    // One step of size dt. Throws IncompatibleShapeError or
    // NumericalDivergenceError; on failure the field is left untouched.
    void step(FieldState& field);

    // du/dt of the governing equation at the field's current time. A noise
    // drive contributes the sample of the most recent step (zero before the
    // first step).
    void evaluateRate(const FieldState& field, std::vector<f64>& rate) const;

    const Kernel& getKernel() const { return m_kernel; }
    const Grid& getGrid() const { return m_kernel.getGrid(); }
    const DynamicsParameters& getDynamics() const { return m_dynamics; }
    const NonlinearityParameters& getNonlinearity() const { return m_nonlinearity; }
    ConvolutionMethod getConvolutionMethod() const { return m_convolver->getMethod(); }

    f64 getTimeStep() const { return m_dynamics.dt; }
    bool isStepSizeStable() const { return m_dynamics.isStepSizeStable(); }

    // Drive I(x, t) sampled on the grid
    void evaluateDrive(f64 t, std::vector<f64>& drive) const;

private:
    void checkShape(const FieldState& field) const;
    void computeRate(const std::vector<f64>& u, f64 t, std::vector<f64>& rate) const;
    void buildDriveProfile();
    void drawNoise();

    // Drive values in effect at time t, or nullptr when the drive is off
    const std::vector<f64>* activeDrive(f64 t) const;

    Kernel m_kernel;
    DynamicsParameters m_dynamics;
    NonlinearityParameters m_nonlinearity;
    std::unique_ptr<IConvolver> m_convolver;

    // Spatial drive profile (magnitude folded in); empty for None and Noise
    std::vector<f64> m_driveProfile;

    // Per-step stochastic drive (DriveType::Noise)
    std::mt19937_64 m_rng;
    std::vector<f64> m_noiseSample;

    // Rate evaluation scratch
    mutable std::vector<f64> m_activation;
    mutable std::vector<f64> m_coupling;

    // Runge-Kutta stages
    std::vector<f64> m_k1, m_k2, m_k3, m_k4;
    std::vector<f64> m_stage;
    std::vector<f64> m_next;
};

} // namespace NeuroField
