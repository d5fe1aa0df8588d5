// =============================================================================
// NeuroField - Neural Field Integrator Implementation
// =============================================================================

#include "Integrator.h"
#include "Errors.h"
#include "core/Log.h"
#include "core/Assert.h"
#include "core/Profiler.h"
#include "core/math/MathUtils.h"
#include <algorithm>
#include <cmath>
#include <random>
#include <string>

namespace NeuroField {

Integrator::Integrator(const Kernel& kernel,
                       const DynamicsParameters& dynamics,
                       const NonlinearityParameters& nonlinearity)
    : m_kernel(kernel)
    , m_dynamics(dynamics)
    , m_nonlinearity(nonlinearity)
    , m_rng(dynamics.drive.seed)
{
    m_dynamics.validate(m_kernel.getGrid());
    m_nonlinearity.validate();

    if (!m_dynamics.isStepSizeStable()) {
        NEUROFIELD_LOG_WARN("Integrator",
            "Time step %.4g exceeds the linear stability bound %.4g; the run may diverge",
            m_dynamics.dt, m_dynamics.stabilityBound());
    }

    m_convolver = createConvolver(m_kernel, m_dynamics.convolution);
    buildDriveProfile();

    const usize n = m_kernel.getGrid().getPointCount();
    m_activation.resize(n);
    m_coupling.resize(n);
    m_k1.resize(n);
    m_next.resize(n);
    if (m_dynamics.method != IntegrationMethod::Euler) {
        m_k2.resize(n);
        m_stage.resize(n);
    }
    if (m_dynamics.method == IntegrationMethod::RK4) {
        m_k3.resize(n);
        m_k4.resize(n);
    }

    NEUROFIELD_LOG_DEBUG("Integrator", "Ready: method=%s convolution=%s dt=%.4g decay=%.4g drive=%s",
        integrationMethodToString(m_dynamics.method),
        convolutionMethodToString(m_convolver->getMethod()),
        m_dynamics.dt, m_dynamics.decay, driveTypeToString(m_dynamics.drive.type));
}

void Integrator::buildDriveProfile() {
    const DriveParameters& drive = m_dynamics.drive;
    const Grid& grid = m_kernel.getGrid();
    m_driveProfile.clear();

    switch (drive.type) {
        case DriveType::None:
            return;

        case DriveType::Noise:
            m_noiseSample.assign(grid.getPointCount(), 0.0);
            return;

        case DriveType::Constant:
        case DriveType::Pulse:
            m_driveProfile.assign(grid.getPointCount(), drive.magnitude);
            return;

        case DriveType::Bump: {
            const Real3 c = drive.location ? *drive.location : grid.getCenter();
            const Index3& n = grid.getDimensions();
            m_driveProfile.resize(grid.getPointCount());
            for (u32 k = 0; k < n[2]; ++k) {
                const f64 dz2 = Math::square(grid.getCoordinate(2, k) - c[2]);
                for (u32 j = 0; j < n[1]; ++j) {
                    const f64 dy2 = Math::square(grid.getCoordinate(1, j) - c[1]);
                    for (u32 i = 0; i < n[0]; ++i) {
                        const f64 dx2 = Math::square(grid.getCoordinate(0, i) - c[0]);
                        m_driveProfile[grid.getIndex(i, j, k)] =
                            drive.magnitude * Math::gaussian(dx2 + dy2 + dz2, drive.width);
                    }
                }
            }
            return;
        }
    }
}

void Integrator::drawNoise() {
    const f64 sigma = m_dynamics.drive.magnitude;
    if (sigma <= 0.0) {
        std::fill(m_noiseSample.begin(), m_noiseSample.end(), 0.0);
        return;
    }
    std::normal_distribution<f64> dist(0.0, sigma);
    for (f64& value : m_noiseSample) {
        value = dist(m_rng);
    }
}

const std::vector<f64>* Integrator::activeDrive(f64 t) const {
    if (!m_dynamics.drive.isActive(t)) return nullptr;
    if (m_dynamics.drive.type == DriveType::Noise) return &m_noiseSample;
    return m_driveProfile.empty() ? nullptr : &m_driveProfile;
}

void Integrator::evaluateDrive(f64 t, std::vector<f64>& drive) const {
    if (const std::vector<f64>* active = activeDrive(t)) {
        drive = *active;
    } else {
        drive.assign(m_kernel.getGrid().getPointCount(), 0.0);
    }
}

void Integrator::checkShape(const FieldState& field) const {
    if (!field.sameGrid(m_kernel.getGrid())) {
        throw IncompatibleShapeError("Field grid (" + field.getGrid().describe() +
                                     ") does not match kernel grid (" +
                                     m_kernel.getGrid().describe() + ")");
    }
}

void Integrator::computeRate(const std::vector<f64>& u, f64 t, std::vector<f64>& rate) const {
    const usize n = u.size();
    const f64 beta = m_nonlinearity.beta;
    const f64 theta = m_nonlinearity.theta;

    for (usize i = 0; i < n; ++i) {
        m_activation[i] = Math::sigmoid(u[i], beta, theta);
    }

    m_convolver->apply(m_activation, m_coupling);

    rate.resize(n);
    const f64 decay = m_dynamics.decay;
    if (const std::vector<f64>* drive = activeDrive(t)) {
        const std::vector<f64>& input = *drive;
        for (usize i = 0; i < n; ++i) {
            rate[i] = -decay * u[i] + m_coupling[i] + input[i];
        }
    } else {
        for (usize i = 0; i < n; ++i) {
            rate[i] = -decay * u[i] + m_coupling[i];
        }
    }
}

void Integrator::evaluateRate(const FieldState& field, std::vector<f64>& rate) const {
    checkShape(field);
    computeRate(field.getActivity(), field.getTime(), rate);
}

void Integrator::step(FieldState& field) {
    NEUROFIELD_PROFILE_SCOPE();
    checkShape(field);

    const std::vector<f64>& u = field.getActivity();
    const usize n = u.size();
    const f64 t = field.getTime();
    const f64 dt = m_dynamics.dt;

    m_next.resize(n);
    if (m_dynamics.drive.type == DriveType::Noise) {
        drawNoise();
    }
    computeRate(u, t, m_k1);

    switch (m_dynamics.method) {
        case IntegrationMethod::Euler:
            for (usize i = 0; i < n; ++i) {
                m_next[i] = u[i] + dt * m_k1[i];
            }
            break;

        case IntegrationMethod::RK2:
            for (usize i = 0; i < n; ++i) {
                m_stage[i] = u[i] + dt * m_k1[i];
            }
            computeRate(m_stage, t + dt, m_k2);
            for (usize i = 0; i < n; ++i) {
                m_next[i] = u[i] + 0.5 * dt * (m_k1[i] + m_k2[i]);
            }
            break;

        case IntegrationMethod::RK4: {
            const f64 half = 0.5 * dt;
            for (usize i = 0; i < n; ++i) {
                m_stage[i] = u[i] + half * m_k1[i];
            }
            computeRate(m_stage, t + half, m_k2);
            for (usize i = 0; i < n; ++i) {
                m_stage[i] = u[i] + half * m_k2[i];
            }
            computeRate(m_stage, t + half, m_k3);
            for (usize i = 0; i < n; ++i) {
                m_stage[i] = u[i] + dt * m_k3[i];
            }
            computeRate(m_stage, t + dt, m_k4);
            const f64 sixth = dt / 6.0;
            for (usize i = 0; i < n; ++i) {
                m_next[i] = u[i] + sixth * (m_k1[i] + 2.0 * m_k2[i] + 2.0 * m_k3[i] + m_k4[i]);
            }
            break;
        }
    }

    for (usize i = 0; i < n; ++i) {
        if (NEUROFIELD_UNLIKELY(!Math::isFinite(m_next[i]))) {
            u32 x, y, z;
            field.getGrid().getIJK(i, x, y, z);
            NEUROFIELD_LOG_ERROR("Integrator",
                "Non-finite activity at (%u, %u, %u) stepping from t=%.4f; state kept",
                x, y, z, t);
            throw NumericalDivergenceError("Activity became non-finite at t=" + std::to_string(t + dt),
                                           t, i);
        }
    }

    field.commit(m_next, dt);

    NEUROFIELD_LOG_TRACE("Integrator", "Step %llu -> t=%.4f",
        static_cast<unsigned long long>(field.getStepCount()), field.getTime());
}

} // namespace NeuroField
