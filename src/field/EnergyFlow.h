// =============================================================================
// NeuroField - Energy-Flow Analyzer
// =============================================================================
// Derived diagnostics over the current field. Never mutates the field.
//
// PowerDissipation (default): P(x) = u(x) * du/dt(x), with du/dt taken from
// the integrator's own rate function so the diagnostic matches the dynamics.
//
// GradientMagnitude: |grad u| (central differences, one-sided at the edges),
// smoothed by a Gaussian of one cell and min-max normalized to [0, 1].
// =============================================================================

#pragma once

#include "core/Types.h"
#include "FieldState.h"
#include "Integrator.h"
#include <vector>

namespace NeuroField {

enum class EnergyFlowMode : u8 {
    PowerDissipation = 0,
    GradientMagnitude
};

constexpr const char* energyFlowModeToString(EnergyFlowMode mode) {
    switch (mode) {
        case EnergyFlowMode::PowerDissipation:  return "power";
        case EnergyFlowMode::GradientMagnitude: return "gradient";
        default:                                return "unknown";
    }
}

struct EnergyFlowField {
    EnergyFlowMode mode = EnergyFlowMode::PowerDissipation;
    f64 time = 0.0;
    std::vector<f64> values;

    // Sum of values times cell volume
    f64 total = 0.0;
    f64 minimum = 0.0;
    f64 maximum = 0.0;
};

class EnergyFlowAnalyzer {
public:
    explicit EnergyFlowAnalyzer(EnergyFlowMode mode = EnergyFlowMode::PowerDissipation)
        : m_mode(mode) {}

    void setMode(EnergyFlowMode mode) { m_mode = mode; }
    EnergyFlowMode getMode() const { return m_mode; }

    // Throws IncompatibleShapeError when the field's grid differs from the
    // integrator's kernel grid
    EnergyFlowField compute(const FieldState& field, const Integrator& integrator) const;

    // Individual diagnostics
    static void powerDissipation(const FieldState& field, const Integrator& integrator,
                                 std::vector<f64>& out);
    static void gradientMagnitude(const FieldState& field, std::vector<f64>& out);

    // Separable Gaussian blur in cell units with mirrored edges
    static void gaussianSmooth(const Grid& grid, f64 sigmaCells, std::vector<f64>& values);

private:
    EnergyFlowMode m_mode;
};

} // namespace NeuroField
