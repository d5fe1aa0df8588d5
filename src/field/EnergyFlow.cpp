// =============================================================================
// NeuroField - Energy-Flow Analyzer Implementation
// =============================================================================

#include "EnergyFlow.h"
#include "Errors.h"
#include "core/Log.h"
#include "core/Profiler.h"
#include "core/math/MathUtils.h"
#include <algorithm>
#include <cmath>

namespace NeuroField {

namespace {

// Half-sample symmetric reflection (d c b a | a b c d | d c b a)
i64 mirrorIndex(i64 index, i64 n) {
    if (n == 1) return 0;
    const i64 period = 2 * n;
    index %= period;
    if (index < 0) index += period;
    return (index < n) ? index : period - 1 - index;
}

constexpr f64 kNormalizationGuard = 1e-8;

} // namespace

EnergyFlowField EnergyFlowAnalyzer::compute(const FieldState& field, const Integrator& integrator) const {
    NEUROFIELD_PROFILE_SCOPE();

    if (!field.sameGrid(integrator.getGrid())) {
        NEUROFIELD_LOG_ERROR("EnergyFlow", "Field %s does not match kernel %s",
            field.getGrid().describe().c_str(), integrator.getGrid().describe().c_str());
        throw IncompatibleShapeError("Energy flow requested for a field on " +
                                     field.getGrid().describe() + " but the kernel was built on " +
                                     integrator.getGrid().describe());
    }

    EnergyFlowField result;
    result.mode = m_mode;
    result.time = field.getTime();

    switch (m_mode) {
        case EnergyFlowMode::PowerDissipation:
            powerDissipation(field, integrator, result.values);
            break;
        case EnergyFlowMode::GradientMagnitude:
            gradientMagnitude(field, result.values);
            break;
    }

    f64 sum = 0.0;
    result.minimum = Math::LARGE_NUM;
    result.maximum = -Math::LARGE_NUM;
    for (f64 value : result.values) {
        sum += value;
        result.minimum = Math::min(result.minimum, value);
        result.maximum = Math::max(result.maximum, value);
    }
    result.total = sum * field.getGrid().getCellVolume();

    return result;
}

void EnergyFlowAnalyzer::powerDissipation(const FieldState& field, const Integrator& integrator,
                                          std::vector<f64>& out) {
    integrator.evaluateRate(field, out);
    const std::vector<f64>& u = field.getActivity();
    for (usize i = 0; i < out.size(); ++i) {
        out[i] *= u[i];
    }
}

void EnergyFlowAnalyzer::gradientMagnitude(const FieldState& field, std::vector<f64>& out) {
    const Grid& grid = field.getGrid();
    const Index3& n = grid.getDimensions();
    const Real3& h = grid.getSpacing();
    const std::vector<f64>& u = field.getActivity();

    out.assign(grid.getPointCount(), 0.0);

    auto derivative = [&](u32 axis, u32 i, u32 j, u32 k) -> f64 {
        const u32 count = n[axis];
        if (count < 2) return 0.0;

        Index3 lo{ i, j, k };
        Index3 hi{ i, j, k };
        const u32 p = lo[axis];
        f64 span = 2.0 * h[axis];
        if (p == 0) {
            hi[axis] = 1;
            span = h[axis];
        } else if (p == count - 1) {
            lo[axis] = count - 2;
            span = h[axis];
        } else {
            lo[axis] = p - 1;
            hi[axis] = p + 1;
        }
        return (u[grid.getIndex(hi[0], hi[1], hi[2])] - u[grid.getIndex(lo[0], lo[1], lo[2])]) / span;
    };

    for (u32 k = 0; k < n[2]; ++k) {
        for (u32 j = 0; j < n[1]; ++j) {
            for (u32 i = 0; i < n[0]; ++i) {
                const f64 gx = derivative(0, i, j, k);
                const f64 gy = derivative(1, i, j, k);
                const f64 gz = derivative(2, i, j, k);
                out[grid.getIndex(i, j, k)] = std::sqrt(gx * gx + gy * gy + gz * gz);
            }
        }
    }

    gaussianSmooth(grid, 1.0, out);

    const auto [minIt, maxIt] = std::minmax_element(out.begin(), out.end());
    const f64 lo = *minIt;
    const f64 range = *maxIt - lo + kNormalizationGuard;
    for (f64& value : out) {
        value = (value - lo) / range;
    }
}

void EnergyFlowAnalyzer::gaussianSmooth(const Grid& grid, f64 sigmaCells, std::vector<f64>& values) {
    if (sigmaCells <= 0.0) return;

    // Truncate at four standard deviations
    const i64 radius = static_cast<i64>(4.0 * sigmaCells + 0.5);
    std::vector<f64> taps(static_cast<usize>(2 * radius + 1));
    f64 norm = 0.0;
    for (i64 t = -radius; t <= radius; ++t) {
        const f64 w = Math::gaussian(static_cast<f64>(t * t), sigmaCells);
        taps[static_cast<usize>(t + radius)] = w;
        norm += w;
    }
    for (f64& w : taps) w /= norm;

    const Index3& n = grid.getDimensions();
    std::vector<f64> line;
    std::vector<f64> smoothed;

    for (u32 axis = 0; axis < 3; ++axis) {
        const u32 count = n[axis];
        if (count < 2) continue;

        const u32 a1 = (axis + 1) % 3;
        const u32 a2 = (axis + 2) % 3;
        line.resize(count);
        smoothed.resize(count);

        for (u32 q = 0; q < n[a2]; ++q) {
            for (u32 p = 0; p < n[a1]; ++p) {
                Index3 pos{ 0, 0, 0 };
                pos[a1] = p;
                pos[a2] = q;

                for (u32 t = 0; t < count; ++t) {
                    pos[axis] = t;
                    line[t] = values[grid.getIndex(pos[0], pos[1], pos[2])];
                }

                for (u32 t = 0; t < count; ++t) {
                    f64 acc = 0.0;
                    for (i64 o = -radius; o <= radius; ++o) {
                        const i64 src = mirrorIndex(static_cast<i64>(t) + o, count);
                        acc += taps[static_cast<usize>(o + radius)] * line[static_cast<usize>(src)];
                    }
                    smoothed[t] = acc;
                }

                for (u32 t = 0; t < count; ++t) {
                    pos[axis] = t;
                    values[grid.getIndex(pos[0], pos[1], pos[2])] = smoothed[t];
                }
            }
        }
    }
}

} // namespace NeuroField
