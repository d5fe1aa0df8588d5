// =============================================================================
// NeuroField - Coupling Kernel Implementation
// =============================================================================

#include "Kernel.h"
#include "Errors.h"
#include "core/Log.h"
#include "core/Assert.h"
#include "core/Profiler.h"
#include "core/math/MathUtils.h"
#include <cmath>
#include <string>
#include <utility>

namespace NeuroField {

// =============================================================================
// Kernel Parameters
// =============================================================================

void KernelParameters::validate() const {
    auto require = [](f64 value, const char* name) {
        if (!Math::isPositiveFinite(value)) {
            throw InvalidKernelParameterError(std::string("Kernel ") + name +
                                              " must be positive and finite, got " +
                                              std::to_string(value));
        }
    };

    require(excitatoryAmplitude, "excitatory amplitude");
    require(excitatoryWidth, "excitatory width");
    require(inhibitoryAmplitude, "inhibitory amplitude");
    require(inhibitoryWidth, "inhibitory width");

    if (!Math::isFinite(cutoffRadius) || cutoffRadius < 0.0) {
        throw InvalidKernelParameterError("Kernel cutoff radius must be finite and non-negative");
    }
}

f64 KernelParameters::evaluate(f64 distanceSq) const {
    return excitatoryAmplitude * Math::gaussian(distanceSq, excitatoryWidth)
         - inhibitoryAmplitude * Math::gaussian(distanceSq, inhibitoryWidth);
}

// =============================================================================
// Kernel
// =============================================================================

Kernel::Kernel(const Grid& grid, const Index3& radius, std::vector<f64> weights, f64 normalization)
    : m_grid(grid)
    , m_radius(radius)
    , m_weights(std::move(weights))
    , m_normalization(normalization)
{
    NEUROFIELD_ASSERT_MSG(m_weights.size() ==
        static_cast<usize>(getShape()[0]) * getShape()[1] * getShape()[2],
        "Kernel weight count must match stencil shape");
}

bool Kernel::containsOffset(i32 ox, i32 oy, i32 oz) const {
    return std::abs(ox) <= static_cast<i32>(m_radius[0]) &&
           std::abs(oy) <= static_cast<i32>(m_radius[1]) &&
           std::abs(oz) <= static_cast<i32>(m_radius[2]);
}

f64 Kernel::at(i32 ox, i32 oy, i32 oz) const {
    if (!containsOffset(ox, oy, oz)) return 0.0;
    return m_weights[getIndex(ox, oy, oz)];
}

f64 Kernel::sum() const {
    f64 total = 0.0;
    for (f64 w : m_weights) total += w;
    return total;
}

f64 Kernel::absSum() const {
    f64 total = 0.0;
    for (f64 w : m_weights) total += std::abs(w);
    return total;
}

bool Kernel::isSymmetric(f64 tolerance) const {
    const i32 rx = static_cast<i32>(m_radius[0]);
    const i32 ry = static_cast<i32>(m_radius[1]);
    const i32 rz = static_cast<i32>(m_radius[2]);

    for (i32 oz = -rz; oz <= rz; ++oz) {
        for (i32 oy = -ry; oy <= ry; ++oy) {
            for (i32 ox = -rx; ox <= rx; ++ox) {
                f64 a = m_weights[getIndex(ox, oy, oz)];
                f64 b = m_weights[getIndex(-ox, -oy, -oz)];
                if (std::abs(a - b) > tolerance) return false;
            }
        }
    }
    return true;
}

// =============================================================================
// Kernel Builder
// =============================================================================

Index3 KernelBuilder::stencilRadius(const Grid& grid, const KernelParameters& params) {
    Index3 radius{ 0, 0, 0 };
    for (u32 axis = 0; axis < 3; ++axis) {
        const u32 full = grid.getDimensions()[axis] - 1;
        radius[axis] = full;
        if (params.cutoffRadius > 0.0 && full > 0) {
            f64 cells = std::ceil(params.cutoffRadius / grid.getSpacing()[axis]);
            if (cells < static_cast<f64>(full)) {
                radius[axis] = static_cast<u32>(cells);
            }
        }
    }
    return radius;
}

Kernel KernelBuilder::build(const Grid& grid, const KernelParameters& params) {
    NEUROFIELD_PROFILE_SCOPE();
    params.validate();

    const Index3 radius = stencilRadius(grid, params);
    const Real3& d = grid.getSpacing();
    const i32 rx = static_cast<i32>(radius[0]);
    const i32 ry = static_cast<i32>(radius[1]);
    const i32 rz = static_cast<i32>(radius[2]);

    std::vector<f64> weights(static_cast<usize>(2 * rx + 1) * (2 * ry + 1) * (2 * rz + 1));

    usize idx = 0;
    for (i32 oz = -rz; oz <= rz; ++oz) {
        const f64 dz2 = Math::square(oz * d[2]);
        for (i32 oy = -ry; oy <= ry; ++oy) {
            const f64 dy2 = Math::square(oy * d[1]);
            for (i32 ox = -rx; ox <= rx; ++ox) {
                const f64 dx2 = Math::square(ox * d[0]);
                weights[idx++] = params.evaluate(dx2 + dy2 + dz2);
            }
        }
    }

    f64 normalization = 1.0;
    if (params.normalize) {
        f64 l1 = 0.0;
        for (f64 w : weights) l1 += std::abs(w);
        if (!(l1 > 0.0) || !Math::isFinite(l1)) {
            throw InvalidKernelParameterError("Kernel weights vanish on this grid; cannot normalize");
        }
        for (f64& w : weights) w /= l1;
        normalization = l1;
    }

    Kernel kernel(grid, radius, std::move(weights), normalization);

    NEUROFIELD_LOG_DEBUG("Kernel", "Built %ux%ux%u stencil (center=%.5f, sum=%.5f, normalization=%.5f)",
        kernel.getShape()[0], kernel.getShape()[1], kernel.getShape()[2],
        kernel.center(), kernel.sum(), normalization);

    return kernel;
}

} // namespace NeuroField
