// =============================================================================
// NeuroField - Coupling Kernel
// =============================================================================
// Difference-of-Gaussians ("Mexican hat") lateral coupling sampled on the
// grid's displacement lattice. The stencil spans offsets |o_a| <= r_a, where
// r_a defaults to n_a - 1 so every displacement inside the domain is covered.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Grid.h"
#include <vector>

namespace NeuroField {

// =============================================================================
// Kernel Parameters
// =============================================================================

struct KernelParameters {
    f64 excitatoryAmplitude = 1.0;
    f64 excitatoryWidth = 1.0;
    f64 inhibitoryAmplitude = 0.5;
    f64 inhibitoryWidth = 3.0;

    // Divide by the L1 norm of the sampled weights
    bool normalize = true;

    // Physical stencil cutoff; 0 keeps the full domain
    f64 cutoffRadius = 0.0;

    // Throws InvalidKernelParameterError
    void validate() const;

    f64 evaluate(f64 distanceSq) const;
};

// =============================================================================
// Kernel
// =============================================================================

class Kernel {
public:
    Kernel(const Grid& grid, const Index3& radius, std::vector<f64> weights, f64 normalization);

    const Grid& getGrid() const { return m_grid; }
    const Index3& getRadius() const { return m_radius; }
    Index3 getShape() const {
        return { 2 * m_radius[0] + 1, 2 * m_radius[1] + 1, 2 * m_radius[2] + 1 };
    }
    usize getSize() const { return m_weights.size(); }

    // Factor the raw samples were divided by (1 when unnormalized)
    f64 getNormalization() const { return m_normalization; }

    usize getIndex(i32 ox, i32 oy, i32 oz) const {
        const Index3 shape = getShape();
        return static_cast<usize>(ox + static_cast<i32>(m_radius[0]))
             + static_cast<usize>(oy + static_cast<i32>(m_radius[1])) * shape[0]
             + static_cast<usize>(oz + static_cast<i32>(m_radius[2])) * shape[0] * shape[1];
    }

    bool containsOffset(i32 ox, i32 oy, i32 oz) const;

    // Weight at a displacement; zero outside the stencil
    f64 at(i32 ox, i32 oy, i32 oz) const;
    f64 center() const { return at(0, 0, 0); }

    const std::vector<f64>& getWeights() const { return m_weights; }
    const f64* data() const { return m_weights.data(); }

    f64 sum() const;
    f64 absSum() const;
    bool isSymmetric(f64 tolerance = 0.0) const;

private:
    Grid m_grid;
    Index3 m_radius;
    std::vector<f64> m_weights;
    f64 m_normalization;
};

// =============================================================================
// Kernel Builder
// =============================================================================

class KernelBuilder {
public:
    // Throws InvalidKernelParameterError
    static Kernel build(const Grid& grid, const KernelParameters& params);

    static Index3 stencilRadius(const Grid& grid, const KernelParameters& params);
};

} // namespace NeuroField
