// =============================================================================
// NeuroField - Uniform 3D Grid Implementation
// =============================================================================

#include "Grid.h"
#include "Errors.h"
#include "core/Log.h"
#include "core/math/MathUtils.h"
#include <cmath>
#include <cstdio>
#include <string>

namespace NeuroField {

namespace {

const char* axisName(u32 axis) {
    static const char* names[3] = { "x", "y", "z" };
    return names[axis];
}

bool nearlyEqual(f64 a, f64 b) {
    return std::abs(a - b) <= Math::EPSILON * Math::max(std::abs(a), std::abs(b));
}

} // namespace

Grid::Grid(const Index3& dimensions, const Real3& extents)
    : m_dims(dimensions)
    , m_extents(extents)
    , m_spacing{ 0.0, 0.0, 0.0 }
    , m_pointCount(0)
{
    for (u32 axis = 0; axis < 3; ++axis) {
        if (m_dims[axis] < 1) {
            throw InvalidDimensionError(std::string("Grid dimension along ") + axisName(axis) +
                                        " must be at least 1");
        }
        if (!Math::isPositiveFinite(m_extents[axis])) {
            throw InvalidExtentError(std::string("Grid extent along ") + axisName(axis) +
                                     " must be positive and finite, got " +
                                     std::to_string(m_extents[axis]));
        }
    }

    const f64 requested = static_cast<f64>(m_dims[0]) * m_dims[1] * m_dims[2];
    if (requested > static_cast<f64>(MAX_POINTS)) {
        throw InvalidDimensionError("Grid of " + std::to_string(m_dims[0]) + "x" +
                                    std::to_string(m_dims[1]) + "x" + std::to_string(m_dims[2]) +
                                    " exceeds the limit of " + std::to_string(MAX_POINTS) + " points");
    }
    m_pointCount = static_cast<usize>(m_dims[0]) * m_dims[1] * m_dims[2];

    for (u32 axis = 0; axis < 3; ++axis) {
        const u32 n = m_dims[axis];
        m_spacing[axis] = (n > 1) ? m_extents[axis] / static_cast<f64>(n - 1) : m_extents[axis];

        m_coords[axis].resize(n);
        for (u32 i = 0; i < n; ++i) {
            m_coords[axis][i] = static_cast<f64>(i) * m_spacing[axis];
        }
        // Pin the last node to the extent so the domain end is exact
        if (n > 1) {
            m_coords[axis][n - 1] = m_extents[axis];
        }
    }

    NEUROFIELD_LOG_DEBUG("Grid", "Created %s", describe().c_str());
}

f64 Grid::getMidpoint(u32 axis) const {
    const std::vector<f64>& c = m_coords[axis];
    return 0.5 * (c.front() + c.back());
}

Index3 Grid::nearestNode(const Real3& position) const {
    Index3 node{ 0, 0, 0 };
    for (u32 axis = 0; axis < 3; ++axis) {
        if (m_dims[axis] == 1) continue;
        f64 g = std::round(position[axis] / m_spacing[axis]);
        g = Math::clamp(g, 0.0, static_cast<f64>(m_dims[axis] - 1));
        node[axis] = static_cast<u32>(g);
    }
    return node;
}

bool Grid::containsPoint(const Real3& position) const {
    for (u32 axis = 0; axis < 3; ++axis) {
        if (!Math::isFinite(position[axis])) return false;
        if (position[axis] < m_coords[axis].front() || position[axis] > m_coords[axis].back()) {
            // Single-node axes accept any coordinate within the nominal extent
            if (m_dims[axis] > 1 || position[axis] < 0.0 || position[axis] > m_extents[axis]) {
                return false;
            }
        }
    }
    return true;
}

bool Grid::sameShape(const Grid& other) const {
    if (m_dims != other.m_dims) return false;
    for (u32 axis = 0; axis < 3; ++axis) {
        if (!nearlyEqual(m_extents[axis], other.m_extents[axis])) return false;
    }
    return true;
}

std::string Grid::describe() const {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer),
        "grid %ux%ux%u extents=(%.3g, %.3g, %.3g) spacing=(%.4g, %.4g, %.4g)",
        m_dims[0], m_dims[1], m_dims[2],
        m_extents[0], m_extents[1], m_extents[2],
        m_spacing[0], m_spacing[1], m_spacing[2]);
    return buffer;
}

} // namespace NeuroField
