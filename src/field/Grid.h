// =============================================================================
// NeuroField - Uniform 3D Grid
// =============================================================================
// Node-centered grid: n points per axis spanning [0, extent]. Storage order
// is x fastest, then y, then z.
// =============================================================================

#pragma once

#include "core/Types.h"
#include <vector>
#include <string>

namespace NeuroField {

class Grid {
public:
    static constexpr usize MAX_POINTS = usize(1) << 21;  // 128^3

    // Throws InvalidDimensionError / InvalidExtentError
    Grid(const Index3& dimensions, const Real3& extents);

    const Index3& getDimensions() const { return m_dims; }
    const Real3& getExtents() const { return m_extents; }
    const Real3& getSpacing() const { return m_spacing; }

    u32 getResolutionX() const { return m_dims[0]; }
    u32 getResolutionY() const { return m_dims[1]; }
    u32 getResolutionZ() const { return m_dims[2]; }

    usize getPointCount() const { return m_pointCount; }
    f64 getCellVolume() const { return m_spacing[0] * m_spacing[1] * m_spacing[2]; }

    // Index conversion
    usize getIndex(u32 i, u32 j, u32 k) const {
        return static_cast<usize>(i)
             + static_cast<usize>(j) * m_dims[0]
             + static_cast<usize>(k) * m_dims[0] * m_dims[1];
    }

    void getIJK(usize index, u32& i, u32& j, u32& k) const {
        i = static_cast<u32>(index % m_dims[0]);
        j = static_cast<u32>((index / m_dims[0]) % m_dims[1]);
        k = static_cast<u32>(index / (static_cast<usize>(m_dims[0]) * m_dims[1]));
    }

    bool isInBounds(i64 i, i64 j, i64 k) const {
        return i >= 0 && i < static_cast<i64>(m_dims[0]) &&
               j >= 0 && j < static_cast<i64>(m_dims[1]) &&
               k >= 0 && k < static_cast<i64>(m_dims[2]);
    }

    // Coordinates
    const std::vector<f64>& getCoordinates(u32 axis) const { return m_coords[axis]; }
    f64 getCoordinate(u32 axis, u32 index) const { return m_coords[axis][index]; }
    f64 getMidpoint(u32 axis) const;
    Real3 getCenter() const { return { getMidpoint(0), getMidpoint(1), getMidpoint(2) }; }

    // Nearest grid node to a physical position (clamped to the domain)
    Index3 nearestNode(const Real3& position) const;
    bool containsPoint(const Real3& position) const;

    bool sameShape(const Grid& other) const;
    bool operator==(const Grid& other) const { return sameShape(other); }
    bool operator!=(const Grid& other) const { return !sameShape(other); }

    std::string describe() const;

private:
    Index3 m_dims;
    Real3 m_extents;
    Real3 m_spacing;
    usize m_pointCount;
    std::vector<f64> m_coords[3];
};

} // namespace NeuroField
