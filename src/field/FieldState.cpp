// =============================================================================
// NeuroField - Field State Implementation
// =============================================================================

#include "FieldState.h"
#include "Errors.h"
#include "core/Log.h"
#include "core/Assert.h"
#include "core/math/MathUtils.h"
#include <algorithm>
#include <cmath>
#include <random>
#include <string>

namespace NeuroField {

void SeedPattern::validate() const {
    if (!Math::isFinite(amplitude)) {
        throw InvalidParameterError("Seed amplitude must be finite");
    }
    if (type == SeedType::GaussianBump && !Math::isPositiveFinite(width)) {
        throw InvalidParameterError("Seed bump width must be positive and finite, got " +
                                    std::to_string(width));
    }
    if (type == SeedType::UniformNoise &&
        (!Math::isFinite(noiseAmplitude) || noiseAmplitude < 0.0)) {
        throw InvalidParameterError("Seed noise amplitude must be finite and non-negative");
    }
}

FieldState::FieldState(const Grid& grid, const SeedPattern& pattern)
    : m_grid(grid)
    , m_activity(grid.getPointCount(), 0.0)
{
    reset(pattern);
}

void FieldState::reset(const SeedPattern& pattern) {
    pattern.validate();

    std::vector<f64> next(m_grid.getPointCount(), 0.0);

    switch (pattern.type) {
        case SeedType::Zero:
            break;

        case SeedType::UniformNoise: {
            std::mt19937_64 rng(pattern.seed);
            std::uniform_real_distribution<f64> dist(-pattern.noiseAmplitude, pattern.noiseAmplitude);
            for (f64& value : next) {
                value = (pattern.noiseAmplitude > 0.0) ? dist(rng) : 0.0;
            }
            break;
        }

        case SeedType::GaussianBump: {
            const Real3 c = m_grid.getCenter();
            const Index3& n = m_grid.getDimensions();
            for (u32 k = 0; k < n[2]; ++k) {
                const f64 dz2 = Math::square(m_grid.getCoordinate(2, k) - c[2]);
                for (u32 j = 0; j < n[1]; ++j) {
                    const f64 dy2 = Math::square(m_grid.getCoordinate(1, j) - c[1]);
                    for (u32 i = 0; i < n[0]; ++i) {
                        const f64 dx2 = Math::square(m_grid.getCoordinate(0, i) - c[0]);
                        next[m_grid.getIndex(i, j, k)] =
                            pattern.amplitude * Math::gaussian(dx2 + dy2 + dz2, pattern.width);
                    }
                }
            }
            break;
        }

        case SeedType::PointImpulse: {
            const Index3 node = m_grid.nearestNode(m_grid.getCenter());
            next[m_grid.getIndex(node[0], node[1], node[2])] = pattern.amplitude;
            break;
        }
    }

    m_activity.swap(next);
    m_time = 0.0;
    m_stepCount = 0;

    NEUROFIELD_LOG_DEBUG("FieldState", "Reset to '%s' pattern (peak=%.4f)",
        seedTypeToString(pattern.type), peak());
}

f64 FieldState::peak() const {
    return *std::max_element(m_activity.begin(), m_activity.end());
}

f64 FieldState::minimum() const {
    return *std::min_element(m_activity.begin(), m_activity.end());
}

f64 FieldState::total() const {
    f64 sum = 0.0;
    for (f64 value : m_activity) sum += value;
    return sum;
}

bool FieldState::isFinite() const {
    return std::all_of(m_activity.begin(), m_activity.end(),
                       [](f64 value) { return Math::isFinite(value); });
}

bool FieldState::operator==(const FieldState& other) const {
    return m_grid.sameShape(other.m_grid) &&
           m_time == other.m_time &&
           m_stepCount == other.m_stepCount &&
           m_activity == other.m_activity;
}

void FieldState::commit(std::vector<f64>& next, f64 dt) {
    NEUROFIELD_ASSERT_MSG(next.size() == m_activity.size(), "Committed state has the wrong size");
    m_activity.swap(next);
    m_time += dt;
    ++m_stepCount;
}

} // namespace NeuroField
