// =============================================================================
// NeuroField - Field State
// =============================================================================
// Activity u over the grid plus simulation time. Only reset() and the
// Integrator mutate it, and both replace the whole array at once.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Grid.h"
#include <vector>

namespace NeuroField {

class Integrator;

// =============================================================================
// Seed Pattern
// =============================================================================

enum class SeedType : u8 {
    Zero = 0,
    UniformNoise,   // uniform in [-noiseAmplitude, noiseAmplitude]
    GaussianBump,   // amplitude * exp(-r^2 / 2 width^2) around the domain center
    PointImpulse    // amplitude at the node nearest the domain center
};

constexpr const char* seedTypeToString(SeedType type) {
    switch (type) {
        case SeedType::Zero:         return "zero";
        case SeedType::UniformNoise: return "noise";
        case SeedType::GaussianBump: return "bump";
        case SeedType::PointImpulse: return "impulse";
        default:                     return "unknown";
    }
}

struct SeedPattern {
    SeedType type = SeedType::GaussianBump;
    f64 amplitude = 1.0;
    f64 width = 2.0;
    f64 noiseAmplitude = 0.01;
    u64 seed = 0x5EEDu;

    // Throws InvalidParameterError
    void validate() const;

    static SeedPattern zero() { return SeedPattern{ SeedType::Zero }; }
    static SeedPattern noise(f64 epsilon, u64 seed = 0x5EEDu) {
        SeedPattern p;
        p.type = SeedType::UniformNoise;
        p.noiseAmplitude = epsilon;
        p.seed = seed;
        return p;
    }
    static SeedPattern bump(f64 amplitude, f64 width) {
        SeedPattern p;
        p.type = SeedType::GaussianBump;
        p.amplitude = amplitude;
        p.width = width;
        return p;
    }
    static SeedPattern impulse(f64 amplitude) {
        SeedPattern p;
        p.type = SeedType::PointImpulse;
        p.amplitude = amplitude;
        return p;
    }
};

// =============================================================================
// Field State
// =============================================================================

class FieldState {
public:
    FieldState(const Grid& grid, const SeedPattern& pattern = SeedPattern::zero());

    void reset(const SeedPattern& pattern);

    const Grid& getGrid() const { return m_grid; }
    const std::vector<f64>& getActivity() const { return m_activity; }
    const f64* data() const { return m_activity.data(); }
    usize size() const { return m_activity.size(); }

    f64 at(u32 i, u32 j, u32 k) const { return m_activity[m_grid.getIndex(i, j, k)]; }

    f64 getTime() const { return m_time; }
    u64 getStepCount() const { return m_stepCount; }

    f64 peak() const;
    f64 minimum() const;
    f64 total() const;
    bool isFinite() const;

    bool sameGrid(const Grid& grid) const { return m_grid.sameShape(grid); }

    bool operator==(const FieldState& other) const;
    bool operator!=(const FieldState& other) const { return !(*this == other); }

private:
    friend class Integrator;

    // Swaps in a fully computed next state
    void commit(std::vector<f64>& next, f64 dt);

    Grid m_grid;
    std::vector<f64> m_activity;
    f64 m_time = 0.0;
    u64 m_stepCount = 0;
};

} // namespace NeuroField
