// =============================================================================
// NeuroField - Simulation Parameters
// =============================================================================
// Configuration record supplied by the control surface. Validated once per
// change by the controller; read-only while a run is in progress.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Grid.h"
#include "Kernel.h"
#include "FieldState.h"
#include "Convolution.h"
#include <optional>

namespace NeuroField {

// =============================================================================
// Grid
// =============================================================================

struct GridParameters {
    Index3 dimensions{ 16, 16, 16 };
    Real3 extents{ 10.0, 10.0, 10.0 };

    // Throws InvalidDimensionError / InvalidExtentError
    Grid build() const { return Grid(dimensions, extents); }
};

// =============================================================================
// External Drive I(x, t)
// =============================================================================

enum class DriveType : u8 {
    None = 0,
    Constant,   // magnitude everywhere, always on
    Pulse,      // magnitude everywhere for onset <= t < onset + duration
    Bump,       // Gaussian of `width` at `location`; duration 0 means no end
    Noise       // fresh N(0, magnitude^2) per point every step; duration 0 means no end
};

constexpr const char* driveTypeToString(DriveType type) {
    switch (type) {
        case DriveType::None:     return "none";
        case DriveType::Constant: return "constant";
        case DriveType::Pulse:    return "pulse";
        case DriveType::Bump:     return "bump";
        case DriveType::Noise:    return "noise";
        default:                  return "unknown";
    }
}

struct DriveParameters {
    DriveType type = DriveType::None;
    f64 magnitude = 0.0;
    std::optional<Real3> location;   // defaults to the domain center
    f64 width = 1.0;
    f64 onset = 0.0;
    f64 duration = 0.0;
    u64 seed = 0x5EEDu;              // Noise only

    // Throws InvalidParameterError
    void validate(const Grid& grid) const;

    // Temporal on/off factor at time t
    bool isActive(f64 t) const;

    static DriveParameters none() { return DriveParameters{}; }
    static DriveParameters constant(f64 magnitude) {
        DriveParameters d;
        d.type = DriveType::Constant;
        d.magnitude = magnitude;
        return d;
    }
    static DriveParameters pulse(f64 magnitude, f64 duration, f64 onset = 0.0) {
        DriveParameters d;
        d.type = DriveType::Pulse;
        d.magnitude = magnitude;
        d.duration = duration;
        d.onset = onset;
        return d;
    }
    static DriveParameters bump(f64 magnitude, f64 width, std::optional<Real3> location = std::nullopt) {
        DriveParameters d;
        d.type = DriveType::Bump;
        d.magnitude = magnitude;
        d.width = width;
        d.location = location;
        return d;
    }

    static DriveParameters noise(f64 sigma, u64 seed = 0x5EEDu) {
        DriveParameters d;
        d.type = DriveType::Noise;
        d.magnitude = sigma;
        d.seed = seed;
        return d;
    }
};

// =============================================================================
// Nonlinearity f(u) = 1 / (1 + exp(-beta (u - theta)))
// =============================================================================

struct NonlinearityParameters {
    f64 beta = 4.0;
    f64 theta = 0.5;

    // Throws InvalidParameterError
    void validate() const;
};

// =============================================================================
// Dynamics
// =============================================================================

enum class IntegrationMethod : u8 {
    Euler = 0,
    RK2,        // Heun
    RK4
};

constexpr const char* integrationMethodToString(IntegrationMethod method) {
    switch (method) {
        case IntegrationMethod::Euler: return "euler";
        case IntegrationMethod::RK2:   return "rk2";
        case IntegrationMethod::RK4:   return "rk4";
        default:                       return "unknown";
    }
}

struct DynamicsParameters {
    f64 dt = 0.05;
    f64 decay = 1.0;
    DriveParameters drive;
    IntegrationMethod method = IntegrationMethod::Euler;
    ConvolutionMethod convolution = ConvolutionMethod::Auto;

    // Throws UnstableStepSizeError for non-positive dt, InvalidParameterError otherwise
    void validate(const Grid& grid) const;

    // Explicit schemes are linearly stable for dt < 2 / decay
    f64 stabilityBound() const { return 2.0 / decay; }
    bool isStepSizeStable() const { return dt < stabilityBound(); }
};

// =============================================================================
// Full Parameter Set
// =============================================================================

struct SimulationParameters {
    GridParameters grid;
    KernelParameters kernel;
    DynamicsParameters dynamics;
    NonlinearityParameters nonlinearity;
    SeedPattern seed;

    // Default batch length for SimulationController::run()
    u32 iterations = 100;

    // Validates every section; throws the first error found
    void validate() const;
};

} // namespace NeuroField
