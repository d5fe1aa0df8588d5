// =============================================================================
// NeuroField - Simulation Parameters Validation
// =============================================================================

#include "SimulationParameters.h"
#include "Errors.h"
#include "core/math/MathUtils.h"
#include <cmath>
#include <string>

namespace NeuroField {

void DriveParameters::validate(const Grid& grid) const {
    if (!Math::isFinite(magnitude)) {
        throw InvalidParameterError("Drive magnitude must be finite");
    }
    if (!Math::isFinite(onset) || onset < 0.0) {
        throw InvalidParameterError("Drive onset must be finite and non-negative");
    }
    if (!Math::isFinite(duration) || duration < 0.0) {
        throw InvalidParameterError("Drive duration must be finite and non-negative");
    }

    switch (type) {
        case DriveType::None:
        case DriveType::Constant:
            break;

        case DriveType::Pulse:
            if (duration <= 0.0) {
                throw InvalidParameterError("Pulse drive needs a positive duration");
            }
            break;

        case DriveType::Bump:
            if (!Math::isPositiveFinite(width)) {
                throw InvalidParameterError("Bump drive width must be positive and finite, got " +
                                            std::to_string(width));
            }
            if (location && !grid.containsPoint(*location)) {
                throw InvalidParameterError("Bump drive location lies outside the domain");
            }
            break;

        case DriveType::Noise:
            if (magnitude < 0.0) {
                throw InvalidParameterError("Noise drive standard deviation must be non-negative, got " +
                                            std::to_string(magnitude));
            }
            break;
    }
}

bool DriveParameters::isActive(f64 t) const {
    switch (type) {
        case DriveType::None:
            return false;
        case DriveType::Constant:
            return true;
        case DriveType::Pulse:
            return t >= onset && t < onset + duration;
        case DriveType::Bump:
        case DriveType::Noise:
            return t >= onset && (duration <= 0.0 || t < onset + duration);
        default:
            return false;
    }
}

void NonlinearityParameters::validate() const {
    if (!Math::isPositiveFinite(beta)) {
        throw InvalidParameterError("Nonlinearity gain beta must be positive and finite, got " +
                                    std::to_string(beta));
    }
    if (!Math::isFinite(theta)) {
        throw InvalidParameterError("Nonlinearity threshold theta must be finite");
    }
}

void DynamicsParameters::validate(const Grid& grid) const {
    if (!Math::isFinite(dt) || dt <= 0.0) {
        throw UnstableStepSizeError("Time step must be positive and finite, got " + std::to_string(dt));
    }
    if (!Math::isPositiveFinite(decay)) {
        throw InvalidParameterError("Decay rate must be positive and finite, got " + std::to_string(decay));
    }
    drive.validate(grid);
}

void SimulationParameters::validate() const {
    const Grid g = grid.build();
    kernel.validate();
    dynamics.validate(g);
    nonlinearity.validate();
    seed.validate();

    if (iterations < 1) {
        throw InvalidParameterError("Iteration count must be at least 1");
    }
}

} // namespace NeuroField
