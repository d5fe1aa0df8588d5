// =============================================================================
// NeuroField - Simulation Errors
// =============================================================================
// Exception taxonomy raised by grid construction, kernel building, stepping
// and the controller state machine.
// =============================================================================

#pragma once

#include "core/Types.h"
#include <stdexcept>
#include <string>

namespace NeuroField {

enum class ErrorCode : u8 {
    InvalidDimension = 0,
    InvalidExtent,
    InvalidKernelParameter,
    InvalidParameter,
    UnstableStepSize,
    NumericalDivergence,
    IncompatibleShape,
    InvalidTransition
};

constexpr const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidDimension:       return "InvalidDimension";
        case ErrorCode::InvalidExtent:          return "InvalidExtent";
        case ErrorCode::InvalidKernelParameter: return "InvalidKernelParameter";
        case ErrorCode::InvalidParameter:       return "InvalidParameter";
        case ErrorCode::UnstableStepSize:       return "UnstableStepSize";
        case ErrorCode::NumericalDivergence:    return "NumericalDivergence";
        case ErrorCode::IncompatibleShape:      return "IncompatibleShape";
        case ErrorCode::InvalidTransition:      return "InvalidTransition";
        default:                                return "Unknown";
    }
}

class SimulationError : public std::runtime_error {
public:
    SimulationError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , m_code(code)
    {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

class InvalidDimensionError : public SimulationError {
public:
    explicit InvalidDimensionError(const std::string& message)
        : SimulationError(ErrorCode::InvalidDimension, message) {}
};

class InvalidExtentError : public SimulationError {
public:
    explicit InvalidExtentError(const std::string& message)
        : SimulationError(ErrorCode::InvalidExtent, message) {}
};

class InvalidKernelParameterError : public SimulationError {
public:
    explicit InvalidKernelParameterError(const std::string& message)
        : SimulationError(ErrorCode::InvalidKernelParameter, message) {}
};

class InvalidParameterError : public SimulationError {
public:
    explicit InvalidParameterError(const std::string& message)
        : SimulationError(ErrorCode::InvalidParameter, message) {}
};

class UnstableStepSizeError : public SimulationError {
public:
    explicit UnstableStepSizeError(const std::string& message)
        : SimulationError(ErrorCode::UnstableStepSize, message) {}
};

class NumericalDivergenceError : public SimulationError {
public:
    NumericalDivergenceError(const std::string& message, f64 time, usize firstBadIndex)
        : SimulationError(ErrorCode::NumericalDivergence, message)
        , m_time(time)
        , m_firstBadIndex(firstBadIndex)
    {}

    // Simulation time of the last valid state
    f64 time() const { return m_time; }
    usize firstBadIndex() const { return m_firstBadIndex; }

private:
    f64 m_time;
    usize m_firstBadIndex;
};

class IncompatibleShapeError : public SimulationError {
public:
    explicit IncompatibleShapeError(const std::string& message)
        : SimulationError(ErrorCode::IncompatibleShape, message) {}
};

class InvalidTransitionError : public SimulationError {
public:
    explicit InvalidTransitionError(const std::string& message)
        : SimulationError(ErrorCode::InvalidTransition, message) {}
};

} // namespace NeuroField
