// =============================================================================
// NeuroField - Math Utilities
// =============================================================================
// Scalar helpers shared by the kernel builder, integrator and analyzers
// =============================================================================

#pragma once

#include "../Types.h"
#include <cmath>

namespace NeuroField {
namespace Math {

// =============================================================================
// Constants
// =============================================================================

// Relative tolerance for comparing grid geometry
constexpr f64 EPSILON   = 1e-12;
constexpr f64 LARGE_NUM = 1e300;

// =============================================================================
// Basic Math Functions
// =============================================================================

template<typename T>
constexpr T min(T a, T b) {
    return (a < b) ? a : b;
}

template<typename T>
constexpr T max(T a, T b) {
    return (a > b) ? a : b;
}

template<typename T>
constexpr T clamp(T value, T minVal, T maxVal) {
    return min(max(value, minVal), maxVal);
}

template<typename T>
constexpr T square(T value) {
    return value * value;
}

// =============================================================================
// Floating Point Utilities
// =============================================================================

NEUROFIELD_FORCEINLINE bool isFinite(f64 value) {
    return std::isfinite(value);
}

NEUROFIELD_FORCEINLINE bool isPositiveFinite(f64 value) {
    return std::isfinite(value) && value > 0.0;
}

// Unnormalized Gaussian exp(-r^2 / (2 sigma^2)) from a squared distance
NEUROFIELD_FORCEINLINE f64 gaussian(f64 distanceSq, f64 sigma) {
    return std::exp(-distanceSq / (2.0 * sigma * sigma));
}

// Logistic sigmoid 1 / (1 + exp(-beta (x - theta)))
NEUROFIELD_FORCEINLINE f64 sigmoid(f64 x, f64 beta, f64 theta) {
    return 1.0 / (1.0 + std::exp(-beta * (x - theta)));
}

} // namespace Math
} // namespace NeuroField
