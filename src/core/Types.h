// =============================================================================
// NeuroField - Core Types
// =============================================================================
// Fundamental type definitions, platform macros, and compiler intrinsics
// =============================================================================

#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <limits>
#include <array>

namespace NeuroField {

// =============================================================================
// Fixed-Width Integer Types
// =============================================================================

using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// =============================================================================
// Compiler Detection
// =============================================================================

#if defined(_MSC_VER)
    #define NEUROFIELD_COMPILER_MSVC 1
#elif defined(__clang__)
    #define NEUROFIELD_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define NEUROFIELD_COMPILER_GCC 1
#else
    #error "Unknown compiler"
#endif

// =============================================================================
// Platform Macros
// =============================================================================

#if defined(_WIN32)
    #define NEUROFIELD_PLATFORM_WINDOWS 1
    #define NEUROFIELD_DEBUGBREAK() __debugbreak()
#elif defined(__linux__) || defined(__APPLE__)
    #define NEUROFIELD_DEBUGBREAK() __builtin_trap()
#else
    #define NEUROFIELD_DEBUGBREAK() ((void)0)
#endif

// =============================================================================
// Compiler Hints & Intrinsics
// =============================================================================

#if NEUROFIELD_COMPILER_MSVC
    #define NEUROFIELD_FORCEINLINE __forceinline
    #define NEUROFIELD_RESTRICT    __restrict
    #define NEUROFIELD_LIKELY(x)   (x)
    #define NEUROFIELD_UNLIKELY(x) (x)
#else
    #define NEUROFIELD_FORCEINLINE inline __attribute__((always_inline))
    #define NEUROFIELD_RESTRICT    __restrict__
    #define NEUROFIELD_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define NEUROFIELD_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif

#define NEUROFIELD_CONCAT_IMPL(a, b) a##b
#define NEUROFIELD_CONCAT(a, b) NEUROFIELD_CONCAT_IMPL(a, b)

// =============================================================================
// Small Fixed Vectors
// =============================================================================

// Per-axis triples used for grid dimensions, extents and stencil radii
using Index3 = std::array<u32, 3>;
using Real3  = std::array<f64, 3>;

// =============================================================================
// Non-Copyable Base Class
// =============================================================================

class NonCopyable {
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

} // namespace NeuroField
