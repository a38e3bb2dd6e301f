#pragma once

#include <cstdint>
#include <cstddef>

// =============================================================================
// FILE: safe/config.hpp
// BRIEF: SAFE Core Configuration Header
// =============================================================================

// =============================================================================
// HWY Scalar-Only Control
// =============================================================================

#ifdef SAFE_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define SAFE_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define SAFE_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define SAFE_OS_LINUX
#else
    #define SAFE_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

// Auto-select backend based on platform if none specified
#if !defined(SAFE_BACKEND_SERIAL) && !defined(SAFE_BACKEND_TBB) && \
    !defined(SAFE_BACKEND_OPENMP)
    #if defined(SAFE_OS_MAC)
        // macOS: oneTBB avoids the libomp dependency
        #if defined(SAFE_MAC_USE_OPENMP)
            #define SAFE_BACKEND_OPENMP
        #else
            #define SAFE_BACKEND_TBB
        #endif
    #elif defined(SAFE_OS_WINDOWS) || defined(SAFE_OS_LINUX)
        #define SAFE_BACKEND_OPENMP
    #else
        #define SAFE_BACKEND_SERIAL
    #endif
#endif

#if (defined(SAFE_BACKEND_SERIAL) && (defined(SAFE_BACKEND_TBB) || defined(SAFE_BACKEND_OPENMP))) || \
    (defined(SAFE_BACKEND_TBB) && defined(SAFE_BACKEND_OPENMP))
    #error "SAFE Configuration Error: Multiple threading backends defined! " \
           "Please define only one of SAFE_BACKEND_SERIAL, SAFE_BACKEND_TBB, SAFE_BACKEND_OPENMP."
#endif

#if defined(SAFE_OS_MAC) && defined(SAFE_BACKEND_OPENMP)
    #pragma GCC warning "SAFE_WARNING: OpenMP enabled on macOS. " \
                        "Ensure 'libomp' is installed and linker flags are correct."
#endif

// =============================================================================
// Feature Flags (Public API)
// =============================================================================

#if defined(SAFE_BACKEND_OPENMP)
    #define SAFE_USE_OPENMP 1
#elif defined(SAFE_BACKEND_TBB)
    #define SAFE_USE_TBB 1
#elif defined(SAFE_BACKEND_SERIAL)
    #define SAFE_USE_SERIAL 1
#endif

// =============================================================================
// Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default, p-values near 1/(P+1) need the headroom)
#ifndef SAFE_PRECISION
    #define SAFE_PRECISION 1
#endif

#if SAFE_PRECISION == 0
    #define SAFE_USE_FLOAT32
#elif SAFE_PRECISION == 1
    #define SAFE_USE_FLOAT64
#else
    #error "SAFE Configuration Error: Invalid SAFE_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Index Precision Control
// =============================================================================

// 1: int32
// 2: int64 (default)
#ifndef SAFE_INDEX_PRECISION
    #define SAFE_INDEX_PRECISION 2
#endif

#if SAFE_INDEX_PRECISION == 1
    #define SAFE_USE_INT32
#elif SAFE_INDEX_PRECISION == 2
    #define SAFE_USE_INT64
#else
    #error "SAFE Configuration Error: Invalid SAFE_INDEX_PRECISION value. " \
           "Must be 1 (int32) or 2 (int64)."
#endif

// =============================================================================
// Memory Configuration
// =============================================================================

namespace safe::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;  // AVX-512 width
    inline constexpr std::size_t CACHE_LINE_SIZE = 64;
}

// =============================================================================
// Run Defaults
// =============================================================================

namespace safe::defaults {
    inline constexpr std::size_t PERMUTATIONS = 1000;
    inline constexpr std::size_t MAX_PERMUTATIONS = 1000000;
    inline constexpr double ALPHA = 0.05;
    inline constexpr std::int32_t RADIUS = 1;
    inline constexpr std::int32_t MAX_RADIUS = 64;
    inline constexpr std::int32_t ORDINATION_DIMS = 2;
    inline constexpr std::uint64_t SEED = 42;
}
