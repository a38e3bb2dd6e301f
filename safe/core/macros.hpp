#pragma once

#include "safe/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: safe/core/macros.hpp
// BRIEF: Cross-platform compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define SAFE_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define SAFE_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define SAFE_LIKELY(x)   (x)
    #define SAFE_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Compiler Attributes
// =============================================================================

#if defined(__has_cpp_attribute)
    #if __has_cpp_attribute(nodiscard) >= 201603L
        #define SAFE_NODISCARD [[nodiscard]]
    #else
        #define SAFE_NODISCARD
    #endif
#else
    #define SAFE_NODISCARD
#endif

// =============================================================================
// SECTION 3: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define SAFE_FORCE_INLINE __forceinline
    #define SAFE_RESTRICT __restrict
    #define SAFE_EXPORT __declspec(dllexport)
#else
    #define SAFE_FORCE_INLINE inline __attribute__((always_inline))
    #define SAFE_RESTRICT __restrict__
    #define SAFE_EXPORT __attribute__((visibility("default")))
#endif

// =============================================================================
// SECTION 4: Memory Alignment & Prefetching
// =============================================================================

#define SAFE_ALIGNMENT 64  // 64-byte alignment for AVX-512

#if defined(__clang__) || defined(__GNUC__)
    #define SAFE_PREFETCH_READ(ptr, locality) __builtin_prefetch((ptr), 0, (locality))
#elif defined(_MSC_VER)
    #include <xmmintrin.h>
    #define SAFE_PREFETCH_READ(ptr, locality) \
        _mm_prefetch(reinterpret_cast<const char*>(ptr), \
                     (locality) == 0 ? _MM_HINT_NTA : \
                     (locality) == 1 ? _MM_HINT_T2  : \
                     (locality) == 2 ? _MM_HINT_T1  : _MM_HINT_T0)
#else
    #define SAFE_PREFETCH_READ(ptr, locality) ((void)0)
#endif

// =============================================================================
// SECTION 5: Cache Line Layout
// =============================================================================

#define SAFE_CACHE_LINE_SIZE 64

// Pad structure to cache line boundary to avoid false sharing
#if defined(__clang__) || defined(__GNUC__)
    #define SAFE_CACHE_ALIGNED __attribute__((aligned(SAFE_CACHE_LINE_SIZE)))
#elif defined(_MSC_VER)
    #define SAFE_CACHE_ALIGNED __declspec(align(64))
#else
    #define SAFE_CACHE_ALIGNED
#endif

// =============================================================================
// SECTION 6: Compile-Time Utilities
// =============================================================================

#define SAFE_STRINGIFY(x) #x
#define SAFE_STRINGIFY_VALUE(x) SAFE_STRINGIFY(x)
