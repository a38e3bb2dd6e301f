#pragma once

#include "safe/core/type.hpp"

// =============================================================================
// Highway Configuration
// =============================================================================

#if defined(SAFE_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>

// =============================================================================
// FILE: safe/core/simd.hpp
// BRIEF: SAFE SIMD Wrapper (Google Highway)
// =============================================================================

namespace safe::simd {

    // Import Highway functions into safe::simd namespace
    using namespace hwy::HWY_NAMESPACE;

    using RealTag = ScalableTag<safe::Real>;
    using IndexTag = ScalableTag<safe::Index>;

    template <typename T>
    using SimdTagFor = std::conditional_t<
        std::is_same_v<T, Real>, RealTag,
        std::conditional_t<std::is_same_v<T, Index>, IndexTag,
            ScalableTag<T>>>;

} // namespace safe::simd
