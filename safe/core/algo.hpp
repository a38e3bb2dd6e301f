#pragma once

#include "safe/core/type.hpp"
#include "safe/core/macros.hpp"
#include "safe/core/simd.hpp"

#include <cstring>
#include <cstddef>
#include <utility>

// =============================================================================
// FILE: safe/core/algo.hpp
// BRIEF: High-performance algorithms without boundary checks
// NOTE: All functions assume valid inputs - caller must ensure preconditions
// =============================================================================

namespace safe::algo {

// =============================================================================
// SECTION 1: Partial Sorting (nth_element)
// =============================================================================

namespace detail {

template <typename T>
SAFE_FORCE_INLINE void insertion_sort(T* first, T* last) noexcept {
    for (T* i = first + 1; i < last; ++i) {
        T key = *i;
        T* j = i;
        while (j > first && *(j - 1) > key) {
            *j = *(j - 1);
            --j;
        }
        *j = key;
    }
}

template <typename T>
SAFE_FORCE_INLINE T* median_of_three(T* a, T* b, T* c) noexcept {
    if (*a < *b) {
        if (*b < *c) return b;
        if (*a < *c) return c;
        return a;
    }
    if (*a < *c) return a;
    if (*b < *c) return c;
    return b;
}

template <typename T>
SAFE_FORCE_INLINE T* partition(T* first, T* last, T pivot) noexcept {
    while (true) {
        while (*first < pivot) ++first;
        --last;
        while (pivot < *last) --last;

        if (first >= last) return first;

        T tmp = *first;
        *first = *last;
        *last = tmp;
        ++first;
    }
}

} // namespace detail

// Partition around nth element (quickselect)
// PRECONDITION: first <= nth < last, no NaN
template <typename T>
void nth_element(T* first, T* nth, T* last) noexcept {
    constexpr std::ptrdiff_t INSERTION_THRESHOLD = 16;

    while (last - first > INSERTION_THRESHOLD) {
        T* mid = first + (last - first) / 2;
        T pivot = *detail::median_of_three(first, mid, last - 1);

        T* cut = detail::partition(first, last, pivot);

        if (cut <= nth) {
            first = cut;
        } else {
            last = cut;
        }
    }

    detail::insertion_sort(first, last);
}

// =============================================================================
// SECTION 2: Reduction Operations (unchecked)
// =============================================================================

// Sum with 4-way unroll. Summation order depends only on n.
template <typename T>
SAFE_FORCE_INLINE T sum(const T* data, size_t n) noexcept {
    namespace s = safe::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);

    auto v_sum0 = s::Zero(d);
    auto v_sum1 = s::Zero(d);
    auto v_sum2 = s::Zero(d);
    auto v_sum3 = s::Zero(d);

    size_t i = 0;

    for (; i + 4 * lanes <= n; i += 4 * lanes) {
        v_sum0 = s::Add(v_sum0, s::LoadU(d, data + i));
        v_sum1 = s::Add(v_sum1, s::LoadU(d, data + i + lanes));
        v_sum2 = s::Add(v_sum2, s::LoadU(d, data + i + 2 * lanes));
        v_sum3 = s::Add(v_sum3, s::LoadU(d, data + i + 3 * lanes));
    }

    auto v_sum = s::Add(s::Add(v_sum0, v_sum1), s::Add(v_sum2, v_sum3));

    for (; i + lanes <= n; i += lanes) {
        v_sum = s::Add(v_sum, s::LoadU(d, data + i));
    }

    T result = s::GetLane(s::SumOfLanes(d, v_sum));

    for (; i < n; ++i) {
        result += data[i];
    }

    return result;
}

template <typename T>
SAFE_FORCE_INLINE T dot(const T* SAFE_RESTRICT a, const T* SAFE_RESTRICT b, size_t n) noexcept {
    namespace s = safe::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);

    auto v_acc0 = s::Zero(d);
    auto v_acc1 = s::Zero(d);

    size_t i = 0;

    for (; i + 2 * lanes <= n; i += 2 * lanes) {
        v_acc0 = s::MulAdd(s::LoadU(d, a + i), s::LoadU(d, b + i), v_acc0);
        v_acc1 = s::MulAdd(s::LoadU(d, a + i + lanes), s::LoadU(d, b + i + lanes), v_acc1);
    }

    auto v_acc = s::Add(v_acc0, v_acc1);

    for (; i + lanes <= n; i += lanes) {
        v_acc = s::MulAdd(s::LoadU(d, a + i), s::LoadU(d, b + i), v_acc);
    }

    T result = s::GetLane(s::SumOfLanes(d, v_acc));

    for (; i < n; ++i) {
        result += a[i] * b[i];
    }

    return result;
}

// PRECONDITION: n > 0
template <typename T>
SAFE_FORCE_INLINE T max(const T* data, size_t n) noexcept {
    namespace s = safe::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);

    auto v_max = s::Set(d, data[0]);

    size_t i = 0;

    for (; i + lanes <= n; i += lanes) {
        v_max = s::Max(v_max, s::LoadU(d, data + i));
    }

    T result = s::GetLane(s::MaxOfLanes(d, v_max));

    for (; i < n; ++i) {
        if (data[i] > result) result = data[i];
    }

    return result;
}

// =============================================================================
// SECTION 3: Vector Updates (unchecked)
// =============================================================================

// y += alpha * x
template <typename T>
SAFE_FORCE_INLINE void axpy(T alpha, const T* SAFE_RESTRICT x, T* SAFE_RESTRICT y, size_t n) noexcept {
    namespace s = safe::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);

    const auto v_alpha = s::Set(d, alpha);

    size_t i = 0;

    for (; i + lanes <= n; i += lanes) {
        s::StoreU(s::MulAdd(v_alpha, s::LoadU(d, x + i), s::LoadU(d, y + i)), d, y + i);
    }

    for (; i < n; ++i) {
        y[i] += alpha * x[i];
    }
}

template <typename T>
SAFE_FORCE_INLINE void scale(T* data, size_t n, T factor) noexcept {
    namespace s = safe::simd;
    const s::SimdTagFor<T> d;
    const size_t lanes = s::Lanes(d);

    const auto v_factor = s::Set(d, factor);

    size_t i = 0;

    for (; i + lanes <= n; i += lanes) {
        s::StoreU(s::Mul(s::LoadU(d, data + i), v_factor), d, data + i);
    }

    for (; i < n; ++i) {
        data[i] *= factor;
    }
}

} // namespace safe::algo
