#pragma once

#include "safe/config.hpp"
#include "safe/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <concepts>
#include <cassert>
#include <iterator>
#include <span>

// =============================================================================
// FILE: safe/core/type.hpp
// BRIEF: Unified type system and zero-overhead views
// =============================================================================

namespace safe {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

#if defined(SAFE_USE_FLOAT32)
    using Real = float;
    constexpr int DTYPE_CODE = 0;
    constexpr const char* DTYPE_NAME = "float32";
#elif defined(SAFE_USE_FLOAT64)
    using Real = double;
    constexpr int DTYPE_CODE = 1;
    constexpr const char* DTYPE_NAME = "float64";
#else
    #error "SAFE: No precision macro defined."
#endif

#if defined(SAFE_USE_INT32)
    using Index = std::int32_t;
    constexpr int INDEX_DTYPE_CODE = 1;
    constexpr const char* INDEX_DTYPE_NAME = "int32";
#elif defined(SAFE_USE_INT64)
    using Index = std::int64_t;
    constexpr int INDEX_DTYPE_CODE = 2;
    constexpr const char* INDEX_DTYPE_NAME = "int64";
#else
    #error "SAFE: No index precision selected."
#endif

using Size = std::size_t;
using Byte = std::uint8_t;

// =============================================================================
// SECTION 2: Array View
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using reference = T&;
    using const_reference = const T&;
    using size_type = Size;
    using difference_type = std::ptrdiff_t;
    using iterator = T*;
    using const_iterator = const T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    // Conversion from non-const to const
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    template <std::size_t Extent = std::dynamic_extent>
    constexpr Array(std::span<T, Extent> span) noexcept
        : ptr(span.data()), len(static_cast<Size>(span.size())) {}

    SAFE_FORCE_INLINE constexpr auto operator[](Index i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i >= 0 && static_cast<Size>(i) < len && "Array index out of bounds");
#endif
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] SAFE_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] SAFE_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] SAFE_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] SAFE_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] SAFE_FORCE_INLINE constexpr auto end() const noexcept -> T* {
        return ptr + len;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] SAFE_FORCE_INLINE constexpr auto subspan(Index offset, Size count) const noexcept -> Array<T> {
#if !defined(NDEBUG)
        assert(offset >= 0 && static_cast<Size>(offset) + count <= len && "Subspan out of bounds");
#endif
        return Array<T>(ptr + offset, count);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] constexpr auto as_span() const noexcept -> std::span<T> {
        return std::span<T>(ptr, len);
    }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);
static_assert(std::is_trivially_copyable_v<Array<const Real>>);
static_assert(std::is_standard_layout_v<Array<Real>>);

// =============================================================================
// SECTION 3: ArrayLike Concept
// =============================================================================

template <typename A>
concept ArrayLike = requires(const A& a, Index i) {
    typename A::value_type;
    { a.size() } -> std::convertible_to<Size>;
    { a[i] } -> std::convertible_to<const typename A::value_type&>;
    { a.begin() };
    { a.end() };
};

static_assert(ArrayLike<Array<Real>>);
static_assert(ArrayLike<Array<const Index>>);

// =============================================================================
// SECTION 4: Cell Direction
// =============================================================================

// Tagged state of one (node, feature) cell. Undefined covers degenerate and
// unscored features so that no separate flag is needed.
enum class Direction : std::int8_t {
    Depleted = -1,
    Neither = 0,
    Enriched = 1,
    Undefined = 2
};

SAFE_FORCE_INLINE constexpr auto direction_sign(Direction d) noexcept -> int {
    return d == Direction::Enriched ? 1 : (d == Direction::Depleted ? -1 : 0);
}

inline constexpr auto direction_name(Direction d) noexcept -> const char* {
    switch (d) {
        case Direction::Enriched: return "enriched";
        case Direction::Depleted: return "depleted";
        case Direction::Neither: return "neither";
        case Direction::Undefined: return "undefined";
    }
    return "undefined";
}

} // namespace safe
