#pragma once

#include "safe/config.hpp"
#include "safe/core/type.hpp"
#include "safe/core/macros.hpp"
#include "safe/core/error.hpp"
#include <cstring>
#include <cstdlib>
#include <new>
#include <utility>
#include <memory>
#include <algorithm>

// =============================================================================
// FILE: safe/core/memory.hpp
// BRIEF: Aligned buffers and bulk initialization over Array<T>
// =============================================================================

namespace safe::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (SAFE_UNLIKELY(!ptr)) return;
        operator delete[](ptr, std::align_val_t(alignment_));
    }
};

// Value-initialized, aligned array of arithmetic T. Throws OutOfMemoryError.
template <typename T>
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
SAFE_FORCE_INLINE auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT)
    -> std::unique_ptr<T[], AlignedDeleter<T>> {
    static_assert(std::is_arithmetic_v<T>, "aligned_alloc: Type must be arithmetic");

    if (SAFE_UNLIKELY(count == 0)) {
        // NOLINTNEXTLINE(modernize-avoid-c-arrays)
        return std::unique_ptr<T[], AlignedDeleter<T>>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = nullptr;
    try {
        raw_ptr = new (std::align_val_t(alignment)) T[count]();
    } catch (const std::bad_alloc&) {
        throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                               std::to_string(count * sizeof(T)) + " bytes");
    }

    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    return std::unique_ptr<T[], AlignedDeleter<T>>(raw_ptr, AlignedDeleter<T>(alignment));
}

template <typename T>
struct AlignedBuffer {
    AlignedBuffer() : ptr_(nullptr, AlignedDeleter<T>()), count_(0) {}

    explicit AlignedBuffer(Size count, std::size_t alignment = DEFAULT_ALIGNMENT)
        : ptr_(aligned_alloc<T>(count, alignment)), count_(count) {}

    ~AlignedBuffer() = default;

    AlignedBuffer(const AlignedBuffer&) = delete;
    auto operator=(const AlignedBuffer&) -> AlignedBuffer& = delete;

    AlignedBuffer(AlignedBuffer&&) noexcept = default;
    auto operator=(AlignedBuffer&&) noexcept -> AlignedBuffer& = default;

    [[nodiscard]] auto array() noexcept -> Array<T> {
        return Array<T>(ptr_.get(), count_);
    }

    [[nodiscard]] auto array() const noexcept -> Array<const T> {
        return Array<const T>(ptr_.get(), count_);
    }

    auto get() noexcept -> T* { return ptr_.get(); }
    auto get() const noexcept -> const T* { return ptr_.get(); }

    [[nodiscard]] auto size() const noexcept -> Size { return count_; }

    auto operator[](Size i) noexcept -> T& { return ptr_[i]; }
    auto operator[](Size i) const noexcept -> const T& { return ptr_[i]; }

private:
    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    std::unique_ptr<T[], AlignedDeleter<T>> ptr_;
    Size count_;
};

} // namespace safe::memory
