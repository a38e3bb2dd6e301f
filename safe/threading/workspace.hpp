#pragma once

#include "safe/config.hpp"
#include "safe/core/type.hpp"
#include "safe/core/macros.hpp"
#include "safe/core/memory.hpp"

#include <cstring>

// =============================================================================
// FILE: safe/threading/workspace.hpp
// BRIEF: Thread-local workspace management to eliminate per-iteration allocs
// =============================================================================

namespace safe::threading {

// Pre-allocated buffer that avoids repeated allocations in parallel loops.
// Each thread gets its own slice indexed by thread rank.
template <typename T>
class WorkspacePool {
public:
    WorkspacePool() = default;

    // Single contiguous allocation of n_threads * capacity elements
    void init(size_t n_threads, size_t capacity) {
        n_threads_ = n_threads;
        // Round each slice up to a cache line to avoid false sharing
        constexpr size_t per_line = SAFE_CACHE_LINE_SIZE / sizeof(T) > 0
            ? SAFE_CACHE_LINE_SIZE / sizeof(T) : 1;
        capacity_ = capacity;
        stride_ = ((capacity + per_line - 1) / per_line) * per_line;
        buffer_ = safe::memory::AlignedBuffer<T>(n_threads * stride_, SAFE_ALIGNMENT);
    }

    SAFE_FORCE_INLINE T* get(size_t thread_rank) noexcept {
        return buffer_.get() + thread_rank * stride_;
    }

    SAFE_FORCE_INLINE Array<T> span(size_t thread_rank) noexcept {
        return Array<T>(get(thread_rank), capacity_);
    }

    SAFE_FORCE_INLINE void zero(size_t thread_rank) noexcept {
        std::memset(get(thread_rank), 0, capacity_ * sizeof(T));
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t n_threads() const noexcept { return n_threads_; }

private:
    safe::memory::AlignedBuffer<T> buffer_;
    size_t n_threads_ = 0;
    size_t capacity_ = 0;
    size_t stride_ = 0;
};

} // namespace safe::threading
