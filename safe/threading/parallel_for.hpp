#pragma once

#include "safe/config.hpp"
#include "safe/core/macros.hpp"
#include "safe/threading/scheduler.hpp"

#include <cstddef>
#include <exception>
#include <mutex>
#include <type_traits>
#include <utility>

#if defined(SAFE_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(SAFE_USE_OPENMP)
    #include <omp.h>
#endif

// =============================================================================
// FILE: safe/threading/parallel_for.hpp
// BRIEF: Parallel loop over an index range with optional thread rank
// =============================================================================

namespace safe::threading {

namespace detail {

// First exception raised inside a parallel region, rethrown on the caller.
// OpenMP regions must not be left by an exception.
class ExceptionSlot {
public:
    void capture() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) {
            error_ = std::current_exception();
        }
    }

    void rethrow_if_set() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

private:
    std::mutex mutex_;
    std::exception_ptr error_;
};

} // namespace detail

// Usage:
//   parallel_for(0, n, [&](size_t i) { ... });
//   parallel_for(0, n, [&](size_t i, size_t thread_rank) { ... });
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func) {
    if (SAFE_UNLIKELY(start >= end)) {
        return;
    }

    constexpr bool has_rank_arg = std::is_invocable_v<Func, size_t, size_t>;

#if defined(SAFE_USE_SERIAL)
    for (size_t i = start; i < end; ++i) {
        if constexpr (has_rank_arg) {
            func(i, 0);
        } else {
            func(i);
        }
    }

#elif defined(SAFE_USE_OPENMP)
    if (omp_in_parallel()) {
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
    } else {
        detail::ExceptionSlot slot;
        #pragma omp parallel for schedule(dynamic, 1)
        for (size_t i = start; i < end; ++i) {
            try {
                if constexpr (has_rank_arg) {
                    func(i, static_cast<size_t>(omp_get_thread_num()));
                } else {
                    func(i);
                }
            } catch (...) {
                slot.capture();
            }
        }
        slot.rethrow_if_set();
    }

#elif defined(SAFE_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end),
        [&](const tbb::blocked_range<size_t>& r) {
            const auto thread_rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
            for (size_t i = r.begin(); i != r.end(); ++i) {
                if constexpr (has_rank_arg) {
                    func(i, thread_rank);
                } else {
                    func(i);
                }
            }
        });
#endif
}

} // namespace safe::threading
