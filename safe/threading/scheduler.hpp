#pragma once

#include <memory>
#include <thread>
#include <cstddef>

#include "safe/config.hpp"
#include "safe/core/macros.hpp"

// =============================================================================
// FILE: safe/threading/scheduler.hpp
// BRIEF: Unified worker pool sizing across threading backends
// =============================================================================

#if defined(SAFE_USE_OPENMP)
    #include <omp.h>
#elif defined(SAFE_USE_TBB)
    #include <tbb/global_control.h>
#endif

namespace safe::threading {

class Scheduler {
public:
    // Returns std::thread::hardware_concurrency(), or 1 if detection fails
    SAFE_FORCE_INLINE static size_t hardware_concurrency() noexcept {
        size_t hw = std::thread::hardware_concurrency();
        return (hw > 0) ? hw : 1;
    }

    // Set number of worker threads for parallel execution
    // If n == 0, uses hardware_concurrency()
    static void set_num_threads(size_t n) {
        if (n == 0) {
            n = hardware_concurrency();
        }

        constexpr size_t MAX_THREADS = 1024;
        if (n > MAX_THREADS) {
            n = MAX_THREADS;
        }

#if defined(SAFE_USE_SERIAL)
        (void)n;

#elif defined(SAFE_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));

#elif defined(SAFE_USE_TBB)
        // global_control is scoped; keep the latest one alive
        static ::std::unique_ptr<tbb::global_control> gc;
        gc = ::std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<int>(n));
#endif
    }

    // Current worker count, at least 1
    static size_t get_num_threads() noexcept {
#if defined(SAFE_USE_SERIAL)
        return 1;

#elif defined(SAFE_USE_OPENMP)
        int n = omp_get_max_threads();
        return (n > 0) ? static_cast<size_t>(n) : 1;

#elif defined(SAFE_USE_TBB)
        auto n = tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
        return (n > 0) ? static_cast<size_t>(n) : 1;

#else
        return 1;
#endif
    }

    static void init(size_t n = 0) {
        set_num_threads(n);
    }
};

} // namespace safe::threading
