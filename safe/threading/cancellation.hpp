#pragma once

#include "safe/core/macros.hpp"

#include <atomic>

// =============================================================================
// FILE: safe/threading/cancellation.hpp
// BRIEF: Cooperative cancellation flag shared between caller and workers
//
// Workers poll the token at task boundaries only. Work already started runs
// to completion so that committed results stay intact.
// =============================================================================

namespace safe::threading {

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    void reset() noexcept {
        cancelled_.store(false, std::memory_order_release);
    }

    SAFE_FORCE_INLINE bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace safe::threading
