#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/macros.hpp"
#include "safe/core/algo.hpp"
#include "safe/kernel/neighborhood.hpp"
#include "safe/threading/parallel_for.hpp"
#include "safe/threading/workspace.hpp"
#include "safe/threading/scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <vector>

// =============================================================================
// FILE: safe/kernel/permutation.hpp
// BRIEF: Permutation null model for neighborhood aggregate scores
//
// A permutation is a uniform random bijection of feature values onto nodes.
// Permutations are produced in fixed blocks; block b draws from a
// Xoshiro256++ stream advanced by b jumps from the feature seed. Results
// therefore do not depend on the number of worker threads.
// =============================================================================

namespace safe::kernel::permutation {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Size DEFAULT_N_PERMUTATIONS = 1000;
    constexpr Size MAX_PERMUTATIONS = 1000000;
    constexpr Size BLOCK_SIZE = 64;
    constexpr uint64_t GOLDEN_GAMMA = 0x9e3779b97f4a7c15ULL;
    // Relative slack when comparing a null score to the observed one
    constexpr Real TIE_EPSILON = 64 * std::numeric_limits<Real>::epsilon();
}

// =============================================================================
// Aggregates
// =============================================================================

enum class Aggregate : int8_t {
    Mean = 0,
    Sum = 1,
    Median = 2,
    Max = 3
};

inline constexpr auto aggregate_name(Aggregate a) noexcept -> const char* {
    switch (a) {
        case Aggregate::Mean: return "mean";
        case Aggregate::Sum: return "sum";
        case Aggregate::Median: return "median";
        case Aggregate::Max: return "max";
    }
    return "mean";
}

// Reduces a gathered neighborhood buffer to one score. The buffer may be
// reordered (median uses selection in place).
template <typename F>
concept AggregateFn = std::is_invocable_r_v<Real, F&, Real*, Size>;

struct MeanAggregate {
    SAFE_FORCE_INLINE Real operator()(Real* vals, Size n) const noexcept {
        return safe::algo::sum(vals, n) / static_cast<Real>(n);
    }
};

struct SumAggregate {
    SAFE_FORCE_INLINE Real operator()(Real* vals, Size n) const noexcept {
        return safe::algo::sum(vals, n);
    }
};

struct MaxAggregate {
    SAFE_FORCE_INLINE Real operator()(Real* vals, Size n) const noexcept {
        return safe::algo::max(vals, n);
    }
};

struct MedianAggregate {
    Real operator()(Real* vals, Size n) const noexcept {
        Real* mid = vals + n / 2;
        safe::algo::nth_element(vals, mid, vals + n);
        if (n % 2 == 1) {
            return *mid;
        }
        // Lower middle is the max of the left partition
        const Real lower = safe::algo::max(vals, n / 2);
        return (lower + *mid) * Real(0.5);
    }
};

// Dispatch a runtime Aggregate to its functor type
template <typename Visitor>
decltype(auto) visit_aggregate(Aggregate a, Visitor&& visitor) {
    switch (a) {
        case Aggregate::Sum: return visitor(SumAggregate{});
        case Aggregate::Median: return visitor(MedianAggregate{});
        case Aggregate::Max: return visitor(MaxAggregate{});
        case Aggregate::Mean: break;
    }
    return visitor(MeanAggregate{});
}

// =============================================================================
// Fast PRNG (Xoshiro256++) with jump() for parallel streams
// =============================================================================

namespace detail {

SAFE_FORCE_INLINE uint64_t splitmix64(uint64_t x) noexcept {
    x += config::GOLDEN_GAMMA;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

class FastRNG {
public:
    using result_type = uint64_t;

    explicit FastRNG(uint64_t seed) noexcept {
        uint64_t s = seed;
        for (int i = 0; i < 4; ++i) {
            s += config::GOLDEN_GAMMA;
            uint64_t z = s;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            state_[i] = z ^ (z >> 31);
        }
    }

    SAFE_FORCE_INLINE uint64_t operator()() noexcept {
        const uint64_t result = rotl(state_[0] + state_[3], 23) + state_[0];
        const uint64_t t = state_[1] << 17;

        state_[2] ^= state_[0];
        state_[3] ^= state_[1];
        state_[1] ^= state_[2];
        state_[0] ^= state_[3];

        state_[2] ^= t;
        state_[3] = rotl(state_[3], 45);

        return result;
    }

    SAFE_FORCE_INLINE double uniform() noexcept {
        return static_cast<double>((*this)() >> 11) * 0x1.0p-53;
    }

    // Lemire's nearly divisionless method
    SAFE_FORCE_INLINE Size bounded(Size n) noexcept {
        uint64_t x = (*this)();
        __uint128_t m = static_cast<__uint128_t>(x) * static_cast<__uint128_t>(n);
        uint64_t l = static_cast<uint64_t>(m);
        if (l < n) {
            uint64_t t = -static_cast<uint64_t>(n) % n;
            while (l < t) {
                x = (*this)();
                m = static_cast<__uint128_t>(x) * static_cast<__uint128_t>(n);
                l = static_cast<uint64_t>(m);
            }
        }
        return static_cast<Size>(m >> 64);
    }

    // Jump 2^128 steps
    void jump() noexcept {
        static constexpr uint64_t JUMP[] = {
            0x180ec6d33cfd0abaULL, 0xd5a61266f0c9392cULL,
            0xa9582618e03fc9aaULL, 0x39abdc4529b1661cULL
        };

        uint64_t s0 = 0, s1 = 0, s2 = 0, s3 = 0;
        for (int i = 0; i < 4; ++i) {
            for (int b = 0; b < 64; ++b) {
                if (JUMP[i] & (1ULL << b)) {
                    s0 ^= state_[0]; s1 ^= state_[1];
                    s2 ^= state_[2]; s3 ^= state_[3];
                }
                (*this)();
            }
        }

        state_[0] = s0; state_[1] = s1;
        state_[2] = s2; state_[3] = s3;
    }

private:
    alignas(32) uint64_t state_[4];

    static SAFE_FORCE_INLINE uint64_t rotl(uint64_t x, int k) noexcept {
        return (x << k) | (x >> (64 - k));
    }
};

// Fisher-Yates
SAFE_FORCE_INLINE void shuffle_indices(Index* indices, Size n, FastRNG& rng) noexcept {
    for (Size i = n; i > 1; --i) {
        Size j = rng.bounded(i);
        Index tmp = indices[i - 1];
        indices[i - 1] = indices[j];
        indices[j] = tmp;
    }
}

// One stream per permutation block, each advanced by one jump from the last
inline std::vector<FastRNG> block_streams(uint64_t seed, Size n_blocks) {
    std::vector<FastRNG> streams;
    streams.reserve(n_blocks);
    FastRNG rng(seed);
    for (Size b = 0; b < n_blocks; ++b) {
        streams.push_back(rng);
        rng.jump();
    }
    return streams;
}

SAFE_FORCE_INLINE Size num_blocks(Size n_permutations) noexcept {
    return (n_permutations + config::BLOCK_SIZE - 1) / config::BLOCK_SIZE;
}

// Gather neighborhood values into scratch and reduce
template <AggregateFn F>
SAFE_FORCE_INLINE Real aggregate_neighborhood(
    const Real* SAFE_RESTRICT values,
    Array<const Index> members,
    Real* SAFE_RESTRICT scratch,
    F& fn
) {
    const Size m = members.size();
    for (Size k = 0; k < m; ++k) {
        scratch[k] = values[members[static_cast<Index>(k)]];
    }
    return fn(scratch, m);
}

} // namespace detail

// =============================================================================
// Seeds
// =============================================================================

/// Seed of one feature's permutation stream, fixed by the run seed and the
/// feature's input position.
inline uint64_t feature_seed(uint64_t global_seed, Size feature_index) noexcept {
    return detail::splitmix64(global_seed + static_cast<uint64_t>(feature_index) * config::GOLDEN_GAMMA);
}

inline uint64_t resolve_seed(const std::optional<uint64_t>& seed) {
    if (seed.has_value()) {
        return *seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

// =============================================================================
// P-values and Degeneracy
// =============================================================================

SAFE_FORCE_INLINE Real empirical_pvalue(Size count, Size n_permutations) noexcept {
    return static_cast<Real>(count + 1) / static_cast<Real>(n_permutations + 1);
}

/// Null score counts toward the enrichment tail. Scores within a relative
/// TIE_EPSILON of the observed value are ties, so summation order does not
/// move a permutation out of the tail.
SAFE_FORCE_INLINE bool at_least(Real null_score, Real observed) noexcept {
    const Real slack = config::TIE_EPSILON * std::max(Real(1), std::abs(observed));
    return null_score >= observed - slack;
}

SAFE_FORCE_INLINE bool at_most(Real null_score, Real observed) noexcept {
    const Real slack = config::TIE_EPSILON * std::max(Real(1), std::abs(observed));
    return null_score <= observed + slack;
}

/// Smallest attainable empirical p-value
SAFE_FORCE_INLINE Real min_pvalue(Size n_permutations) noexcept {
    return Real(1) / static_cast<Real>(n_permutations + 1);
}

/// Empty string when the values are usable, otherwise the reason.
inline std::string degeneracy_reason(Array<const Real> values) {
    if (values.size() == 0) {
        return "feature has no values";
    }
    const Real first = values[0];
    bool distinct = false;
    for (Size i = 0; i < values.size(); ++i) {
        const Real v = values[static_cast<Index>(i)];
        if (!std::isfinite(v)) {
            return "feature contains non-finite values";
        }
        distinct = distinct || (v != first);
    }
    return distinct ? std::string() : std::string("feature has fewer than 2 distinct values");
}

inline bool is_degenerate(Array<const Real> values) {
    return !degeneracy_reason(values).empty();
}

// =============================================================================
// Null Distribution
// =============================================================================

/// Permuted neighborhood scores, node-major: data[node * n_permutations + p].
struct NullDistribution {
    Index n_nodes = 0;
    Size n_permutations = 0;
    std::vector<Real> data;

    Array<const Real> node(Index u) const noexcept {
        return Array<const Real>(data.data() + static_cast<Size>(u) * n_permutations, n_permutations);
    }
};

/// Observed neighborhood aggregate for every node.
template <AggregateFn F>
void observed_scores(
    Array<const Real> values,
    const neighborhood::NeighborhoodMap& map,
    F fn,
    Array<Real> out
) {
    const Index n = map.num_nodes();
    SAFE_CHECK_DIM(values.size() == static_cast<Size>(n), "Permutation: values size != node count");
    SAFE_CHECK_DIM(out.size() == static_cast<Size>(n), "Permutation: output size != node count");

    std::vector<Real> scratch(static_cast<Size>(map.max_size()));
    for (Index u = 0; u < n; ++u) {
        out[u] = detail::aggregate_neighborhood(values.data(), map.members_of(u), scratch.data(), fn);
    }
}

/// Visit every permutation of one feature as (p, shuffled_values). Blocks are
/// spread over workers when `parallel` is set.
template <typename Visitor>
void for_each_permutation(
    Array<const Real> values,
    Size n_permutations,
    uint64_t seed,
    bool parallel,
    Visitor&& visit
) {
    const Size n = values.size();
    const Size n_blocks = detail::num_blocks(n_permutations);
    auto streams = detail::block_streams(seed, n_blocks);

    const size_t n_threads = parallel ? safe::threading::Scheduler::get_num_threads() : 1;
    safe::threading::WorkspacePool<Index> perm_pool;
    safe::threading::WorkspacePool<Real> value_pool;
    perm_pool.init(n_threads, n);
    value_pool.init(n_threads, n);

    auto run_block = [&](size_t b, size_t rank) {
        Index* perm = perm_pool.get(rank);
        Real* shuffled = value_pool.get(rank);
        for (Size i = 0; i < n; ++i) {
            perm[i] = static_cast<Index>(i);
        }

        detail::FastRNG rng = streams[b];
        const Size p_begin = b * config::BLOCK_SIZE;
        const Size p_end = std::min(p_begin + config::BLOCK_SIZE, n_permutations);
        for (Size p = p_begin; p < p_end; ++p) {
            detail::shuffle_indices(perm, n, rng);
            for (Size i = 0; i < n; ++i) {
                shuffled[i] = values[perm[i]];
            }
            visit(p, static_cast<const Real*>(shuffled), rank);
        }
    };

    if (parallel && n_threads > 1 && n_blocks > 1) {
        safe::threading::parallel_for(Size(0), n_blocks, run_block);
    } else {
        for (Size b = 0; b < n_blocks; ++b) {
            run_block(b, 0);
        }
    }
}

/// Materialize the null distribution of neighborhood scores for one feature.
///
/// @throws DegenerateFeatureError if the feature has fewer than two distinct
///         finite values.
template <AggregateFn F>
NullDistribution generate_null(
    Array<const Real> values,
    const neighborhood::NeighborhoodMap& map,
    F fn,
    Size n_permutations = config::DEFAULT_N_PERMUTATIONS,
    std::optional<uint64_t> seed = std::nullopt,
    bool parallel = true
) {
    const Index n = map.num_nodes();
    SAFE_CHECK_DIM(values.size() == static_cast<Size>(n), "Permutation: values size != node count");
    SAFE_CHECK_CONFIG(n_permutations >= 1 && n_permutations <= config::MAX_PERMUTATIONS,
        "Permutation: permutation count must lie in [1, " + std::to_string(config::MAX_PERMUTATIONS) + "]");

    const std::string reason = degeneracy_reason(values);
    if (!reason.empty()) {
        throw DegenerateFeatureError("Permutation: " + reason);
    }

    NullDistribution null;
    null.n_nodes = n;
    null.n_permutations = n_permutations;
    null.data.resize(static_cast<Size>(n) * n_permutations);

    const size_t n_threads = parallel ? safe::threading::Scheduler::get_num_threads() : 1;
    safe::threading::WorkspacePool<Real> scratch_pool;
    scratch_pool.init(n_threads, static_cast<Size>(map.max_size()));

    for_each_permutation(values, n_permutations, resolve_seed(seed), parallel,
        [&](Size p, const Real* shuffled, size_t rank) {
            F local = fn;
            Real* scratch = scratch_pool.get(rank);
            for (Index u = 0; u < n; ++u) {
                null.data[static_cast<Size>(u) * n_permutations + p] =
                    detail::aggregate_neighborhood(shuffled, map.members_of(u), scratch, local);
            }
        });

    return null;
}

/// Runtime-selected aggregate overload
inline NullDistribution generate_null(
    Array<const Real> values,
    const neighborhood::NeighborhoodMap& map,
    Aggregate aggregate,
    Size n_permutations = config::DEFAULT_N_PERMUTATIONS,
    std::optional<uint64_t> seed = std::nullopt,
    bool parallel = true
) {
    return visit_aggregate(aggregate, [&](auto fn) {
        return generate_null(values, map, fn, n_permutations, seed, parallel);
    });
}

} // namespace safe::kernel::permutation
