#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/macros.hpp"
#include "safe/core/graph.hpp"
#include "safe/core/dense.hpp"
#include "safe/kernel/neighborhood.hpp"
#include "safe/kernel/permutation.hpp"
#include "safe/threading/parallel_for.hpp"
#include "safe/threading/scheduler.hpp"
#include "safe/threading/cancellation.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: safe/kernel/scoring.hpp
// BRIEF: Neighborhood enrichment scoring against the permutation null
//
// For every (node, feature) cell:
//   p_enriched = (1 + #{null >= observed}) / (1 + P)
//   p_depleted = (1 + #{null <= observed}) / (1 + P)
// with comparisons taken up to a relative tolerance (permutation::at_least).
// and the direction is the side with the smaller p-value (tie: Neither).
// Null counts are streamed; the null distribution is never stored here.
// =============================================================================

namespace safe::kernel::scoring {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Size DEFAULT_N_PERMUTATIONS = permutation::config::DEFAULT_N_PERMUTATIONS;
    constexpr Real UNDEFINED_PVALUE = Real(1);
}

enum class FeatureStatus : int8_t {
    Scored = 0,
    Degenerate = 1,
    Cancelled = 2
};

inline constexpr auto status_name(FeatureStatus s) noexcept -> const char* {
    switch (s) {
        case FeatureStatus::Scored: return "scored";
        case FeatureStatus::Degenerate: return "degenerate";
        case FeatureStatus::Cancelled: return "cancelled";
    }
    return "scored";
}

// =============================================================================
// Result Types
// =============================================================================

/// Scores of one feature over all nodes
struct FeatureScores {
    std::vector<Real> observed;
    std::vector<Real> p_enriched;
    std::vector<Real> p_depleted;
    std::vector<Direction> direction;
};

/// Per (node, feature) enrichment, row-major n_nodes x n_features.
struct EnrichmentResult {
    std::vector<std::string> node_ids;
    std::vector<std::string> feature_names;
    Index n_nodes = 0;
    Index n_features = 0;
    Size n_permutations = 0;
    Index radius = 0;
    permutation::Aggregate aggregate = permutation::Aggregate::Mean;

    std::vector<Real> observed;
    std::vector<Real> p_enriched;
    std::vector<Real> p_depleted;
    std::vector<Direction> direction;

    std::vector<FeatureStatus> status;
    std::vector<std::string> status_reason;

    SAFE_FORCE_INLINE Size cell(Index u, Index f) const noexcept {
        return static_cast<Size>(u) * static_cast<Size>(n_features) + static_cast<Size>(f);
    }

    /// Two-sided cell p-value: the smaller one-sided p-value
    SAFE_FORCE_INLINE Real p_value(Index u, Index f) const noexcept {
        const Size c = cell(u, f);
        return std::min(p_enriched[c], p_depleted[c]);
    }

    SAFE_FORCE_INLINE Direction direction_at(Index u, Index f) const noexcept {
        return direction[cell(u, f)];
    }

    bool is_scored(Index f) const noexcept {
        return status[static_cast<Size>(f)] == FeatureStatus::Scored;
    }

    /// Features that produced no scores, in input order
    std::vector<Index> skipped_features() const {
        std::vector<Index> out;
        for (Index f = 0; f < n_features; ++f) {
            if (!is_scored(f)) out.push_back(f);
        }
        return out;
    }

    Index feature_index(const std::string& name) const {
        auto it = std::find(feature_names.begin(), feature_names.end(), name);
        SAFE_CHECK_ARG(it != feature_names.end(), "EnrichmentResult: unknown feature '" + name + "'");
        return static_cast<Index>(it - feature_names.begin());
    }
};

// =============================================================================
// SAFE Score Normalization
// =============================================================================

/// log10(p) / log10(p_min), in [0, 1]; 1 at the smallest attainable p-value
SAFE_FORCE_INLINE Real safe_score(Real p, Size n_permutations) noexcept {
    const Real log_min = std::log10(permutation::min_pvalue(n_permutations));
    const Real s = std::log10(std::max(p, std::numeric_limits<Real>::min())) / log_min;
    return std::clamp(s, Real(0), Real(1));
}

/// Significance threshold in score space for level alpha
SAFE_FORCE_INLINE Real score_threshold(Real alpha, Size n_permutations) noexcept {
    return std::log10(alpha) / std::log10(permutation::min_pvalue(n_permutations));
}

// =============================================================================
// Single Feature
// =============================================================================

namespace detail {

SAFE_FORCE_INLINE Direction classify(Real p_enr, Real p_dep) noexcept {
    if (p_enr < p_dep) return Direction::Enriched;
    if (p_dep < p_enr) return Direction::Depleted;
    return Direction::Neither;
}

} // namespace detail

/// Score one feature (values in node order) against its permutation null.
///
/// @throws DegenerateFeatureError if values have fewer than two distinct
///         finite entries.
template <permutation::AggregateFn F>
FeatureScores score_feature(
    Array<const Real> values,
    const neighborhood::NeighborhoodMap& map,
    F fn,
    Size n_permutations,
    uint64_t seed,
    bool parallel = false
) {
    const Index n = map.num_nodes();
    const Size N = static_cast<Size>(n);
    SAFE_CHECK_DIM(values.size() == N, "Scoring: values size != node count");
    SAFE_CHECK_CONFIG(n_permutations >= 1 && n_permutations <= permutation::config::MAX_PERMUTATIONS,
        "Scoring: permutation count out of range");

    const std::string reason = permutation::degeneracy_reason(values);
    if (!reason.empty()) {
        throw DegenerateFeatureError("Scoring: " + reason);
    }

    FeatureScores out;
    out.observed.resize(N);
    permutation::observed_scores(values, map, fn, Array<Real>(out.observed.data(), N));

    // Per-worker integer counts, summed afterwards
    const size_t n_threads = parallel ? safe::threading::Scheduler::get_num_threads() : 1;
    std::vector<std::vector<Size>> count_ge(n_threads, std::vector<Size>(N, 0));
    std::vector<std::vector<Size>> count_le(n_threads, std::vector<Size>(N, 0));
    std::vector<std::vector<Real>> scratch(n_threads, std::vector<Real>(static_cast<Size>(map.max_size())));

    permutation::for_each_permutation(values, n_permutations, seed, parallel,
        [&](Size /*p*/, const Real* shuffled, size_t rank) {
            F local = fn;
            Size* ge = count_ge[rank].data();
            Size* le = count_le[rank].data();
            Real* buf = scratch[rank].data();
            for (Index u = 0; u < n; ++u) {
                const Real s = permutation::detail::aggregate_neighborhood(
                    shuffled, map.members_of(u), buf, local);
                const Real obs = out.observed[static_cast<Size>(u)];
                ge[u] += static_cast<Size>(permutation::at_least(s, obs));
                le[u] += static_cast<Size>(permutation::at_most(s, obs));
            }
        });

    out.p_enriched.resize(N);
    out.p_depleted.resize(N);
    out.direction.resize(N);
    for (Size u = 0; u < N; ++u) {
        Size ge = 0;
        Size le = 0;
        for (size_t t = 0; t < n_threads; ++t) {
            ge += count_ge[t][u];
            le += count_le[t][u];
        }
        out.p_enriched[u] = permutation::empirical_pvalue(ge, n_permutations);
        out.p_depleted[u] = permutation::empirical_pvalue(le, n_permutations);
        out.direction[u] = detail::classify(out.p_enriched[u], out.p_depleted[u]);
    }

    return out;
}

inline FeatureScores score_feature(
    Array<const Real> values,
    const neighborhood::NeighborhoodMap& map,
    permutation::Aggregate aggregate,
    Size n_permutations,
    uint64_t seed,
    bool parallel = false
) {
    return permutation::visit_aggregate(aggregate, [&](auto fn) {
        return score_feature(values, map, fn, n_permutations, seed, parallel);
    });
}

// =============================================================================
// All Features
// =============================================================================

struct ScoreOptions {
    permutation::Aggregate aggregate = permutation::Aggregate::Mean;
    Size n_permutations = config::DEFAULT_N_PERMUTATIONS;
    uint64_t seed = 0;
    // Features admitted per wave; 0 means the worker pool size
    Size max_inflight_features = 0;
    // Spread permutation blocks over workers when features cannot fill the pool
    bool permutation_parallel = true;
    const safe::threading::CancellationToken* cancel = nullptr;
    // Called with the feature index once that feature is committed or
    // skipped as degenerate. May run concurrently from several workers.
    std::function<void(Index)> on_feature_done;
};

namespace detail {

inline void mark_unscored(EnrichmentResult& result, Index f, FeatureStatus status, const std::string& reason) {
    const Real nan = std::numeric_limits<Real>::quiet_NaN();
    for (Index u = 0; u < result.n_nodes; ++u) {
        const Size c = result.cell(u, f);
        result.observed[c] = nan;
        result.p_enriched[c] = config::UNDEFINED_PVALUE;
        result.p_depleted[c] = config::UNDEFINED_PVALUE;
        result.direction[c] = Direction::Undefined;
    }
    result.status[static_cast<Size>(f)] = status;
    result.status_reason[static_cast<Size>(f)] = reason;
}

inline void commit(EnrichmentResult& result, Index f, const FeatureScores& scores) {
    for (Index u = 0; u < result.n_nodes; ++u) {
        const Size c = result.cell(u, f);
        const Size k = static_cast<Size>(u);
        result.observed[c] = scores.observed[k];
        result.p_enriched[c] = scores.p_enriched[k];
        result.p_depleted[c] = scores.p_depleted[k];
        result.direction[c] = scores.direction[k];
    }
    result.status[static_cast<Size>(f)] = FeatureStatus::Scored;
}

} // namespace detail

/// Score every feature column of `features` (rows in graph node order).
///
/// Degenerate features are recorded as skipped with every cell Undefined.
/// Features are admitted in waves of `max_inflight_features`; the cancel
/// token is polled before each feature starts and unstarted features are
/// reported Cancelled.
inline EnrichmentResult score(
    const Graph& graph,
    const neighborhood::NeighborhoodMap& map,
    const FeatureMatrix& features,
    const ScoreOptions& options = {}
) {
    const Index n = graph.num_nodes();
    SAFE_CHECK_GRAPH(map.num_nodes() == n, "Scoring: neighborhood map does not match graph");
    SAFE_CHECK_GRAPH(features.rows() == n, "Scoring: feature rows do not match graph nodes");
    for (Index u = 0; u < n; ++u) {
        SAFE_CHECK_GRAPH(features.sample_ids()[static_cast<Size>(u)] == graph.node_ids()[static_cast<Size>(u)],
            "Scoring: feature rows are not aligned to graph node order");
    }

    const Index n_features = features.cols();
    const Size cells = static_cast<Size>(n) * static_cast<Size>(n_features);

    EnrichmentResult result;
    result.node_ids = graph.node_ids();
    result.feature_names = features.feature_names();
    result.n_nodes = n;
    result.n_features = n_features;
    result.n_permutations = options.n_permutations;
    result.radius = map.radius;
    result.aggregate = options.aggregate;
    result.observed.resize(cells);
    result.p_enriched.resize(cells);
    result.p_depleted.resize(cells);
    result.direction.resize(cells, Direction::Undefined);
    result.status.resize(static_cast<Size>(n_features), FeatureStatus::Cancelled);
    result.status_reason.resize(static_cast<Size>(n_features));

    const size_t n_threads = safe::threading::Scheduler::get_num_threads();
    const Size wave = options.max_inflight_features > 0 ? options.max_inflight_features : n_threads;
    const Size F = static_cast<Size>(n_features);

    auto run_feature = [&](Size f, bool block_parallel) {
        const Index fi = static_cast<Index>(f);
        if (options.cancel != nullptr && options.cancel->is_cancelled()) {
            detail::mark_unscored(result, fi, FeatureStatus::Cancelled, "run cancelled before feature started");
            return;
        }

        std::vector<Real> values(static_cast<Size>(n));
        features.copy_column(fi, Array<Real>(values.data(), values.size()));

        try {
            auto scores = score_feature(Array<const Real>(values.data(), values.size()), map,
                                        options.aggregate, options.n_permutations,
                                        permutation::feature_seed(options.seed, f), block_parallel);
            detail::commit(result, fi, scores);
        } catch (const DegenerateFeatureError& e) {
            detail::mark_unscored(result, fi, FeatureStatus::Degenerate, e.message());
        }
        if (options.on_feature_done) {
            options.on_feature_done(fi);
        }
    };

    for (Size begin = 0; begin < F; begin += wave) {
        const Size end = std::min(begin + wave, F);
        const Size in_flight = end - begin;

        const bool saturated = in_flight >= n_threads || !options.permutation_parallel;
        if (saturated && in_flight > 1 && n_threads > 1) {
            safe::threading::parallel_for(begin, end, [&](size_t f) {
                run_feature(f, false);
            });
        } else {
            for (Size f = begin; f < end; ++f) {
                run_feature(f, options.permutation_parallel);
            }
        }
    }

    return result;
}

} // namespace safe::kernel::scoring
