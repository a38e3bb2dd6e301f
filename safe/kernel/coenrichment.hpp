#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/macros.hpp"
#include "safe/kernel/multiple_testing.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

// =============================================================================
// FILE: safe/kernel/coenrichment.hpp
// BRIEF: Overlap of enriched node sets between a target and other features
//
// For each other feature a 2x2 table of nodes is built (both enriched,
// target only, other only, neither). Over-overlap is tested with the upper
// tail of the hypergeometric distribution; p-values are BH-adjusted across
// the compared features.
// =============================================================================

namespace safe::kernel::coenrichment {

struct CoEnrichment {
    Index feature = 0;
    std::string name;
    Index both = 0;
    Index target_only = 0;
    Index other_only = 0;
    Index neither = 0;
    Real p_value = 1;
    Real q_value = 1;
};

namespace detail {

SAFE_FORCE_INLINE Real log_binomial(Index n, Index k) {
    if (SAFE_UNLIKELY(k == 0 || k == n)) return Real(0);
    return static_cast<Real>(std::lgamma(static_cast<double>(n + 1)) -
                             std::lgamma(static_cast<double>(k + 1)) -
                             std::lgamma(static_cast<double>(n - k + 1)));
}

// P(X = k), X ~ Hypergeom(N total, K successes, n draws)
SAFE_FORCE_INLINE Real hypergeom_pmf(Index k, Index N, Index K, Index n) {
    if (SAFE_UNLIKELY(k < 0 || k > K || k > n || (n - k) > (N - K))) {
        return Real(0);
    }
    const Real log_prob = log_binomial(K, k) + log_binomial(N - K, n - k) - log_binomial(N, n);
    return std::exp(log_prob);
}

// P(X >= k)
SAFE_FORCE_INLINE Real hypergeom_sf(Index k, Index N, Index K, Index n) {
    if (k <= 0) return Real(1);
    const Index max_k = std::min(n, K);
    if (SAFE_UNLIKELY(k > max_k)) return Real(0);

    Real prob = 0;
    for (Index i = k; i <= max_k; ++i) {
        prob += hypergeom_pmf(i, N, K, n);
    }
    return std::min(prob, Real(1));
}

inline std::vector<uint8_t> enriched_mask(const multiple_testing::CorrectedResult& corrected, Index f) {
    const auto& er = corrected.source();
    std::vector<uint8_t> mask(static_cast<Size>(er.n_nodes), 0);
    for (Index u = 0; u < er.n_nodes; ++u) {
        mask[static_cast<Size>(u)] = static_cast<uint8_t>(
            corrected.is_significant(u, f) && er.direction_at(u, f) == Direction::Enriched);
    }
    return mask;
}

} // namespace detail

/// One-sided over-overlap p-value of a 2x2 node table
SAFE_FORCE_INLINE Real overlap_pvalue(Index both, Index target_only, Index other_only, Index neither) {
    const Index N = both + target_only + other_only + neither;
    return detail::hypergeom_sf(both, N, both + target_only, both + other_only);
}

/// Co-enrichment of `target` with every other feature, in input order.
inline std::vector<CoEnrichment> coenrichment(
    const multiple_testing::CorrectedResult& corrected,
    Index target
) {
    const auto& er = corrected.source();
    SAFE_CHECK_RANGE(target, 0, er.n_features - 1, "coenrichment: target feature out of range");

    const auto target_mask = detail::enriched_mask(corrected, target);

    std::vector<CoEnrichment> out;
    out.reserve(static_cast<Size>(std::max<Index>(er.n_features - 1, 0)));
    for (Index f = 0; f < er.n_features; ++f) {
        if (f == target) continue;
        const auto mask = detail::enriched_mask(corrected, f);

        CoEnrichment c;
        c.feature = f;
        c.name = er.feature_names[static_cast<Size>(f)];
        for (Size u = 0; u < mask.size(); ++u) {
            const bool t = target_mask[u] != 0;
            const bool o = mask[u] != 0;
            if (t && o) ++c.both;
            else if (t) ++c.target_only;
            else if (o) ++c.other_only;
            else ++c.neither;
        }
        c.p_value = overlap_pvalue(c.both, c.target_only, c.other_only, c.neither);
        out.push_back(std::move(c));
    }

    if (!out.empty()) {
        std::vector<Real> p(out.size());
        std::vector<Real> q(out.size());
        for (Size i = 0; i < out.size(); ++i) p[i] = out[i].p_value;
        multiple_testing::benjamini_hochberg(Array<const Real>(p.data(), p.size()),
                                             Array<Real>(q.data(), q.size()));
        for (Size i = 0; i < out.size(); ++i) out[i].q_value = q[i];
    }
    return out;
}

inline std::vector<CoEnrichment> coenrichment(
    const multiple_testing::CorrectedResult& corrected,
    const std::string& target
) {
    return coenrichment(corrected, corrected.source().feature_index(target));
}

} // namespace safe::kernel::coenrichment
