#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/kernel/scoring.hpp"
#include "safe/kernel/multiple_testing.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

// =============================================================================
// FILE: safe/kernel/ranking.hpp
// BRIEF: Per-feature summary of significant nodes and feature ranking
// =============================================================================

namespace safe::kernel::ranking {

struct FeatureSummary {
    Index feature = 0;
    std::string name;
    scoring::FeatureStatus status = scoring::FeatureStatus::Scored;
    Index n_enriched = 0;       // significant and enriched
    Index n_depleted = 0;       // significant and depleted
    Index n_significant = 0;
    Real significant_ratio = 0; // n_significant / n_nodes
    Real min_q = 1;
    Real enriched_score = 0;    // sum of corrected scores over enriched nodes
};

inline std::vector<FeatureSummary> summarize(const multiple_testing::CorrectedResult& corrected) {
    const auto& er = corrected.source();
    const Index n = er.n_nodes;

    std::vector<FeatureSummary> out(static_cast<Size>(er.n_features));
    for (Index f = 0; f < er.n_features; ++f) {
        auto& s = out[static_cast<Size>(f)];
        s.feature = f;
        s.name = er.feature_names[static_cast<Size>(f)];
        s.status = er.status[static_cast<Size>(f)];
        if (!er.is_scored(f)) continue;

        for (Index u = 0; u < n; ++u) {
            s.min_q = std::min(s.min_q, corrected.q_value(u, f));
            if (!corrected.is_significant(u, f)) continue;
            ++s.n_significant;
            if (er.direction_at(u, f) == Direction::Enriched) {
                ++s.n_enriched;
                s.enriched_score += corrected.score(u, f);
            } else {
                ++s.n_depleted;
            }
        }
        s.significant_ratio = n > 0 ? static_cast<Real>(s.n_significant) / static_cast<Real>(n) : Real(0);
    }
    return out;
}

/// Summaries ordered by significant-node count (desc), minimum corrected
/// p-value (asc), then feature input order.
inline std::vector<FeatureSummary> rank_features(const multiple_testing::CorrectedResult& corrected) {
    auto summaries = summarize(corrected);
    std::stable_sort(summaries.begin(), summaries.end(),
        [](const FeatureSummary& a, const FeatureSummary& b) {
            if (a.n_significant != b.n_significant) return a.n_significant > b.n_significant;
            return a.min_q < b.min_q;
        });
    return summaries;
}

} // namespace safe::kernel::ranking
