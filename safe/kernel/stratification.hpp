#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/kernel/multiple_testing.hpp"

#include <string>
#include <vector>

// =============================================================================
// FILE: safe/kernel/stratification.hpp
// BRIEF: Dominant-feature assignment per node
//
// Each node takes the significantly enriched feature with the smallest
// corrected p-value. Equal corrected p-values go to the first-listed feature.
// Depleted cells never make a feature dominant. Nodes with no significantly
// enriched feature get the reserved label "none".
// =============================================================================

namespace safe::kernel::stratification {

namespace config {
    inline constexpr const char* NONE_LABEL = "none";
    constexpr Index NO_FEATURE = -1;
}

struct Stratum {
    std::string label;
    Index feature = config::NO_FEATURE;
    std::vector<Index> nodes;
};

struct StratumAssignment {
    std::vector<std::string> node_ids;
    // Dominant feature index per node, NO_FEATURE for "none"
    std::vector<Index> dominant;
    std::vector<std::string> labels;

    Index n_nodes() const noexcept { return static_cast<Index>(dominant.size()); }

    const std::string& label(Index u) const { return labels.at(static_cast<Size>(u)); }
};

inline void check_feature_names(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        SAFE_CHECK_CONFIG(name != config::NONE_LABEL,
            std::string("feature name '") + config::NONE_LABEL + "' is reserved for unassigned nodes");
    }
}

/// Assign every node its dominant significantly enriched feature.
inline StratumAssignment stratify(const multiple_testing::CorrectedResult& corrected) {
    const auto& er = corrected.source();
    check_feature_names(er.feature_names);

    const Index n = er.n_nodes;
    const Index n_features = er.n_features;

    StratumAssignment out;
    out.node_ids = er.node_ids;
    out.dominant.assign(static_cast<Size>(n), config::NO_FEATURE);
    out.labels.assign(static_cast<Size>(n), config::NONE_LABEL);

    for (Index u = 0; u < n; ++u) {
        Index best = config::NO_FEATURE;
        Real best_q = Real(0);
        for (Index f = 0; f < n_features; ++f) {
            if (!corrected.is_significant(u, f)) continue;
            if (er.direction_at(u, f) != Direction::Enriched) continue;
            const Real q = corrected.q_value(u, f);
            // Strict comparison keeps the first-listed feature on exact ties
            if (best == config::NO_FEATURE || q < best_q) {
                best = f;
                best_q = q;
            }
        }
        if (best != config::NO_FEATURE) {
            out.dominant[static_cast<Size>(u)] = best;
            out.labels[static_cast<Size>(u)] = er.feature_names[static_cast<Size>(best)];
        }
    }

    return out;
}

/// Group nodes by label. Strata follow feature input order; "none" is last.
inline std::vector<Stratum> strata(
    const StratumAssignment& assignment,
    const std::vector<std::string>& feature_names
) {
    std::vector<Stratum> groups(feature_names.size() + 1);
    for (Size f = 0; f < feature_names.size(); ++f) {
        groups[f].label = feature_names[f];
        groups[f].feature = static_cast<Index>(f);
    }
    groups.back().label = config::NONE_LABEL;

    for (Index u = 0; u < assignment.n_nodes(); ++u) {
        const Index f = assignment.dominant[static_cast<Size>(u)];
        SAFE_CHECK_RANGE(f, config::NO_FEATURE, static_cast<Index>(feature_names.size()) - 1,
            "strata: dominant feature index out of range");
        auto& g = (f == config::NO_FEATURE) ? groups.back() : groups[static_cast<Size>(f)];
        g.nodes.push_back(u);
    }

    std::vector<Stratum> out;
    for (auto& g : groups) {
        if (!g.nodes.empty()) {
            out.push_back(std::move(g));
        }
    }
    return out;
}

} // namespace safe::kernel::stratification
