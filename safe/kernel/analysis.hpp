#pragma once

#include "safe/config.hpp"
#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/graph.hpp"
#include "safe/core/dense.hpp"
#include "safe/kernel/neighborhood.hpp"
#include "safe/kernel/permutation.hpp"
#include "safe/kernel/scoring.hpp"
#include "safe/kernel/multiple_testing.hpp"
#include "safe/kernel/stratification.hpp"
#include "safe/kernel/ranking.hpp"
#include "safe/threading/cancellation.hpp"
#include "safe/threading/scheduler.hpp"

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// =============================================================================
// FILE: safe/kernel/analysis.hpp
// BRIEF: End-to-end enrichment run over one graph and its feature matrices
//
// Stages: align matrices -> neighborhoods -> scoring -> correction ->
// stratification and ranking. A run is stateless; the neighborhood index
// may be shared across runs on the same graph.
// =============================================================================

namespace safe::kernel::analysis {

struct AnalysisConfig {
    Size n_permutations = safe::defaults::PERMUTATIONS;
    Real alpha = static_cast<Real>(safe::defaults::ALPHA);
    Index radius = safe::defaults::RADIUS;
    permutation::Aggregate aggregate = permutation::Aggregate::Mean;
    multiple_testing::Correction correction = multiple_testing::Correction::BenjaminiHochberg;
    bool raw_output = false;
    std::optional<uint64_t> seed;
    // 0 means the worker pool size
    Size max_inflight_features = 0;
    bool permutation_parallel = true;
    bool verbose = false;

    /// @throws ConfigurationError on any out-of-range field
    void validate() const {
        SAFE_CHECK_CONFIG(n_permutations >= 1 && n_permutations <= safe::defaults::MAX_PERMUTATIONS,
            "AnalysisConfig: permutation count must lie in [1, " +
            std::to_string(safe::defaults::MAX_PERMUTATIONS) + "], got " + std::to_string(n_permutations));
        SAFE_CHECK_CONFIG(alpha > Real(0) && alpha < Real(1),
            "AnalysisConfig: alpha must lie in (0, 1), got " + std::to_string(alpha));
        SAFE_CHECK_CONFIG(radius >= 0 && radius <= safe::defaults::MAX_RADIUS,
            "AnalysisConfig: radius must lie in [0, " + std::to_string(safe::defaults::MAX_RADIUS) +
            "], got " + std::to_string(radius));
    }
};

struct AnalysisResult {
    AnalysisConfig config;
    uint64_t seed = 0;                  // resolved global seed
    FeatureMatrix features;             // combined, graph-aligned
    std::shared_ptr<const scoring::EnrichmentResult> enrichment;
    multiple_testing::CorrectedResult corrected;
    stratification::StratumAssignment assignment;
    std::vector<stratification::Stratum> strata;
    std::vector<ranking::FeatureSummary> ranking;

    const scoring::EnrichmentResult& scores() const noexcept { return *enrichment; }

    std::vector<Index> skipped_features() const { return enrichment->skipped_features(); }

    /// True when the run stopped early and some features were never started
    bool cancelled() const noexcept {
        for (auto s : enrichment->status) {
            if (s == scoring::FeatureStatus::Cancelled) return true;
        }
        return false;
    }
};

/// Align every matrix to graph node order and concatenate their columns.
///
/// @throws InvalidGraphError if a matrix does not map 1:1 onto the nodes
/// @throws ConfigurationError on a feature name repeated across matrices
///         or a feature named "none"
inline FeatureMatrix combine_features(const Graph& graph, const std::vector<FeatureMatrix>& matrices) {
    const Index n = graph.num_nodes();

    std::vector<std::string> names;
    std::vector<FeatureMatrix> aligned;
    aligned.reserve(matrices.size());
    std::unordered_set<std::string> seen;
    for (const auto& m : matrices) {
        for (const auto& name : m.feature_names()) {
            SAFE_CHECK_CONFIG(seen.insert(name).second,
                "combine_features: feature '" + name + "' appears in more than one matrix");
            names.push_back(name);
        }
        aligned.push_back(m.align_to(graph));
    }
    stratification::check_feature_names(names);

    const Size F = names.size();
    std::vector<Real> values(static_cast<Size>(n) * F);
    Size offset = 0;
    for (const auto& m : aligned) {
        const Index cols = m.cols();
        for (Index u = 0; u < n; ++u) {
            for (Index c = 0; c < cols; ++c) {
                values[static_cast<Size>(u) * F + offset + static_cast<Size>(c)] = m(u, c);
            }
        }
        offset += static_cast<Size>(cols);
    }

    return FeatureMatrix(graph.node_ids(), std::move(names), std::move(values));
}

/// Run the full pipeline with a caller-owned neighborhood index.
///
/// Degenerate features are skipped and reported; cancellation after at
/// least one feature started yields a partial result.
///
/// @throws ConfigurationError, InvalidGraphError before any computation
/// @throws CancelledError if cancelled before any feature was scored
inline AnalysisResult run_analysis(
    neighborhood::NeighborhoodIndex& index,
    const std::vector<FeatureMatrix>& matrices,
    const AnalysisConfig& config,
    const safe::threading::CancellationToken* cancel = nullptr
) {
    config.validate();
    SAFE_CHECK_CONFIG(!matrices.empty(), "run_analysis: no feature matrices given");

    const Graph& graph = index.graph();

    AnalysisResult out;
    out.config = config;
    out.seed = permutation::resolve_seed(config.seed);
    out.features = combine_features(graph, matrices);

    if (config.verbose) {
        std::fprintf(stderr, "INFO: SAFE run: %lld nodes, %lld edges, %lld features, "
                     "%zu permutations, radius %lld, seed %llu, %zu threads\n",
                     static_cast<long long>(graph.num_nodes()),
                     static_cast<long long>(graph.num_edges()),
                     static_cast<long long>(out.features.cols()),
                     config.n_permutations,
                     static_cast<long long>(config.radius),
                     static_cast<unsigned long long>(out.seed),
                     safe::threading::Scheduler::get_num_threads());
    }

    if (cancel != nullptr && cancel->is_cancelled()) {
        throw CancelledError("run_analysis: cancelled before any feature started");
    }

    auto map = index.get(config.radius);

    scoring::ScoreOptions options;
    options.aggregate = config.aggregate;
    options.n_permutations = config.n_permutations;
    options.seed = out.seed;
    options.max_inflight_features = config.max_inflight_features;
    options.permutation_parallel = config.permutation_parallel;
    options.cancel = cancel;

    auto enrichment = std::make_shared<const scoring::EnrichmentResult>(
        scoring::score(graph, *map, out.features, options));

    Index n_cancelled = 0;
    for (Index f = 0; f < enrichment->n_features; ++f) {
        const auto status = enrichment->status[static_cast<Size>(f)];
        if (status == scoring::FeatureStatus::Cancelled) {
            ++n_cancelled;
        } else if (status == scoring::FeatureStatus::Degenerate && config.verbose) {
            std::fprintf(stderr, "WARNING: SAFE skipped feature '%s': %s\n",
                         enrichment->feature_names[static_cast<Size>(f)].c_str(),
                         enrichment->status_reason[static_cast<Size>(f)].c_str());
        }
    }
    if (n_cancelled > 0 && n_cancelled == enrichment->n_features) {
        throw CancelledError("run_analysis: cancelled before any feature started");
    }
    if (n_cancelled > 0 && config.verbose) {
        std::fprintf(stderr, "WARNING: SAFE run cancelled, %lld of %lld features not started\n",
                     static_cast<long long>(n_cancelled),
                     static_cast<long long>(enrichment->n_features));
    }

    out.enrichment = enrichment;
    out.corrected = multiple_testing::correct(enrichment, config.alpha, config.correction, config.raw_output);
    out.assignment = stratification::stratify(out.corrected);
    out.strata = stratification::strata(out.assignment, enrichment->feature_names);
    out.ranking = ranking::rank_features(out.corrected);

    if (config.verbose) {
        std::fprintf(stderr, "INFO: SAFE run complete: %lld significant cells, %zu strata, %zu skipped\n",
                     static_cast<long long>(out.corrected.n_significant()),
                     out.strata.size(),
                     enrichment->skipped_features().size());
    }

    return out;
}

inline AnalysisResult run_analysis(
    std::shared_ptr<const Graph> graph,
    const std::vector<FeatureMatrix>& matrices,
    const AnalysisConfig& config = {},
    const safe::threading::CancellationToken* cancel = nullptr
) {
    neighborhood::NeighborhoodIndex index(std::move(graph));
    return run_analysis(index, matrices, config, cancel);
}

} // namespace safe::kernel::analysis
