#pragma once

// =============================================================================
// SAFE Tests - Test Data Generators
// =============================================================================
//
// Structured networks and feature tables with known enrichment patterns.
//
// Features:
//   - Ring, path, star and two-clique networks
//   - Indicator and continuous features over node positions
//   - Random feature tables, reproducible with seed control
//   - Hand-built enrichment results with chosen p-values
//   - C string arrays for the C API
//
// =============================================================================

#include "safe/binding/c_api/core/core.h"
#include "safe/core/graph.hpp"
#include "safe/core/dense.hpp"
#include "safe/kernel/scoring.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace safe::test {

using EdgeList = std::vector<std::pair<safe_index_t, safe_index_t>>;

// =============================================================================
// Random Number Generator
// =============================================================================

class Random {
public:
    explicit Random(uint64_t seed = 42) : rng_(seed) {}

    /// Uniform random double in [min, max]
    [[nodiscard]] double uniform(double min = 0.0, double max = 1.0) {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(rng_);
    }

    /// Uniform random integer in [min, max]
    [[nodiscard]] int64_t uniform_int(int64_t min, int64_t max) {
        std::uniform_int_distribution<int64_t> dist(min, max);
        return dist(rng_);
    }

    [[nodiscard]] double normal(double mean = 0.0, double stddev = 1.0) {
        std::normal_distribution<double> dist(mean, stddev);
        return dist(rng_);
    }

    [[nodiscard]] std::mt19937_64& engine() { return rng_; }

private:
    std::mt19937_64 rng_;
};

// =============================================================================
// Node Identifiers
// =============================================================================

/// "n0", "n1", ...
inline std::vector<std::string> node_ids(safe_index_t n, const std::string& prefix = "n") {
    std::vector<std::string> ids;
    ids.reserve(static_cast<std::size_t>(n));
    for (safe_index_t i = 0; i < n; ++i) {
        ids.push_back(prefix + std::to_string(i));
    }
    return ids;
}

/// Owning array of C strings for the C API
class CStrings {
public:
    explicit CStrings(std::vector<std::string> values) : values_(std::move(values)) {
        ptrs_.reserve(values_.size());
        for (const auto& v : values_) {
            ptrs_.push_back(v.c_str());
        }
    }

    CStrings(const CStrings&) = delete;
    CStrings& operator=(const CStrings&) = delete;

    [[nodiscard]] const char* const* data() const noexcept { return ptrs_.data(); }
    [[nodiscard]] safe_size_t size() const noexcept { return ptrs_.size(); }

private:
    std::vector<std::string> values_;
    std::vector<const char*> ptrs_;
};

// =============================================================================
// Edge Lists
// =============================================================================

/// Cycle 0-1-...-(n-1)-0
inline EdgeList ring_edges(safe_index_t n) {
    EdgeList edges;
    for (safe_index_t i = 0; i < n; ++i) {
        edges.emplace_back(i, (i + 1) % n);
    }
    return edges;
}

/// Path 0-1-...-(n-1)
inline EdgeList path_edges(safe_index_t n) {
    EdgeList edges;
    for (safe_index_t i = 0; i + 1 < n; ++i) {
        edges.emplace_back(i, i + 1);
    }
    return edges;
}

/// Hub 0 connected to every other node
inline EdgeList star_edges(safe_index_t n) {
    EdgeList edges;
    for (safe_index_t i = 1; i < n; ++i) {
        edges.emplace_back(0, i);
    }
    return edges;
}

/// Cliques {0..k-1} and {k..2k-1} joined by the edge (k-1, k)
inline EdgeList two_clique_edges(safe_index_t k) {
    EdgeList edges;
    for (safe_index_t base : {safe_index_t(0), k}) {
        for (safe_index_t i = 0; i < k; ++i) {
            for (safe_index_t j = i + 1; j < k; ++j) {
                edges.emplace_back(base + i, base + j);
            }
        }
    }
    edges.emplace_back(k - 1, k);
    return edges;
}

// =============================================================================
// Graphs
// =============================================================================

inline std::shared_ptr<const safe::Graph> make_graph(safe_index_t n, const EdgeList& edges) {
    return std::make_shared<const safe::Graph>(safe::Graph::from_index_edges(node_ids(n), edges));
}

inline std::shared_ptr<const safe::Graph> ring_graph(safe_index_t n) {
    return make_graph(n, ring_edges(n));
}

inline std::shared_ptr<const safe::Graph> path_graph(safe_index_t n) {
    return make_graph(n, path_edges(n));
}

inline std::shared_ptr<const safe::Graph> two_clique_graph(safe_index_t k) {
    return make_graph(2 * k, two_clique_edges(k));
}

// =============================================================================
// Features
// =============================================================================

/// One column, value(i) for node i
inline safe::FeatureMatrix feature_column(
    safe_index_t n,
    const std::string& name,
    const std::function<double(safe_index_t)>& value
) {
    std::vector<safe_real_t> values(static_cast<std::size_t>(n));
    for (safe_index_t i = 0; i < n; ++i) {
        values[static_cast<std::size_t>(i)] = static_cast<safe_real_t>(value(i));
    }
    return safe::FeatureMatrix(node_ids(n), {name}, std::move(values));
}

/// 1 on nodes [begin, end), 0 elsewhere
inline safe::FeatureMatrix block_indicator(
    safe_index_t n,
    safe_index_t begin,
    safe_index_t end,
    const std::string& name
) {
    return feature_column(n, name, [=](safe_index_t i) { return (i >= begin && i < end) ? 1.0 : 0.0; });
}

/// Several named columns side by side, row-major node x feature
inline safe::FeatureMatrix feature_table(
    safe_index_t n,
    const std::vector<std::string>& names,
    const std::function<double(safe_index_t, std::size_t)>& value
) {
    std::vector<safe_real_t> values(static_cast<std::size_t>(n) * names.size());
    for (safe_index_t i = 0; i < n; ++i) {
        for (std::size_t f = 0; f < names.size(); ++f) {
            values[static_cast<std::size_t>(i) * names.size() + f] = static_cast<safe_real_t>(value(i, f));
        }
    }
    return safe::FeatureMatrix(node_ids(n), names, std::move(values));
}

/// Independent standard normal columns "f0", "f1", ...
inline safe::FeatureMatrix random_features(safe_index_t n, std::size_t n_features, Random& rng) {
    std::vector<std::string> names;
    for (std::size_t f = 0; f < n_features; ++f) {
        names.push_back("f" + std::to_string(f));
    }
    std::vector<safe_real_t> values(static_cast<std::size_t>(n) * n_features);
    for (auto& v : values) {
        v = static_cast<safe_real_t>(rng.normal());
    }
    return safe::FeatureMatrix(node_ids(n), std::move(names), std::move(values));
}

/// Same table with rows listed in reverse order
inline safe::FeatureMatrix reversed_rows(const safe::FeatureMatrix& m) {
    const auto rows = m.rows();
    const auto cols = m.cols();
    std::vector<std::string> ids(m.sample_ids().rbegin(), m.sample_ids().rend());
    std::vector<safe_real_t> values(static_cast<std::size_t>(rows * cols));
    for (safe_index_t r = 0; r < rows; ++r) {
        for (safe_index_t c = 0; c < cols; ++c) {
            values[static_cast<std::size_t>(r * cols + c)] = m(rows - 1 - r, c);
        }
    }
    return safe::FeatureMatrix(std::move(ids), m.feature_names(), std::move(values));
}

// =============================================================================
// Enrichment Results
// =============================================================================

/// One-sided p-values of a single cell
struct CellP {
    double enriched;
    double depleted;
};

/// Enrichment over nodes "n0".. with every feature scored and the cell
/// p-values given by p(u, f). Directions follow the smaller side.
inline safe::kernel::scoring::EnrichmentResult synthetic_enrichment(
    safe_index_t n,
    const std::vector<std::string>& names,
    const std::function<CellP(safe_index_t, std::size_t)>& p,
    std::size_t n_permutations = 999
) {
    namespace sc = safe::kernel::scoring;
    sc::EnrichmentResult r;
    r.node_ids = node_ids(n);
    r.feature_names = names;
    r.n_nodes = n;
    r.n_features = static_cast<safe_index_t>(names.size());
    r.n_permutations = n_permutations;
    r.radius = 1;

    const std::size_t cells = static_cast<std::size_t>(n) * names.size();
    r.observed.assign(cells, 0.0);
    r.p_enriched.resize(cells);
    r.p_depleted.resize(cells);
    r.direction.resize(cells);
    r.status.assign(names.size(), sc::FeatureStatus::Scored);
    r.status_reason.assign(names.size(), std::string());

    for (safe_index_t u = 0; u < n; ++u) {
        for (std::size_t f = 0; f < names.size(); ++f) {
            const auto c = r.cell(u, static_cast<safe_index_t>(f));
            const CellP cp = p(u, f);
            r.p_enriched[c] = cp.enriched;
            r.p_depleted[c] = cp.depleted;
            r.direction[c] = cp.enriched < cp.depleted ? safe::Direction::Enriched
                           : cp.depleted < cp.enriched ? safe::Direction::Depleted
                           : safe::Direction::Neither;
        }
    }
    return r;
}

} // namespace safe::test
