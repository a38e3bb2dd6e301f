#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/macros.hpp"
#include "safe/core/memory.hpp"
#include "safe/core/algo.hpp"
#include "safe/kernel/permutation.hpp"
#include "safe/kernel/multiple_testing.hpp"
#include "safe/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// =============================================================================
// FILE: safe/kernel/ordination.hpp
// BRIEF: Classical MDS of enrichment-score profiles
//
// Entities (nodes or features) are compared by the Pearson correlation r of
// their corrected-score profiles, d = sqrt(2 (1 - r)). The squared distances
// are double-centered and the top eigenpairs extracted by power iteration
// with deflation. Coordinates are v * sqrt(lambda).
// =============================================================================

namespace safe::kernel::ordination {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Index DEFAULT_DIMS = 2;
    constexpr Index DEFAULT_MAX_ITER = 2000;
    constexpr Real DEFAULT_TOLERANCE = Real(1e-12);
    constexpr Real EPSILON = Real(1e-15);
    constexpr uint64_t INIT_SEED = 42;
    constexpr Real DEFAULT_ARROW_LENGTH = Real(1);
}

enum class AxisMode : int8_t {
    Nodes = 0,
    Features = 1
};

inline constexpr auto axis_mode_name(AxisMode m) noexcept -> const char* {
    return m == AxisMode::Nodes ? "nodes" : "features";
}

// =============================================================================
// Types
// =============================================================================

/// Entity x axis profile table, row-major
struct ProfileMatrix {
    std::vector<std::string> entities;
    Index n_axes = 0;
    std::vector<Real> values;

    Index n_entities() const noexcept { return static_cast<Index>(entities.size()); }

    const Real* row(Index i) const noexcept {
        return values.data() + static_cast<Size>(i) * static_cast<Size>(n_axes);
    }
};

struct Embedding {
    AxisMode mode = AxisMode::Nodes;
    std::vector<std::string> entities;
    Index dims = 0;
    std::vector<Real> coords;           // n_entities x dims, row-major
    std::vector<Real> eigenvalues;      // per axis
    std::vector<Real> explained;        // eigenvalue / total variance

    Index n_entities() const noexcept { return static_cast<Index>(entities.size()); }

    Real coord(Index i, Index k) const noexcept {
        return coords[static_cast<Size>(i) * static_cast<Size>(dims) + static_cast<Size>(k)];
    }

    Index find(const std::string& name) const {
        auto it = std::find(entities.begin(), entities.end(), name);
        SAFE_CHECK_ARG(it != entities.end(), "Embedding: unknown entity '" + name + "'");
        return static_cast<Index>(it - entities.begin());
    }
};

struct Arrow {
    std::string feature;
    Real x = 0;
    Real y = 0;
};

namespace detail {

SAFE_FORCE_INLINE void normalize_l2(Real* v, Size n) noexcept {
    const Real norm = std::sqrt(safe::algo::dot(v, v, n));
    if (norm > config::EPSILON) {
        safe::algo::scale(v, n, Real(1) / norm);
    }
}

SAFE_FORCE_INLINE Real max_abs_diff(const Real* a, const Real* b, Size n) noexcept {
    Real m = 0;
    for (Size i = 0; i < n; ++i) {
        m = std::max(m, std::abs(a[i] - b[i]));
    }
    return m;
}

// y = (M + shift * I) x for dense symmetric M
inline void shifted_matvec(const Real* M, Real shift, const Real* x, Real* y, Size n) {
    safe::threading::parallel_for(Size(0), n, [&](size_t i) {
        y[i] = safe::algo::dot(M + i * n, x, n) + shift * x[i];
    });
}

// Largest component magnitude is made positive
inline void fix_sign(Real* v, Size n) noexcept {
    Size arg = 0;
    for (Size i = 1; i < n; ++i) {
        if (std::abs(v[i]) > std::abs(v[arg])) arg = i;
    }
    if (v[arg] < 0) {
        safe::algo::scale(v, n, Real(-1));
    }
}

} // namespace detail

// =============================================================================
// Distances
// =============================================================================

/// Correlation distance matrix, n_entities x n_entities, row-major.
inline std::vector<Real> correlation_distance(const ProfileMatrix& profiles) {
    const Index n = profiles.n_entities();
    const Size N = static_cast<Size>(n);
    const Size m = static_cast<Size>(profiles.n_axes);

    // Center and normalize each profile; zero-variance rows stay zero
    std::vector<Real> z(profiles.values);
    std::vector<std::uint8_t> flat(N, 0);
    for (Size i = 0; i < N; ++i) {
        Real* row = z.data() + i * m;
        const Real mean = m > 0 ? safe::algo::sum(row, m) / static_cast<Real>(m) : Real(0);
        for (Size k = 0; k < m; ++k) row[k] -= mean;
        const Real norm = std::sqrt(safe::algo::dot(row, row, m));
        if (norm > config::EPSILON) {
            safe::algo::scale(row, m, Real(1) / norm);
        } else {
            std::fill(row, row + m, Real(0));
            flat[i] = 1;
        }
    }

    std::vector<Real> D(N * N, Real(0));
    safe::threading::parallel_for(Size(0), N, [&](size_t i) {
        for (Size j = 0; j < N; ++j) {
            if (i == j) continue;
            Real r = 0;
            if (!flat[i] && !flat[j]) {
                r = std::clamp(safe::algo::dot(z.data() + i * m, z.data() + j * m, m), Real(-1), Real(1));
            }
            D[i * N + j] = std::sqrt(Real(2) * (Real(1) - r));
        }
    });

    return D;
}

// =============================================================================
// Classical MDS
// =============================================================================

/// Embed a distance matrix into `dims` axes.
///
/// @throws InsufficientRankError if fewer than dims + 1 entities
inline void classical_mds(
    const std::vector<Real>& D,
    Index n,
    Index dims,
    std::vector<Real>& coords,
    std::vector<Real>& eigenvalues,
    std::vector<Real>& explained,
    Index max_iter = config::DEFAULT_MAX_ITER
) {
    SAFE_CHECK_CONFIG(dims >= 1, "Ordination: target dimensions must be at least 1");
    if (n < dims + 1) {
        throw InsufficientRankError("Ordination: " + std::to_string(n) + " entities cannot span " +
                                    std::to_string(dims) + " axes (need at least " +
                                    std::to_string(dims + 1) + ")");
    }
    const Size N = static_cast<Size>(n);
    const Size K = static_cast<Size>(dims);
    SAFE_CHECK_DIM(D.size() == N * N, "Ordination: distance matrix is not n x n");

    // B = -1/2 J D^2 J
    std::vector<Real> B(N * N);
    std::vector<Real> row_mean(N, Real(0));
    Real grand_mean = 0;
    for (Size i = 0; i < N; ++i) {
        for (Size j = 0; j < N; ++j) {
            const Real d2 = D[i * N + j] * D[i * N + j];
            B[i * N + j] = d2;
            row_mean[i] += d2;
        }
        row_mean[i] /= static_cast<Real>(N);
        grand_mean += row_mean[i];
    }
    grand_mean /= static_cast<Real>(N);
    for (Size i = 0; i < N; ++i) {
        for (Size j = 0; j < N; ++j) {
            B[i * N + j] = Real(-0.5) * (B[i * N + j] - row_mean[i] - row_mean[j] + grand_mean);
        }
    }

    Real trace = 0;
    Real shift = 0;
    for (Size i = 0; i < N; ++i) {
        trace += B[i * N + i];
        Real row_abs = 0;
        for (Size j = 0; j < N; ++j) row_abs += std::abs(B[i * N + j]);
        shift = std::max(shift, row_abs);
    }

    // Power iteration on B + shift*I so the dominant pairs are the largest
    // algebraic eigenvalues of B
    std::vector<Real> vecs(K * N);
    eigenvalues.assign(K, Real(0));
    std::vector<Real> temp(N);

    permutation::detail::FastRNG rng(config::INIT_SEED);
    for (Size c = 0; c < K; ++c) {
        Real* v = vecs.data() + c * N;
        for (Size i = 0; i < N; ++i) {
            v[i] = static_cast<Real>(rng.uniform()) - Real(0.5);
        }
        detail::normalize_l2(v, N);
    }

    for (Size c = 0; c < K; ++c) {
        Real* v = vecs.data() + c * N;
        Real lambda = 0;

        for (Index iter = 0; iter < max_iter; ++iter) {
            detail::shifted_matvec(B.data(), shift, v, temp.data(), N);

            for (Size p = 0; p < c; ++p) {
                const Real* v_prev = vecs.data() + p * N;
                const Real proj = safe::algo::dot(temp.data(), v_prev, N);
                safe::algo::axpy(-proj, v_prev, temp.data(), N);
            }

            lambda = safe::algo::dot(v, temp.data(), N);
            detail::normalize_l2(temp.data(), N);

            const Real diff = detail::max_abs_diff(temp.data(), v, N);
            std::memcpy(v, temp.data(), sizeof(Real) * N);
            if (diff < config::DEFAULT_TOLERANCE) break;
        }

        detail::fix_sign(v, N);
        eigenvalues[c] = lambda - shift;
    }

    coords.assign(N * K, Real(0));
    explained.assign(K, Real(0));
    for (Size c = 0; c < K; ++c) {
        const Real lambda = std::max(eigenvalues[c], Real(0));
        const Real s = std::sqrt(lambda);
        const Real* v = vecs.data() + c * N;
        for (Size i = 0; i < N; ++i) {
            coords[i * K + c] = v[i] * s;
        }
        explained[c] = trace > config::EPSILON ? lambda / trace : Real(0);
    }
}

inline Embedding embed(const ProfileMatrix& profiles, AxisMode mode, Index dims = config::DEFAULT_DIMS) {
    SAFE_CHECK_CONFIG(dims >= 1, "Ordination: target dimensions must be at least 1");
    const Index n = profiles.n_entities();
    if (n < dims + 1) {
        throw InsufficientRankError("Ordination: " + std::to_string(n) + " entities cannot span " +
                                    std::to_string(dims) + " axes");
    }

    Embedding out;
    out.mode = mode;
    out.entities = profiles.entities;
    out.dims = dims;
    classical_mds(correlation_distance(profiles), n, dims, out.coords, out.eigenvalues, out.explained);
    return out;
}

// =============================================================================
// Profiles
// =============================================================================

/// Profiles of one corrected result
inline ProfileMatrix profiles(const multiple_testing::CorrectedResult& corrected, AxisMode mode) {
    const auto& er = corrected.source();
    const Index n = er.n_nodes;
    const Index n_features = er.n_features;

    ProfileMatrix p;
    if (mode == AxisMode::Nodes) {
        p.entities = er.node_ids;
        p.n_axes = n_features;
        p.values = corrected.corrected_score;
    } else {
        p.entities = er.feature_names;
        p.n_axes = n;
        p.values.resize(static_cast<Size>(n) * static_cast<Size>(n_features));
        for (Index f = 0; f < n_features; ++f) {
            for (Index u = 0; u < n; ++u) {
                p.values[static_cast<Size>(f) * static_cast<Size>(n) + static_cast<Size>(u)] =
                    corrected.score(u, f);
            }
        }
    }
    return p;
}

/// Profiles of two results aligned onto the union of nodes and features.
/// Missing (node, feature) pairs contribute zero.
///
/// @throws ConfigurationError if a feature name appears in both results
inline ProfileMatrix joint_profiles(
    const multiple_testing::CorrectedResult& a,
    const multiple_testing::CorrectedResult& b,
    AxisMode mode
) {
    const auto& ea = a.source();
    const auto& eb = b.source();

    std::unordered_set<std::string> names(ea.feature_names.begin(), ea.feature_names.end());
    for (const auto& name : eb.feature_names) {
        SAFE_CHECK_CONFIG(names.count(name) == 0,
            "Ordination: feature '" + name + "' appears in both results");
    }

    // Node union: first result's order, then new nodes of the second
    std::vector<std::string> nodes = ea.node_ids;
    std::unordered_map<std::string, Index> node_pos;
    for (Size i = 0; i < nodes.size(); ++i) {
        node_pos.emplace(nodes[i], static_cast<Index>(i));
    }
    for (const auto& id : eb.node_ids) {
        if (node_pos.emplace(id, static_cast<Index>(nodes.size())).second) {
            nodes.push_back(id);
        }
    }

    std::vector<std::string> features = ea.feature_names;
    features.insert(features.end(), eb.feature_names.begin(), eb.feature_names.end());

    const Size n_nodes = nodes.size();
    const Size n_features = features.size();
    // Dense union score table, node-major
    std::vector<Real> table(n_nodes * n_features, Real(0));
    const Size offset_b = ea.feature_names.size();
    for (Index u = 0; u < ea.n_nodes; ++u) {
        const Size row = static_cast<Size>(node_pos.at(ea.node_ids[static_cast<Size>(u)]));
        for (Index f = 0; f < ea.n_features; ++f) {
            table[row * n_features + static_cast<Size>(f)] = a.score(u, f);
        }
    }
    for (Index u = 0; u < eb.n_nodes; ++u) {
        const Size row = static_cast<Size>(node_pos.at(eb.node_ids[static_cast<Size>(u)]));
        for (Index f = 0; f < eb.n_features; ++f) {
            table[row * n_features + offset_b + static_cast<Size>(f)] = b.score(u, f);
        }
    }

    ProfileMatrix p;
    if (mode == AxisMode::Nodes) {
        p.entities = std::move(nodes);
        p.n_axes = static_cast<Index>(n_features);
        p.values = std::move(table);
    } else {
        p.entities = std::move(features);
        p.n_axes = static_cast<Index>(n_nodes);
        p.values.resize(n_nodes * n_features);
        for (Size f = 0; f < n_features; ++f) {
            for (Size u = 0; u < n_nodes; ++u) {
                p.values[f * n_nodes + u] = table[u * n_features + f];
            }
        }
    }
    return p;
}

// =============================================================================
// Projection
// =============================================================================

inline Embedding project(
    const multiple_testing::CorrectedResult& corrected,
    AxisMode mode,
    Index target_dims = config::DEFAULT_DIMS
) {
    return embed(profiles(corrected, mode), mode, target_dims);
}

inline Embedding project_joint(
    const multiple_testing::CorrectedResult& a,
    const multiple_testing::CorrectedResult& b,
    AxisMode mode,
    Index target_dims = config::DEFAULT_DIMS
) {
    return embed(joint_profiles(a, b, mode), mode, target_dims);
}

// =============================================================================
// Feature Arrows
// =============================================================================

/// Biplot arrows of features over a 2-D node layout.
///
/// Enrichment scores below the alpha threshold are zeroed, each node's
/// scores are max-abs scaled, and a feature's arrow is the mean of its
/// scaled scores times node positions. Arrow lengths are proportional to the
/// feature's total score, the largest reaching `max_length`.
///
/// @param layout n_nodes x 2 row-major node coordinates
inline std::vector<Arrow> feature_arrows(
    const multiple_testing::CorrectedResult& corrected,
    const std::vector<Real>& layout,
    Real max_length = config::DEFAULT_ARROW_LENGTH
) {
    const auto& er = corrected.source();
    const Index n = er.n_nodes;
    const Index n_features = er.n_features;
    const Size N = static_cast<Size>(n);
    const Size F = static_cast<Size>(n_features);
    SAFE_CHECK_DIM(layout.size() == N * 2, "feature_arrows: layout must be n_nodes x 2");
    SAFE_CHECK_ARG(max_length > Real(0), "feature_arrows: max_length must be positive");

    const Real threshold = scoring::score_threshold(corrected.alpha, er.n_permutations);

    std::vector<Real> s(N * F, Real(0));
    std::vector<Real> column_sum(F, Real(0));
    for (Size u = 0; u < N; ++u) {
        for (Size f = 0; f < F; ++f) {
            const Real v = corrected.corrected_score[u * F + f];
            if (v >= threshold) {
                s[u * F + f] = v;
                column_sum[f] += v;
            }
        }
    }

    // Max-abs scale each node's row
    std::vector<Real> scaled(s);
    for (Size u = 0; u < N; ++u) {
        Real* row = scaled.data() + u * F;
        Real m = 0;
        for (Size f = 0; f < F; ++f) m = std::max(m, std::abs(row[f]));
        if (m > config::EPSILON) {
            safe::algo::scale(row, F, Real(1) / m);
        }
    }

    Real max_sum = 0;
    for (Size f = 0; f < F; ++f) max_sum = std::max(max_sum, std::abs(column_sum[f]));

    std::vector<Arrow> arrows(F);
    for (Size f = 0; f < F; ++f) {
        Real x = 0;
        Real y = 0;
        for (Size u = 0; u < N; ++u) {
            x += scaled[u * F + f] * layout[u * 2];
            y += scaled[u * F + f] * layout[u * 2 + 1];
        }
        x /= static_cast<Real>(N);
        y /= static_cast<Real>(N);

        const Real length = std::sqrt(x * x + y * y);
        const Real weight = max_sum > config::EPSILON ? column_sum[f] / max_sum : Real(0);
        const Real ratio = length > config::EPSILON ? max_length * weight / length : Real(0);

        arrows[f].feature = er.feature_names[f];
        arrows[f].x = x * ratio;
        arrows[f].y = y * ratio;
    }
    return arrows;
}

/// Arrows over the first two axes of a node-mode embedding
inline std::vector<Arrow> feature_arrows(
    const multiple_testing::CorrectedResult& corrected,
    const Embedding& node_embedding,
    Real max_length = config::DEFAULT_ARROW_LENGTH
) {
    SAFE_CHECK_ARG(node_embedding.mode == AxisMode::Nodes, "feature_arrows: embedding must be in node mode");
    SAFE_CHECK_ARG(node_embedding.dims >= 2, "feature_arrows: embedding needs at least 2 axes");
    SAFE_CHECK_DIM(node_embedding.n_entities() == corrected.n_nodes(),
        "feature_arrows: embedding does not match node count");

    std::vector<Real> layout(static_cast<Size>(corrected.n_nodes()) * 2);
    for (Index u = 0; u < corrected.n_nodes(); ++u) {
        layout[static_cast<Size>(u) * 2] = node_embedding.coord(u, 0);
        layout[static_cast<Size>(u) * 2 + 1] = node_embedding.coord(u, 1);
    }
    return feature_arrows(corrected, layout, max_length);
}

} // namespace safe::kernel::ordination
