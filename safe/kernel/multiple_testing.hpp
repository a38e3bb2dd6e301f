#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/memory.hpp"
#include "safe/kernel/scoring.hpp"
#include "safe/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>
#include <vector>

// =============================================================================
// FILE: safe/kernel/multiple_testing.hpp
// BRIEF: Per-feature multiple testing correction of enrichment p-values
//
// Corrections run independently per feature over all of its node p-values.
// Corrected p-values do not depend on alpha, so the significance mask is
// monotone in alpha.
// =============================================================================

namespace safe::kernel::multiple_testing {

namespace config {
    constexpr Real DEFAULT_ALPHA = Real(0.05);
    constexpr Real MAX_PVALUE = Real(1.0);
}

enum class Correction : int8_t {
    BenjaminiHochberg = 0,
    Bonferroni = 1,
    Holm = 2,
    None = 3
};

inline constexpr auto correction_name(Correction c) noexcept -> const char* {
    switch (c) {
        case Correction::BenjaminiHochberg: return "benjamini-hochberg";
        case Correction::Bonferroni: return "bonferroni";
        case Correction::Holm: return "holm";
        case Correction::None: return "none";
    }
    return "benjamini-hochberg";
}

namespace detail {

// Indices ordered by ascending p-value. Tied p-values receive the same
// adjusted value whatever their relative order.
inline void sort_indices_by_pvalue(Array<const Real> p_values, Index* indices) {
    const Size n = p_values.size();
    std::iota(indices, indices + n, Index(0));
    std::sort(indices, indices + n, [&](Index a, Index b) {
        return p_values[a] < p_values[b];
    });
}

} // namespace detail

// =============================================================================
// Benjamini-Hochberg FDR correction
// =============================================================================

inline void benjamini_hochberg(
    Array<const Real> p_values,
    Array<Real> adjusted_p_values
) {
    SAFE_CHECK_DIM(p_values.size() == adjusted_p_values.size(),
        "p_values and adjusted_p_values must have same length");

    const Size n = p_values.size();
    if (n == 0) return;

    auto sorted_indices_ptr = safe::memory::aligned_alloc<Index>(n, SAFE_ALIGNMENT);
    auto adjusted_sorted_ptr = safe::memory::aligned_alloc<Real>(n, SAFE_ALIGNMENT);
    Index* sorted_indices = sorted_indices_ptr.get();
    Real* adjusted_sorted = adjusted_sorted_ptr.get();

    detail::sort_indices_by_pvalue(p_values, sorted_indices);

    // p_adj[i] = p[i] * n / rank
    const Real n_real = static_cast<Real>(n);
    for (Size i = 0; i < n; ++i) {
        adjusted_sorted[i] = p_values[sorted_indices[i]] * n_real / static_cast<Real>(i + 1);
    }

    // Cumulative minimum from right to left
    adjusted_sorted[n - 1] = std::min(adjusted_sorted[n - 1], config::MAX_PVALUE);
    for (Size i = n - 1; i > 0; --i) {
        adjusted_sorted[i - 1] = std::min(adjusted_sorted[i - 1], adjusted_sorted[i]);
    }

    for (Size i = 0; i < n; ++i) {
        adjusted_p_values[sorted_indices[i]] = adjusted_sorted[i];
    }
}

// =============================================================================
// Bonferroni correction
// =============================================================================

inline void bonferroni(
    Array<const Real> p_values,
    Array<Real> adjusted_p_values
) {
    SAFE_CHECK_DIM(p_values.size() == adjusted_p_values.size(),
        "p_values and adjusted_p_values must have same length");

    const Real n_real = static_cast<Real>(p_values.size());
    for (Size i = 0; i < p_values.size(); ++i) {
        const auto k = static_cast<Index>(i);
        adjusted_p_values[k] = std::min(p_values[k] * n_real, config::MAX_PVALUE);
    }
}

// =============================================================================
// Holm-Bonferroni step-down procedure
// =============================================================================

inline void holm_bonferroni(
    Array<const Real> p_values,
    Array<Real> adjusted_p_values
) {
    SAFE_CHECK_DIM(p_values.size() == adjusted_p_values.size(),
        "p_values and adjusted_p_values must have same length");

    const Size n = p_values.size();
    if (n == 0) return;

    auto sorted_indices_ptr = safe::memory::aligned_alloc<Index>(n, SAFE_ALIGNMENT);
    auto adjusted_sorted_ptr = safe::memory::aligned_alloc<Real>(n, SAFE_ALIGNMENT);
    Index* sorted_indices = sorted_indices_ptr.get();
    Real* adjusted_sorted = adjusted_sorted_ptr.get();

    detail::sort_indices_by_pvalue(p_values, sorted_indices);

    // p_adj[i] = p[i] * (n - rank + 1), cumulative maximum, capped at 1
    const Real n_real = static_cast<Real>(n);
    for (Size i = 0; i < n; ++i) {
        adjusted_sorted[i] = p_values[sorted_indices[i]] * (n_real - static_cast<Real>(i));
    }
    for (Size i = 1; i < n; ++i) {
        adjusted_sorted[i] = std::max(adjusted_sorted[i], adjusted_sorted[i - 1]);
    }
    for (Size i = 0; i < n; ++i) {
        adjusted_p_values[sorted_indices[i]] = std::min(adjusted_sorted[i], config::MAX_PVALUE);
    }
}

inline void adjust(
    Correction method,
    Array<const Real> p_values,
    Array<Real> adjusted_p_values
) {
    switch (method) {
        case Correction::BenjaminiHochberg:
            benjamini_hochberg(p_values, adjusted_p_values);
            return;
        case Correction::Bonferroni:
            bonferroni(p_values, adjusted_p_values);
            return;
        case Correction::Holm:
            holm_bonferroni(p_values, adjusted_p_values);
            return;
        case Correction::None:
            SAFE_CHECK_DIM(p_values.size() == adjusted_p_values.size(),
                "p_values and adjusted_p_values must have same length");
            std::copy(p_values.begin(), p_values.end(), adjusted_p_values.begin());
            return;
    }
    throw ConfigurationError("adjust: unknown correction method");
}

// =============================================================================
// Corrected Enrichment
// =============================================================================

/// Corrected p-values, significance mask and signed SAFE scores,
/// row-major n_nodes x n_features like the source EnrichmentResult.
struct CorrectedResult {
    std::shared_ptr<const scoring::EnrichmentResult> enrichment;
    Real alpha = config::DEFAULT_ALPHA;
    Correction method = Correction::BenjaminiHochberg;

    std::vector<Real> q_values;
    std::vector<std::uint8_t> significant;
    // sign(direction) * log10(q) / log10(p_min), in [-1, 1]
    std::vector<Real> corrected_score;
    // Same formula on the raw p-value; empty unless requested
    std::vector<Real> raw_score;

    const scoring::EnrichmentResult& source() const noexcept { return *enrichment; }

    Index n_nodes() const noexcept { return enrichment->n_nodes; }
    Index n_features() const noexcept { return enrichment->n_features; }

    SAFE_FORCE_INLINE Size cell(Index u, Index f) const noexcept { return enrichment->cell(u, f); }

    Real q_value(Index u, Index f) const noexcept { return q_values[cell(u, f)]; }
    bool is_significant(Index u, Index f) const noexcept { return significant[cell(u, f)] != 0; }
    Real score(Index u, Index f) const noexcept { return corrected_score[cell(u, f)]; }

    Index n_significant() const noexcept {
        Index count = 0;
        for (auto s : significant) count += s;
        return count;
    }
};

/// Correct every scored feature of `enrichment` and flag significant cells.
///
/// A cell is significant when its corrected p-value is <= alpha and its
/// direction is Enriched or Depleted.
inline CorrectedResult correct(
    std::shared_ptr<const scoring::EnrichmentResult> enrichment,
    Real alpha = config::DEFAULT_ALPHA,
    Correction method = Correction::BenjaminiHochberg,
    bool raw_output = false
) {
    SAFE_CHECK_NULL(enrichment, "correct: enrichment result is null");
    SAFE_CHECK_CONFIG(alpha > Real(0) && alpha < Real(1), "correct: alpha must lie in (0, 1)");

    const auto& er = *enrichment;
    const Index n = er.n_nodes;
    const Index n_features = er.n_features;
    const Size cells = static_cast<Size>(n) * static_cast<Size>(n_features);

    CorrectedResult out;
    out.alpha = alpha;
    out.method = method;
    out.q_values.assign(cells, Real(1));
    out.significant.assign(cells, 0);
    out.corrected_score.assign(cells, Real(0));
    if (raw_output) {
        out.raw_score.assign(cells, Real(0));
    }

    safe::threading::parallel_for(Size(0), static_cast<Size>(n_features), [&](size_t fi) {
        const auto f = static_cast<Index>(fi);
        if (!er.is_scored(f)) return;

        std::vector<Real> p(static_cast<Size>(n));
        std::vector<Real> q(static_cast<Size>(n));
        for (Index u = 0; u < n; ++u) {
            p[static_cast<Size>(u)] = er.p_value(u, f);
        }
        adjust(method, Array<const Real>(p.data(), p.size()), Array<Real>(q.data(), q.size()));

        for (Index u = 0; u < n; ++u) {
            const Size c = er.cell(u, f);
            const Size k = static_cast<Size>(u);
            const Direction d = er.direction[c];
            const int sign = direction_sign(d);
            out.q_values[c] = q[k];
            out.significant[c] = static_cast<std::uint8_t>(sign != 0 && q[k] <= alpha);
            out.corrected_score[c] = static_cast<Real>(sign) * scoring::safe_score(q[k], er.n_permutations);
            if (raw_output) {
                out.raw_score[c] = static_cast<Real>(sign) * scoring::safe_score(p[k], er.n_permutations);
            }
        }
    });

    out.enrichment = std::move(enrichment);
    return out;
}

inline CorrectedResult correct(
    const scoring::EnrichmentResult& enrichment,
    Real alpha = config::DEFAULT_ALPHA,
    Correction method = Correction::BenjaminiHochberg,
    bool raw_output = false
) {
    return correct(std::make_shared<const scoring::EnrichmentResult>(enrichment), alpha, method, raw_output);
}

} // namespace safe::kernel::multiple_testing
