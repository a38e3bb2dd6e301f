#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/kernel/scoring.hpp"
#include "safe/kernel/multiple_testing.hpp"
#include "safe/kernel/stratification.hpp"
#include "safe/kernel/ordination.hpp"
#include "safe/kernel/ranking.hpp"
#include "safe/kernel/analysis.hpp"
#include "safe/io/hdf5.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <string>

// =============================================================================
// FILE: safe/io/export.hpp
// BRIEF: Tab-separated and HDF5 export of analysis results
//
// Every table starts with a header row. Real values are written with
// max_digits10 so exported numbers round-trip. Text fields are escaped
// (backslash, tab, newline, carriage return) so a name can never split a
// row or a column.
// =============================================================================

namespace safe::io {

namespace detail {

inline void set_precision(std::ostream& os) {
    os << std::setprecision(std::numeric_limits<Real>::max_digits10);
}

// Backslash escapes for the characters that would break the table layout
inline std::string escape_field(const std::string& s) {
    if (s.find_first_of("\\\t\n\r") == std::string::npos) {
        return s;
    }
    std::string out;
    out.reserve(s.size() + 8);
    for (char ch : s) {
        switch (ch) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += ch; break;
        }
    }
    return out;
}

inline std::ofstream open_for_write(const std::string& path) {
    std::ofstream os(path, std::ios::out | std::ios::trunc);
    if (!os.is_open()) {
        throw WriteError("cannot open '" + path + "' for writing");
    }
    set_precision(os);
    return os;
}

inline void finish(std::ofstream& os, const std::string& path) {
    os.flush();
    if (!os) {
        throw WriteError("failed writing '" + path + "'");
    }
}

template <typename Writer>
void write_file(const std::string& path, Writer&& writer) {
    auto os = open_for_write(path);
    writer(os);
    finish(os, path);
}

} // namespace detail

// =============================================================================
// Tables
// =============================================================================

/// One row per (node, feature) cell, nodes outer.
inline void write_enrichment(std::ostream& os, const kernel::multiple_testing::CorrectedResult& corrected) {
    const auto& er = corrected.source();
    const bool raw = !corrected.raw_score.empty();
    detail::set_precision(os);

    os << "node\tfeature\tobserved\tp_enriched\tp_depleted\tp_value\tq_value\tsignificant\tdirection\tscore";
    if (raw) os << "\traw_score";
    os << '\n';

    for (Index u = 0; u < er.n_nodes; ++u) {
        for (Index f = 0; f < er.n_features; ++f) {
            const Size c = er.cell(u, f);
            os << detail::escape_field(er.node_ids[static_cast<Size>(u)]) << '\t'
               << detail::escape_field(er.feature_names[static_cast<Size>(f)]) << '\t'
               << er.observed[c] << '\t'
               << er.p_enriched[c] << '\t'
               << er.p_depleted[c] << '\t'
               << er.p_value(u, f) << '\t'
               << corrected.q_values[c] << '\t'
               << static_cast<int>(corrected.significant[c]) << '\t'
               << direction_name(er.direction[c]) << '\t'
               << corrected.corrected_score[c];
            if (raw) os << '\t' << corrected.raw_score[c];
            os << '\n';
        }
    }
}

inline void write_strata(std::ostream& os, const kernel::stratification::StratumAssignment& assignment) {
    os << "node\tstratum\n";
    for (Index u = 0; u < assignment.n_nodes(); ++u) {
        os << detail::escape_field(assignment.node_ids[static_cast<Size>(u)]) << '\t'
           << detail::escape_field(assignment.label(u)) << '\n';
    }
}

/// First line: "# variance_explained" followed by one fraction per axis.
inline void write_ordination(std::ostream& os, const kernel::ordination::Embedding& embedding) {
    detail::set_precision(os);
    os << "# variance_explained";
    for (Index k = 0; k < embedding.dims; ++k) {
        os << '\t' << embedding.explained[static_cast<Size>(k)];
    }
    os << '\n';

    os << kernel::ordination::axis_mode_name(embedding.mode);
    for (Index k = 0; k < embedding.dims; ++k) {
        os << "\taxis" << (k + 1);
    }
    os << '\n';

    for (Index i = 0; i < embedding.n_entities(); ++i) {
        os << detail::escape_field(embedding.entities[static_cast<Size>(i)]);
        for (Index k = 0; k < embedding.dims; ++k) {
            os << '\t' << embedding.coord(i, k);
        }
        os << '\n';
    }
}

/// Rows in the order given; pass the output of rank_features.
inline void write_ranking(std::ostream& os, const std::vector<kernel::ranking::FeatureSummary>& ranking) {
    detail::set_precision(os);
    os << "rank\tfeature\tstatus\tn_significant\tn_enriched\tn_depleted\tsignificant_ratio\tmin_q\tenriched_score\n";
    Index rank = 1;
    for (const auto& s : ranking) {
        os << rank++ << '\t'
           << detail::escape_field(s.name) << '\t'
           << kernel::scoring::status_name(s.status) << '\t'
           << s.n_significant << '\t'
           << s.n_enriched << '\t'
           << s.n_depleted << '\t'
           << s.significant_ratio << '\t'
           << s.min_q << '\t'
           << s.enriched_score << '\n';
    }
}

inline void write_skipped(std::ostream& os, const kernel::scoring::EnrichmentResult& enrichment) {
    os << "feature\tstatus\treason\n";
    for (Index f : enrichment.skipped_features()) {
        os << detail::escape_field(enrichment.feature_names[static_cast<Size>(f)]) << '\t'
           << kernel::scoring::status_name(enrichment.status[static_cast<Size>(f)]) << '\t'
           << detail::escape_field(enrichment.status_reason[static_cast<Size>(f)]) << '\n';
    }
}

// =============================================================================
// Files
// =============================================================================

inline void write_enrichment(const std::string& path, const kernel::multiple_testing::CorrectedResult& corrected) {
    detail::write_file(path, [&](std::ostream& os) { write_enrichment(os, corrected); });
}

inline void write_strata(const std::string& path, const kernel::stratification::StratumAssignment& assignment) {
    detail::write_file(path, [&](std::ostream& os) { write_strata(os, assignment); });
}

inline void write_ordination(const std::string& path, const kernel::ordination::Embedding& embedding) {
    detail::write_file(path, [&](std::ostream& os) { write_ordination(os, embedding); });
}

inline void write_ranking(const std::string& path, const std::vector<kernel::ranking::FeatureSummary>& ranking) {
    detail::write_file(path, [&](std::ostream& os) { write_ranking(os, ranking); });
}

inline void write_skipped(const std::string& path, const kernel::scoring::EnrichmentResult& enrichment) {
    detail::write_file(path, [&](std::ostream& os) { write_skipped(os, enrichment); });
}

/// enrichment.tsv, strata.tsv, ranking.tsv and skipped.tsv under `directory`,
/// plus ordination.tsv when an embedding is given. Ordination is not part of
/// an AnalysisResult; the caller projects it separately.
inline void write_all(
    const std::string& directory,
    const kernel::analysis::AnalysisResult& result,
    const kernel::ordination::Embedding* embedding = nullptr
) {
    const std::string prefix = directory.empty() || directory.back() == '/' ? directory : directory + "/";
    write_enrichment(prefix + "enrichment.tsv", result.corrected);
    write_strata(prefix + "strata.tsv", result.assignment);
    write_ranking(prefix + "ranking.tsv", result.ranking);
    write_skipped(prefix + "skipped.tsv", result.scores());
    if (embedding != nullptr) {
        write_ordination(prefix + "ordination.tsv", *embedding);
    }
}

#ifdef SAFE_HAS_HDF5

/// All result matrices in one HDF5 file.
///
/// Layout: /nodes, /features (strings); /enrichment/{observed, p_enriched,
/// p_depleted, q_value, significant, direction, score[, raw_score]} as
/// n_nodes x n_features; /strata/{label, dominant}; /features_status;
/// /ranking/{feature, name, status, n_significant, n_enriched, n_depleted,
/// significant_ratio, min_q, enriched_score} in rank order; and, when an
/// embedding is given, /ordination/{entities, coords, eigenvalues, explained}
/// with a "mode" attribute.
inline void write_hdf5(
    const std::string& path,
    const kernel::analysis::AnalysisResult& result,
    const kernel::ordination::Embedding* embedding = nullptr
) {
    const auto& er = result.scores();
    const auto& corrected = result.corrected;
    const std::vector<hsize_t> dims = {static_cast<hsize_t>(er.n_nodes), static_cast<hsize_t>(er.n_features)};

    auto file = h5::File::create(path);
    file.write_strings("nodes", er.node_ids);
    file.write_strings("features", er.feature_names);

    std::vector<int8_t> status(er.status.size());
    for (Size f = 0; f < er.status.size(); ++f) {
        status[f] = static_cast<int8_t>(er.status[f]);
    }
    file.write_dataset("features_status", status);

    {
        auto g = file.create_group("enrichment");
        g.write_attribute("n_permutations", static_cast<uint64_t>(er.n_permutations));
        g.write_attribute("radius", static_cast<int64_t>(er.radius));
        g.write_attribute("alpha", static_cast<double>(corrected.alpha));
        g.write_attribute("seed", static_cast<uint64_t>(result.seed));
        g.write_attribute("aggregate", std::string(kernel::permutation::aggregate_name(er.aggregate)));
        g.write_attribute("correction", std::string(kernel::multiple_testing::correction_name(corrected.method)));

        g.write_dataset("observed", er.observed.data(), dims);
        g.write_dataset("p_enriched", er.p_enriched.data(), dims);
        g.write_dataset("p_depleted", er.p_depleted.data(), dims);
        g.write_dataset("q_value", corrected.q_values.data(), dims);
        g.write_dataset("significant", corrected.significant.data(), dims);
        g.write_dataset("score", corrected.corrected_score.data(), dims);
        if (!corrected.raw_score.empty()) {
            g.write_dataset("raw_score", corrected.raw_score.data(), dims);
        }

        std::vector<int8_t> direction(er.direction.size());
        for (Size c = 0; c < er.direction.size(); ++c) {
            direction[c] = static_cast<int8_t>(er.direction[c]);
        }
        g.write_dataset("direction", direction.data(), dims);
    }

    {
        auto g = file.create_group("strata");
        g.write_strings("label", result.assignment.labels);
        std::vector<int64_t> dominant(result.assignment.dominant.begin(), result.assignment.dominant.end());
        g.write_dataset("dominant", dominant);
    }

    {
        const auto& ranking = result.ranking;
        const Size k = ranking.size();
        std::vector<std::string> names(k);
        std::vector<int64_t> feature(k), n_significant(k), n_enriched(k), n_depleted(k);
        std::vector<int8_t> rank_status(k);
        std::vector<double> ratio(k), min_q(k), enriched_score(k);
        for (Size i = 0; i < k; ++i) {
            const auto& s = ranking[i];
            names[i] = s.name;
            feature[i] = static_cast<int64_t>(s.feature);
            rank_status[i] = static_cast<int8_t>(s.status);
            n_significant[i] = static_cast<int64_t>(s.n_significant);
            n_enriched[i] = static_cast<int64_t>(s.n_enriched);
            n_depleted[i] = static_cast<int64_t>(s.n_depleted);
            ratio[i] = static_cast<double>(s.significant_ratio);
            min_q[i] = static_cast<double>(s.min_q);
            enriched_score[i] = static_cast<double>(s.enriched_score);
        }

        auto g = file.create_group("ranking");
        g.write_strings("name", names);
        g.write_dataset("feature", feature);
        g.write_dataset("status", rank_status);
        g.write_dataset("n_significant", n_significant);
        g.write_dataset("n_enriched", n_enriched);
        g.write_dataset("n_depleted", n_depleted);
        g.write_dataset("significant_ratio", ratio);
        g.write_dataset("min_q", min_q);
        g.write_dataset("enriched_score", enriched_score);
    }

    if (embedding != nullptr) {
        SAFE_CHECK_DIM(embedding->coords.size() ==
                           static_cast<Size>(embedding->n_entities()) * static_cast<Size>(embedding->dims),
            "write_hdf5: embedding coordinates do not match entities x dims");
        auto g = file.create_group("ordination");
        g.write_attribute("mode", std::string(kernel::ordination::axis_mode_name(embedding->mode)));
        g.write_strings("entities", embedding->entities);
        g.write_dataset("coords", embedding->coords.data(),
                        {static_cast<hsize_t>(embedding->n_entities()), static_cast<hsize_t>(embedding->dims)});
        g.write_dataset("eigenvalues", embedding->eigenvalues);
        g.write_dataset("explained", embedding->explained);
    }

    file.flush();
}

#endif // SAFE_HAS_HDF5

} // namespace safe::io
