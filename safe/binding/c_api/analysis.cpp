// =============================================================================
// FILE: safe/binding/c_api/analysis.cpp
// BRIEF: C API implementation for enrichment runs
// =============================================================================

#include "safe/binding/c_api/analysis.h"
#include "safe/binding/c_api/core/internal.hpp"
#include "safe/core/error.hpp"
#include "safe/kernel/ordination.hpp"
#include "safe/io/export.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using namespace safe;
using namespace safe::binding;

namespace {

std::vector<std::string> to_strings(const char* const* items, safe_size_t n, const char* what) {
    std::vector<std::string> out;
    out.reserve(n);
    for (safe_size_t i = 0; i < n; ++i) {
        SAFE_CHECK_NULL(items[i], std::string(what) + " entry is null");
        out.emplace_back(items[i]);
    }
    return out;
}

template <typename T>
safe_error_t copy_out(const std::vector<T>& src, T* out, safe_size_t size) {
    SAFE_CHECK_DIM(size == src.size(), "output buffer must hold n_nodes * n_features entries");
    std::copy(src.begin(), src.end(), out);
    SAFE_C_API_RETURN_OK;
}

template <typename Handle>
safe_error_t destroy(Handle** handle) {
    if (handle == nullptr || *handle == nullptr) {
        SAFE_C_API_RETURN_OK;
    }
    delete *handle;
    *handle = nullptr;
    SAFE_C_API_RETURN_OK;
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Graph
// =============================================================================

SAFE_C_EXPORT safe_error_t safe_graph_create(
    safe_graph_t* out,
    const char* const* node_ids,
    safe_size_t n_nodes,
    const safe_index_t* src,
    const safe_index_t* dst,
    safe_size_t n_edges) {

    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    SAFE_C_API_CHECK_NULL(node_ids, "Node id array is null");
    SAFE_C_API_CHECK(n_edges == 0 || (src != nullptr && dst != nullptr), SAFE_ERROR_NULL_POINTER,
                     "Edge arrays are null");

    SAFE_C_API_TRY
        std::vector<std::pair<Index, Index>> edges;
        edges.reserve(n_edges);
        for (safe_size_t k = 0; k < n_edges; ++k) {
            edges.emplace_back(src[k], dst[k]);
        }
        auto graph = Graph::from_index_edges(to_strings(node_ids, n_nodes, "node id"), edges);
        *out = new safe_graph(std::move(graph));
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_graph_destroy(safe_graph_t* graph) {
    return destroy(graph);
}

SAFE_C_EXPORT safe_error_t safe_graph_num_nodes(safe_graph_t graph, safe_index_t* out) {
    SAFE_C_API_CHECK_NULL(graph, "Graph is null");
    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    *out = graph->graph->num_nodes();
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_graph_num_edges(safe_graph_t graph, safe_index_t* out) {
    SAFE_C_API_CHECK_NULL(graph, "Graph is null");
    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    *out = graph->graph->num_edges();
    SAFE_C_API_RETURN_OK;
}

// =============================================================================
// Feature Matrix
// =============================================================================

SAFE_C_EXPORT safe_error_t safe_features_create(
    safe_features_t* out,
    const char* const* sample_ids,
    safe_size_t n_samples,
    const char* const* feature_names,
    safe_size_t n_features,
    const safe_real_t* values) {

    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    SAFE_C_API_CHECK_NULL(sample_ids, "Sample id array is null");
    SAFE_C_API_CHECK_NULL(feature_names, "Feature name array is null");
    SAFE_C_API_CHECK(n_features == 0 ||
                         n_samples <= std::numeric_limits<safe_size_t>::max() / sizeof(Real) / n_features,
                     SAFE_ERROR_INVALID_ARGUMENT, "Sample x feature count overflows");
    SAFE_C_API_CHECK(n_samples * n_features == 0 || values != nullptr, SAFE_ERROR_NULL_POINTER,
                     "Value array is null");

    SAFE_C_API_TRY
        std::vector<Real> data(values, values + n_samples * n_features);
        FeatureMatrix m(to_strings(sample_ids, n_samples, "sample id"),
                        to_strings(feature_names, n_features, "feature name"),
                        std::move(data));
        *out = new safe_features(std::move(m));
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_features_one_hot(
    safe_features_t* out,
    const char* const* sample_ids,
    const char* const* labels,
    safe_size_t n_samples,
    const char* prefix) {

    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    SAFE_C_API_CHECK_NULL(sample_ids, "Sample id array is null");
    SAFE_C_API_CHECK_NULL(labels, "Label array is null");
    SAFE_C_API_CHECK_NULL(prefix, "Prefix is null");

    SAFE_C_API_TRY
        auto m = FeatureMatrix::one_hot_encode(to_strings(sample_ids, n_samples, "sample id"),
                                               to_strings(labels, n_samples, "label"),
                                               prefix);
        *out = new safe_features(std::move(m));
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_features_destroy(safe_features_t* features) {
    return destroy(features);
}

// =============================================================================
// Configuration
// =============================================================================

SAFE_C_EXPORT safe_error_t safe_config_create(safe_config_t* out) {
    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    SAFE_C_API_TRY
        *out = new safe_config();
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_config_destroy(safe_config_t* config) {
    return destroy(config);
}

SAFE_C_EXPORT safe_error_t safe_config_set_permutations(safe_config_t config, safe_size_t n) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.n_permutations = n;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_alpha(safe_config_t config, safe_real_t alpha) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.alpha = alpha;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_radius(safe_config_t config, safe_index_t radius) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.radius = radius;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_seed(safe_config_t config, uint64_t seed) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.seed = seed;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_aggregate(safe_config_t config, int32_t aggregate) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    SAFE_C_API_CHECK(aggregate >= SAFE_AGGREGATE_MEAN && aggregate <= SAFE_AGGREGATE_MAX,
                     SAFE_ERROR_CONFIGURATION, "Unknown aggregate");
    config->config.aggregate = static_cast<kernel::permutation::Aggregate>(aggregate);
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_correction(safe_config_t config, int32_t correction) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    SAFE_C_API_CHECK(correction >= SAFE_CORRECTION_BH && correction <= SAFE_CORRECTION_NONE,
                     SAFE_ERROR_CONFIGURATION, "Unknown correction method");
    config->config.correction = static_cast<kernel::multiple_testing::Correction>(correction);
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_raw_output(safe_config_t config, safe_bool_t enabled) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.raw_output = enabled != SAFE_FALSE;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_max_inflight(safe_config_t config, safe_size_t n) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.max_inflight_features = n;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_permutation_parallel(safe_config_t config, safe_bool_t enabled) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.permutation_parallel = enabled != SAFE_FALSE;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_set_verbose(safe_config_t config, safe_bool_t enabled) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    config->config.verbose = enabled != SAFE_FALSE;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_config_validate(safe_config_t config) {
    SAFE_C_API_CHECK_NULL(config, "Config is null");
    SAFE_C_API_TRY
        config->config.validate();
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

// =============================================================================
// Cancellation
// =============================================================================

SAFE_C_EXPORT safe_error_t safe_cancel_create(safe_cancel_t* out) {
    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    SAFE_C_API_TRY
        *out = new safe_cancel();
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_cancel_destroy(safe_cancel_t* token) {
    return destroy(token);
}

SAFE_C_EXPORT safe_error_t safe_cancel_request(safe_cancel_t token) {
    SAFE_C_API_CHECK_NULL(token, "Cancellation token is null");
    token->token.cancel();
    SAFE_C_API_RETURN_OK;
}

// =============================================================================
// Run
// =============================================================================

SAFE_C_EXPORT safe_error_t safe_run(
    safe_result_t* out,
    safe_graph_t graph,
    const safe_features_t* matrices,
    safe_size_t n_matrices,
    safe_config_t config,
    safe_cancel_t cancel) {

    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    SAFE_C_API_CHECK_NULL(graph, "Graph is null");
    SAFE_C_API_CHECK_NULL(matrices, "Feature matrix array is null");
    SAFE_C_API_CHECK_NULL(config, "Config is null");

    SAFE_C_API_TRY
        std::vector<FeatureMatrix> inputs;
        inputs.reserve(n_matrices);
        for (safe_size_t i = 0; i < n_matrices; ++i) {
            SAFE_CHECK_NULL(matrices[i], "Feature matrix handle is null");
            inputs.push_back(matrices[i]->matrix);
        }

        const threading::CancellationToken* token = cancel != nullptr ? &cancel->token : nullptr;
        auto result = kernel::analysis::run_analysis(*graph->index, inputs, config->config, token);
        *out = new safe_result(std::move(result));
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_destroy(safe_result_t* result) {
    return destroy(result);
}

// =============================================================================
// Result Accessors
// =============================================================================

SAFE_C_EXPORT safe_error_t safe_result_shape(safe_result_t result, safe_index_t* n_nodes, safe_index_t* n_features) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(n_nodes, "Output pointer is null");
    SAFE_C_API_CHECK_NULL(n_features, "Output pointer is null");
    *n_nodes = result->result.scores().n_nodes;
    *n_features = result->result.scores().n_features;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_result_seed(safe_result_t result, uint64_t* out) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    *out = result->result.seed;
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_result_p_values(safe_result_t result, safe_real_t* out, safe_size_t size) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output buffer is null");
    SAFE_C_API_TRY
        const auto& er = result->result.scores();
        std::vector<Real> p(er.p_enriched.size());
        for (Index u = 0; u < er.n_nodes; ++u) {
            for (Index f = 0; f < er.n_features; ++f) {
                p[er.cell(u, f)] = er.p_value(u, f);
            }
        }
        return copy_out(p, out, size);
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_q_values(safe_result_t result, safe_real_t* out, safe_size_t size) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output buffer is null");
    SAFE_C_API_TRY
        return copy_out(result->result.corrected.q_values, out, size);
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_scores(safe_result_t result, safe_real_t* out, safe_size_t size) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output buffer is null");
    SAFE_C_API_TRY
        return copy_out(result->result.corrected.corrected_score, out, size);
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_directions(safe_result_t result, int8_t* out, safe_size_t size) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output buffer is null");
    SAFE_C_API_TRY
        const auto& dir = result->result.scores().direction;
        std::vector<int8_t> d(dir.size());
        std::transform(dir.begin(), dir.end(), d.begin(), [](Direction x) { return static_cast<int8_t>(x); });
        return copy_out(d, out, size);
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_significant(safe_result_t result, uint8_t* out, safe_size_t size) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output buffer is null");
    SAFE_C_API_TRY
        return copy_out(result->result.corrected.significant, out, size);
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_num_skipped(safe_result_t result, safe_size_t* out) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    SAFE_C_API_TRY
        *out = result->result.skipped_features().size();
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_strata(safe_result_t result, safe_index_t* out, safe_size_t size) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output buffer is null");
    const auto& dominant = result->result.assignment.dominant;
    SAFE_C_API_CHECK(size == dominant.size(), SAFE_ERROR_DIMENSION_MISMATCH,
                     "Output buffer must hold n_nodes entries");
    std::copy(dominant.begin(), dominant.end(), out);
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_result_stratum_label(safe_result_t result, safe_index_t node, const char** out) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(out, "Output pointer is null");
    const auto& assignment = result->result.assignment;
    SAFE_C_API_CHECK(node >= 0 && node < assignment.n_nodes(), SAFE_ERROR_INDEX_OUT_OF_BOUNDS,
                     "Node index out of range");
    *out = assignment.label(node).c_str();
    SAFE_C_API_RETURN_OK;
}

SAFE_C_EXPORT safe_error_t safe_result_ordination(
    safe_result_t result,
    int32_t axis_mode,
    safe_index_t dims,
    safe_real_t* coords,
    safe_size_t size,
    safe_real_t* explained) {

    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(coords, "Output buffer is null");
    SAFE_C_API_CHECK(axis_mode == SAFE_AXIS_NODES || axis_mode == SAFE_AXIS_FEATURES,
                     SAFE_ERROR_CONFIGURATION, "Unknown axis mode");

    SAFE_C_API_TRY
        const auto mode = axis_mode == SAFE_AXIS_NODES ? kernel::ordination::AxisMode::Nodes
                                                       : kernel::ordination::AxisMode::Features;
        auto embedding = kernel::ordination::project(result->result.corrected, mode, dims);
        // Nothing is written unless the coordinate buffer fits
        SAFE_CHECK_DIM(size == embedding.coords.size(), "output buffer must hold n_entities * dims entries");
        if (explained != nullptr) {
            std::copy(embedding.explained.begin(), embedding.explained.end(), explained);
        }
        std::copy(embedding.coords.begin(), embedding.coords.end(), coords);
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

// =============================================================================
// Export
// =============================================================================

SAFE_C_EXPORT safe_error_t safe_result_export_tsv(safe_result_t result, const char* directory) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(directory, "Directory is null");
    SAFE_C_API_TRY
        io::write_all(directory, result->result);
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_error_t safe_result_export_hdf5(safe_result_t result, const char* path) {
    SAFE_C_API_CHECK_NULL(result, "Result is null");
    SAFE_C_API_CHECK_NULL(path, "Path is null");
    SAFE_C_API_TRY
#ifdef SAFE_HAS_HDF5
        io::write_hdf5(path, result->result);
        SAFE_C_API_RETURN_OK;
#else
        throw FeatureUnavailableError("HDF5 export not available in this build");
#endif
    SAFE_C_API_CATCH
}

} // extern "C"
