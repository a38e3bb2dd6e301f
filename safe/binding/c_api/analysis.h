#pragma once

// =============================================================================
// FILE: safe/binding/c_api/analysis.h
// BRIEF: C API for graphs, feature matrices and enrichment runs
// =============================================================================
//
// Typical use:
//
//     safe_graph_t g;         safe_graph_create(&g, ids, n, src, dst, m);
//     safe_features_t x;      safe_features_create(&x, ids, n, names, f, values);
//     safe_config_t cfg;      safe_config_create(&cfg);
//     safe_result_t r;        safe_run(&r, g, &x, 1, cfg, NULL);
//     ...                     safe_result_q_values(r, buffer, n * f);
//     safe_result_destroy(&r); safe_config_destroy(&cfg); ...
//
// Result matrices are row-major n_nodes x n_features.
// =============================================================================

#include "safe/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct safe_graph safe_graph;
typedef struct safe_features safe_features;
typedef struct safe_config safe_config;
typedef struct safe_result safe_result;
typedef struct safe_cancel safe_cancel;

typedef safe_graph* safe_graph_t;
typedef safe_features* safe_features_t;
typedef safe_config* safe_config_t;
typedef safe_result* safe_result_t;
typedef safe_cancel* safe_cancel_t;

// Aggregates (match safe::kernel::permutation::Aggregate)
#define SAFE_AGGREGATE_MEAN 0
#define SAFE_AGGREGATE_SUM 1
#define SAFE_AGGREGATE_MEDIAN 2
#define SAFE_AGGREGATE_MAX 3

// Corrections (match safe::kernel::multiple_testing::Correction)
#define SAFE_CORRECTION_BH 0
#define SAFE_CORRECTION_BONFERRONI 1
#define SAFE_CORRECTION_HOLM 2
#define SAFE_CORRECTION_NONE 3

// Directions (match safe::Direction)
#define SAFE_DIRECTION_DEPLETED (-1)
#define SAFE_DIRECTION_NEITHER 0
#define SAFE_DIRECTION_ENRICHED 1
#define SAFE_DIRECTION_UNDEFINED 2

// Axis modes for ordination
#define SAFE_AXIS_NODES 0
#define SAFE_AXIS_FEATURES 1

// =============================================================================
// Graph
// =============================================================================

// Edges given by node position: (src[k], dst[k]) for k < n_edges
safe_error_t safe_graph_create(
    safe_graph_t* out,
    const char* const* node_ids,
    safe_size_t n_nodes,
    const safe_index_t* src,
    const safe_index_t* dst,
    safe_size_t n_edges
);

safe_error_t safe_graph_destroy(safe_graph_t* graph);

safe_error_t safe_graph_num_nodes(safe_graph_t graph, safe_index_t* out);

safe_error_t safe_graph_num_edges(safe_graph_t graph, safe_index_t* out);

// =============================================================================
// Feature Matrix
// =============================================================================

// values: row-major n_samples x n_features
safe_error_t safe_features_create(
    safe_features_t* out,
    const char* const* sample_ids,
    safe_size_t n_samples,
    const char* const* feature_names,
    safe_size_t n_features,
    const safe_real_t* values
);

// One indicator feature "prefix=label" per distinct label
safe_error_t safe_features_one_hot(
    safe_features_t* out,
    const char* const* sample_ids,
    const char* const* labels,
    safe_size_t n_samples,
    const char* prefix
);

safe_error_t safe_features_destroy(safe_features_t* features);

// =============================================================================
// Configuration
// =============================================================================

safe_error_t safe_config_create(safe_config_t* out);
safe_error_t safe_config_destroy(safe_config_t* config);

safe_error_t safe_config_set_permutations(safe_config_t config, safe_size_t n);
safe_error_t safe_config_set_alpha(safe_config_t config, safe_real_t alpha);
safe_error_t safe_config_set_radius(safe_config_t config, safe_index_t radius);
safe_error_t safe_config_set_seed(safe_config_t config, uint64_t seed);
safe_error_t safe_config_set_aggregate(safe_config_t config, int32_t aggregate);
safe_error_t safe_config_set_correction(safe_config_t config, int32_t correction);
safe_error_t safe_config_set_raw_output(safe_config_t config, safe_bool_t enabled);
safe_error_t safe_config_set_max_inflight(safe_config_t config, safe_size_t n);
safe_error_t safe_config_set_permutation_parallel(safe_config_t config, safe_bool_t enabled);
safe_error_t safe_config_set_verbose(safe_config_t config, safe_bool_t enabled);

// SAFE_ERROR_CONFIGURATION if any field is out of range
safe_error_t safe_config_validate(safe_config_t config);

// =============================================================================
// Cancellation
// =============================================================================

safe_error_t safe_cancel_create(safe_cancel_t* out);
safe_error_t safe_cancel_destroy(safe_cancel_t* token);

// May be called from any thread while a run is in progress
safe_error_t safe_cancel_request(safe_cancel_t token);

// =============================================================================
// Run
// =============================================================================

// cancel may be NULL
safe_error_t safe_run(
    safe_result_t* out,
    safe_graph_t graph,
    const safe_features_t* matrices,
    safe_size_t n_matrices,
    safe_config_t config,
    safe_cancel_t cancel
);

safe_error_t safe_result_destroy(safe_result_t* result);

// =============================================================================
// Result Accessors
// =============================================================================

safe_error_t safe_result_shape(safe_result_t result, safe_index_t* n_nodes, safe_index_t* n_features);

safe_error_t safe_result_seed(safe_result_t result, uint64_t* out);

// Copy a result matrix into a caller buffer of n_nodes * n_features entries
safe_error_t safe_result_p_values(safe_result_t result, safe_real_t* out, safe_size_t size);
safe_error_t safe_result_q_values(safe_result_t result, safe_real_t* out, safe_size_t size);
safe_error_t safe_result_scores(safe_result_t result, safe_real_t* out, safe_size_t size);
safe_error_t safe_result_directions(safe_result_t result, int8_t* out, safe_size_t size);
safe_error_t safe_result_significant(safe_result_t result, uint8_t* out, safe_size_t size);

safe_error_t safe_result_num_skipped(safe_result_t result, safe_size_t* out);

// Dominant feature index per node, -1 for "none"
safe_error_t safe_result_strata(safe_result_t result, safe_index_t* out, safe_size_t size);

// Pointer stays valid until the result is destroyed
safe_error_t safe_result_stratum_label(safe_result_t result, safe_index_t node, const char** out);

safe_error_t safe_result_ordination(
    safe_result_t result,
    int32_t axis_mode,
    safe_index_t dims,
    safe_real_t* coords,
    safe_size_t size,
    safe_real_t* explained
);

// =============================================================================
// Export
// =============================================================================

// enrichment.tsv, strata.tsv, ranking.tsv, skipped.tsv under directory
safe_error_t safe_result_export_tsv(safe_result_t result, const char* directory);

// SAFE_ERROR_FEATURE_UNAVAILABLE when built without HDF5
safe_error_t safe_result_export_hdf5(safe_result_t result, const char* path);

#ifdef __cplusplus
}
#endif
