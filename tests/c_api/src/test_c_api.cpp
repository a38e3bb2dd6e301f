// =============================================================================
// SAFE Tests - C API
// =============================================================================
//
// Coverage for safe/binding/c_api/core/core.h and safe/binding/c_api/analysis.h
//
// Functions tested:
//   - safe_get_version / safe_get_build_config / last-error handling
//   - safe_set_num_threads / safe_get_num_threads
//   - safe_graph_* / safe_features_* / safe_config_* / safe_cancel_*
//   - safe_run and every safe_result_* accessor
//   - safe_result_export_tsv / safe_result_export_hdf5
//
// =============================================================================

#include "test.hpp"

#include <cmath>
#include <cstring>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

#include <unistd.h>

using namespace safe::test;
namespace fs = std::filesystem;

namespace {

constexpr safe_index_t RING = 60;
constexpr safe_index_t N_FEATURES = 4;

GraphGuard c_ring(safe_index_t n) {
    auto edges = ring_edges(n);
    std::vector<safe_index_t> src, dst;
    for (const auto& [u, v] : edges) {
        src.push_back(u);
        dst.push_back(v);
    }
    CStrings ids(node_ids(n));
    GraphGuard g;
    safe_error_t err = safe_graph_create(g.ptr(), ids.data(), ids.size(), src.data(), dst.data(), src.size());
    if (err != SAFE_OK) {
        throw TestException(__FILE__, __LINE__, std::string("graph creation failed: ") + safe_get_last_error());
    }
    return g;
}

// left: nodes 0..29, right: nodes 30..59, wave: periodic, flat: constant
FeaturesGuard c_features(safe_index_t n) {
    CStrings ids(node_ids(n));
    CStrings names({"left", "right", "wave", "flat"});
    std::vector<safe_real_t> values;
    for (safe_index_t i = 0; i < n; ++i) {
        const double left = i < n / 2 ? 1.0 : 0.0;
        values.push_back(left);
        values.push_back(1.0 - left);
        values.push_back(double((i * 7) % 5));
        values.push_back(2.0);
    }
    FeaturesGuard x;
    safe_error_t err = safe_features_create(x.ptr(), ids.data(), ids.size(), names.data(), names.size(), values.data());
    if (err != SAFE_OK) {
        throw TestException(__FILE__, __LINE__, std::string("feature creation failed: ") + safe_get_last_error());
    }
    return x;
}

ConfigGuard c_config(uint64_t seed = 11) {
    ConfigGuard cfg;
    if (safe_config_create(cfg.ptr()) != SAFE_OK) {
        throw TestException(__FILE__, __LINE__, "config creation failed");
    }
    (void)safe_config_set_permutations(cfg.get(), 1000);
    (void)safe_config_set_radius(cfg.get(), 3);
    (void)safe_config_set_seed(cfg.get(), seed);
    return cfg;
}

ResultGuard c_run(safe_graph_t g, safe_features_t x, safe_config_t cfg) {
    ResultGuard r;
    safe_error_t err = safe_run(r.ptr(), g, &x, 1, cfg, nullptr);
    if (err != SAFE_OK) {
        throw TestException(__FILE__, __LINE__, std::string("run failed: ") + safe_get_last_error());
    }
    return r;
}

// One full run, shared by the accessor tests
safe_result_t ring_result() {
    static GraphGuard g = c_ring(RING);
    static FeaturesGuard x = c_features(RING);
    static ConfigGuard cfg = c_config();
    static ResultGuard r = c_run(g.get(), x.get(), cfg.get());
    return r.get();
}

constexpr std::size_t CELLS = static_cast<std::size_t>(RING * N_FEATURES);

std::size_t cell(safe_index_t u, safe_index_t f) {
    return static_cast<std::size_t>(u * N_FEATURES + f);
}

fs::path temp_path(const std::string& tag) {
    return fs::temp_directory_path() / ("safe_c_api_" + tag + "_" + std::to_string(::getpid()));
}

} // namespace

SAFE_TEST_BEGIN

// =============================================================================
// Core
// =============================================================================

SAFE_TEST_SUITE(core)

SAFE_TEST_CASE(version_and_build) {
    SAFE_REQUIRE_STR_EQ(safe_get_version(), "1.0.0");
    const std::string build = safe_get_build_config();
    SAFE_REQUIRE_STR_CONTAINS(build, SAFE_REAL_TYPE_NAME);
    SAFE_REQUIRE_STR_CONTAINS(build, SAFE_INDEX_TYPE_NAME);
}

SAFE_TEST_CASE(last_error_tracking) {
    safe_clear_error();
    SAFE_REQUIRE_EQ(safe_get_last_error_code(), SAFE_OK);

    safe_index_t n = 0;
    SAFE_REQUIRE_EQ(safe_graph_num_nodes(nullptr, &n), SAFE_ERROR_NULL_POINTER);
    SAFE_REQUIRE_EQ(safe_get_last_error_code(), SAFE_ERROR_NULL_POINTER);
    SAFE_REQUIRE_STR_CONTAINS(std::string(safe_get_last_error()), "null");

    safe_clear_error();
    SAFE_REQUIRE_EQ(safe_get_last_error_code(), SAFE_OK);
    SAFE_REQUIRE_STR_EQ(safe_get_last_error(), "No error");
}

SAFE_TEST_CASE(success_clears_error) {
    safe_index_t n = 0;
    (void)safe_graph_num_nodes(nullptr, &n);
    ConfigGuard cfg;
    SAFE_REQUIRE_EQ(safe_config_create(cfg.ptr()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_get_last_error_code(), SAFE_OK);
}

SAFE_TEST_CASE(status_predicates) {
    SAFE_REQUIRE_TRUE(safe_is_ok(SAFE_OK));
    SAFE_REQUIRE_FALSE(safe_is_error(SAFE_OK));
    SAFE_REQUIRE_TRUE(safe_is_error(SAFE_ERROR_CANCELLED));
    SAFE_REQUIRE_FALSE(safe_is_ok(SAFE_ERROR_INVALID_GRAPH));
}

SAFE_TEST_CASE(thread_count) {
    SAFE_REQUIRE_EQ(safe_set_num_threads(2), SAFE_OK);
    const safe_size_t n = safe_get_num_threads();
    SAFE_REQUIRE_GE(n, safe_size_t(1));
    SAFE_REQUIRE_LE(n, safe_size_t(2));
    SAFE_REQUIRE_EQ(safe_set_num_threads(0), SAFE_OK);
    SAFE_REQUIRE_GE(safe_get_num_threads(), safe_size_t(1));
}

SAFE_TEST_CASE(destroy_null_is_ok) {
    SAFE_REQUIRE_EQ(safe_graph_destroy(nullptr), SAFE_OK);
    safe_result_t r = nullptr;
    SAFE_REQUIRE_EQ(safe_result_destroy(&r), SAFE_OK);
    safe_cancel_t c = nullptr;
    SAFE_REQUIRE_EQ(safe_cancel_destroy(&c), SAFE_OK);
}

SAFE_TEST_SUITE_END

// =============================================================================
// Inputs
// =============================================================================

SAFE_TEST_SUITE(inputs)

SAFE_TEST_CASE(graph_counts) {
    auto g = c_ring(12);
    safe_index_t n = 0, m = 0;
    SAFE_REQUIRE_EQ(safe_graph_num_nodes(g.get(), &n), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_graph_num_edges(g.get(), &m), SAFE_OK);
    SAFE_REQUIRE_EQ(n, safe_index_t(12));
    SAFE_REQUIRE_EQ(m, safe_index_t(12));
}

SAFE_TEST_CASE(graph_null_arguments) {
    CStrings ids(node_ids(3));
    safe_index_t src[] = {0, 1};
    safe_index_t dst[] = {1, 2};
    GraphGuard g;
    SAFE_REQUIRE_EQ(safe_graph_create(nullptr, ids.data(), 3, src, dst, 2), SAFE_ERROR_NULL_POINTER);
    SAFE_REQUIRE_EQ(safe_graph_create(g.ptr(), nullptr, 3, src, dst, 2), SAFE_ERROR_NULL_POINTER);
    SAFE_REQUIRE_EQ(safe_graph_create(g.ptr(), ids.data(), 3, nullptr, dst, 2), SAFE_ERROR_NULL_POINTER);
    SAFE_REQUIRE_FALSE(g.valid());
    // No edges: null edge arrays are fine
    SAFE_REQUIRE_EQ(safe_graph_create(g.ptr(), ids.data(), 3, nullptr, nullptr, 0), SAFE_OK);
    SAFE_REQUIRE_TRUE(g.valid());
}

SAFE_TEST_CASE(graph_invalid) {
    CStrings dup({"a", "b", "a"});
    GraphGuard g;
    SAFE_REQUIRE_EQ(safe_graph_create(g.ptr(), dup.data(), dup.size(), nullptr, nullptr, 0), SAFE_ERROR_INVALID_GRAPH);
    SAFE_REQUIRE_STR_CONTAINS(std::string(safe_get_last_error()), "duplicate");

    CStrings ids(node_ids(3));
    safe_index_t src[] = {0};
    safe_index_t dst[] = {7};
    SAFE_REQUIRE_EQ(safe_graph_create(g.ptr(), ids.data(), ids.size(), src, dst, 1), SAFE_ERROR_INVALID_GRAPH);
    SAFE_REQUIRE_FALSE(g.valid());
}

SAFE_TEST_CASE(features_errors) {
    CStrings ids(node_ids(2));
    CStrings dup({"a", "a"});
    std::vector<safe_real_t> values = {1, 2, 3, 4};
    FeaturesGuard x;
    SAFE_REQUIRE_EQ(safe_features_create(x.ptr(), ids.data(), 2, dup.data(), 2, values.data()), SAFE_ERROR_CONFIGURATION);

    CStrings names({"a", "b"});
    SAFE_REQUIRE_EQ(safe_features_create(x.ptr(), ids.data(), 2, names.data(), 2, nullptr), SAFE_ERROR_NULL_POINTER);
    SAFE_REQUIRE_EQ(safe_features_create(x.ptr(), ids.data(), 2, names.data(), 2, values.data()), SAFE_OK);
}

SAFE_TEST_CASE(features_size_overflow_rejected) {
    CStrings ids(node_ids(2));
    CStrings names({"a", "b"});
    std::vector<safe_real_t> values = {1, 2, 3, 4};
    FeaturesGuard x;
    const safe_size_t huge = std::numeric_limits<safe_size_t>::max() / 2;
    SAFE_REQUIRE_EQ(safe_features_create(x.ptr(), ids.data(), 2, names.data(), huge, values.data()),
                    SAFE_ERROR_INVALID_ARGUMENT);
    SAFE_REQUIRE_STR_CONTAINS(std::string(safe_get_last_error()), "overflow");
    SAFE_REQUIRE_FALSE(x.valid());
}

SAFE_TEST_CASE(one_hot_runs) {
    auto g = c_ring(RING);
    std::vector<std::string> labels;
    for (safe_index_t i = 0; i < RING; ++i) labels.push_back(i < RING / 2 ? "north" : "south");
    CStrings ids(node_ids(RING));
    CStrings lab(labels);

    FeaturesGuard x;
    SAFE_REQUIRE_EQ(safe_features_one_hot(x.ptr(), ids.data(), lab.data(), ids.size(), "region"), SAFE_OK);

    auto cfg = c_config();
    auto r = c_run(g.get(), x.get(), cfg.get());
    safe_index_t n = 0, f = 0;
    SAFE_REQUIRE_EQ(safe_result_shape(r.get(), &n, &f), SAFE_OK);
    SAFE_REQUIRE_EQ(n, RING);
    SAFE_REQUIRE_EQ(f, safe_index_t(2));

    const char* label = nullptr;
    SAFE_REQUIRE_EQ(safe_result_stratum_label(r.get(), 10, &label), SAFE_OK);
    SAFE_REQUIRE_STR_CONTAINS(std::string(label), "region=");
}

SAFE_TEST_SUITE_END

// =============================================================================
// Configuration
// =============================================================================

SAFE_TEST_SUITE(config)

SAFE_TEST_CASE(setters_accept_values) {
    ConfigGuard cfg;
    SAFE_REQUIRE_EQ(safe_config_create(cfg.ptr()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_permutations(cfg.get(), 500), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_alpha(cfg.get(), 0.1), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_radius(cfg.get(), 2), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_seed(cfg.get(), 3), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_aggregate(cfg.get(), SAFE_AGGREGATE_MEDIAN), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_correction(cfg.get(), SAFE_CORRECTION_HOLM), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_raw_output(cfg.get(), SAFE_TRUE), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_max_inflight(cfg.get(), 2), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_permutation_parallel(cfg.get(), SAFE_TRUE), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_verbose(cfg.get(), SAFE_FALSE), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_validate(cfg.get()), SAFE_OK);
}

SAFE_TEST_CASE(unknown_enums_rejected) {
    ConfigGuard cfg;
    SAFE_REQUIRE_EQ(safe_config_create(cfg.ptr()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_aggregate(cfg.get(), 9), SAFE_ERROR_CONFIGURATION);
    SAFE_REQUIRE_EQ(safe_config_set_aggregate(cfg.get(), -1), SAFE_ERROR_CONFIGURATION);
    SAFE_REQUIRE_EQ(safe_config_set_correction(cfg.get(), 4), SAFE_ERROR_CONFIGURATION);
    SAFE_REQUIRE_EQ(safe_config_set_alpha(nullptr, 0.1), SAFE_ERROR_NULL_POINTER);
}

SAFE_TEST_CASE(validate_ranges) {
    ConfigGuard cfg;
    SAFE_REQUIRE_EQ(safe_config_create(cfg.ptr()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_validate(cfg.get()), SAFE_OK);

    SAFE_REQUIRE_EQ(safe_config_set_alpha(cfg.get(), 1.0), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_validate(cfg.get()), SAFE_ERROR_CONFIGURATION);
    SAFE_REQUIRE_STR_CONTAINS(std::string(safe_get_last_error()), "alpha");

    SAFE_REQUIRE_EQ(safe_config_set_alpha(cfg.get(), 0.05), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_permutations(cfg.get(), 0), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_validate(cfg.get()), SAFE_ERROR_CONFIGURATION);

    SAFE_REQUIRE_EQ(safe_config_set_permutations(cfg.get(), 100), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_set_radius(cfg.get(), -1), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_config_validate(cfg.get()), SAFE_ERROR_CONFIGURATION);
}

SAFE_TEST_CASE(run_rejects_bad_config) {
    auto g = c_ring(10);
    auto x = c_features(10);
    auto cfg = c_config();
    (void)safe_config_set_alpha(cfg.get(), 0.0);
    ResultGuard r;
    safe_features_t m = x.get();
    SAFE_REQUIRE_EQ(safe_run(r.ptr(), g.get(), &m, 1, cfg.get(), nullptr), SAFE_ERROR_CONFIGURATION);
    SAFE_REQUIRE_FALSE(r.valid());
}

SAFE_TEST_SUITE_END

// =============================================================================
// Run
// =============================================================================

SAFE_TEST_SUITE(run)

SAFE_TEST_CASE(shape_and_seed) {
    safe_index_t n = 0, f = 0;
    SAFE_REQUIRE_EQ(safe_result_shape(ring_result(), &n, &f), SAFE_OK);
    SAFE_REQUIRE_EQ(n, RING);
    SAFE_REQUIRE_EQ(f, N_FEATURES);

    uint64_t seed = 0;
    SAFE_REQUIRE_EQ(safe_result_seed(ring_result(), &seed), SAFE_OK);
    SAFE_REQUIRE_EQ(seed, uint64_t(11));
}

SAFE_TEST_CASE(p_and_q_values) {
    std::vector<safe_real_t> p(CELLS), q(CELLS);
    SAFE_REQUIRE_EQ(safe_result_p_values(ring_result(), p.data(), p.size()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_result_q_values(ring_result(), q.data(), q.size()), SAFE_OK);
    SAFE_REQUIRE_TRUE(precision::all_pvalues(p));
    SAFE_REQUIRE_TRUE(precision::all_pvalues(q));

    // Non-skipped features: q never below p
    for (safe_index_t u = 0; u < RING; ++u) {
        for (safe_index_t k = 0; k < 3; ++k) {
            SAFE_REQUIRE_GE(q[cell(u, k)] + 1e-12, p[cell(u, k)]);
        }
    }
}

SAFE_TEST_CASE(directions_and_significance) {
    std::vector<int8_t> dir(CELLS);
    std::vector<uint8_t> sig(CELLS);
    std::vector<safe_real_t> q(CELLS), score(CELLS);
    SAFE_REQUIRE_EQ(safe_result_directions(ring_result(), dir.data(), dir.size()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_result_significant(ring_result(), sig.data(), sig.size()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_result_q_values(ring_result(), q.data(), q.size()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_result_scores(ring_result(), score.data(), score.size()), SAFE_OK);

    // Deep inside the left block
    SAFE_REQUIRE_EQ(dir[cell(10, 0)], int8_t(SAFE_DIRECTION_ENRICHED));
    SAFE_REQUIRE_EQ(dir[cell(10, 1)], int8_t(SAFE_DIRECTION_DEPLETED));
    SAFE_REQUIRE_TRUE(sig[cell(10, 0)] != 0);
    SAFE_REQUIRE_TRUE(sig[cell(10, 1)] != 0);
    SAFE_REQUIRE_GT(score[cell(10, 0)], 0.0);
    SAFE_REQUIRE_LT(score[cell(10, 1)], 0.0);

    // Constant feature is skipped
    SAFE_REQUIRE_EQ(dir[cell(10, 3)], int8_t(SAFE_DIRECTION_UNDEFINED));

    for (std::size_t k = 0; k < CELLS; ++k) {
        if (sig[k]) {
            SAFE_REQUIRE_LE(q[k], 0.05);
        }
        SAFE_REQUIRE_LE(std::abs(score[k]), 1.0);
    }
}

SAFE_TEST_CASE(skipped_count) {
    safe_size_t n = 0;
    SAFE_REQUIRE_EQ(safe_result_num_skipped(ring_result(), &n), SAFE_OK);
    SAFE_REQUIRE_EQ(n, safe_size_t(1));
}

SAFE_TEST_CASE(strata_and_labels) {
    const char* names[] = {"left", "right", "wave", "flat"};
    std::vector<safe_index_t> dominant(static_cast<std::size_t>(RING));
    SAFE_REQUIRE_EQ(safe_result_strata(ring_result(), dominant.data(), dominant.size()), SAFE_OK);

    SAFE_REQUIRE_TRUE(dominant[10] == 0 || dominant[10] == 1);
    for (safe_index_t u = 0; u < RING; ++u) {
        const char* label = nullptr;
        SAFE_REQUIRE_EQ(safe_result_stratum_label(ring_result(), u, &label), SAFE_OK);
        const safe_index_t d = dominant[static_cast<std::size_t>(u)];
        SAFE_REQUIRE_NE(d, safe_index_t(3));
        if (d < 0) {
            SAFE_REQUIRE_STR_EQ(label, "none");
        } else {
            SAFE_REQUIRE_STR_EQ(label, names[d]);
        }
    }
}

SAFE_TEST_CASE(accessor_errors) {
    std::vector<safe_real_t> small(CELLS - 1);
    SAFE_REQUIRE_EQ(safe_result_q_values(ring_result(), small.data(), small.size()), SAFE_ERROR_DIMENSION_MISMATCH);
    SAFE_REQUIRE_EQ(safe_result_p_values(ring_result(), nullptr, CELLS), SAFE_ERROR_NULL_POINTER);

    std::vector<safe_index_t> dominant(5);
    SAFE_REQUIRE_EQ(safe_result_strata(ring_result(), dominant.data(), dominant.size()), SAFE_ERROR_DIMENSION_MISMATCH);

    const char* label = nullptr;
    SAFE_REQUIRE_EQ(safe_result_stratum_label(ring_result(), RING, &label), SAFE_ERROR_INDEX_OUT_OF_BOUNDS);
    SAFE_REQUIRE_EQ(safe_result_stratum_label(ring_result(), -1, &label), SAFE_ERROR_INDEX_OUT_OF_BOUNDS);
}

SAFE_TEST_CASE(reproducible_with_seed) {
    auto g = c_ring(RING);
    auto x = c_features(RING);
    auto cfg = c_config();
    auto r = c_run(g.get(), x.get(), cfg.get());

    std::vector<safe_real_t> a(CELLS), b(CELLS);
    SAFE_REQUIRE_EQ(safe_result_p_values(ring_result(), a.data(), a.size()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_result_p_values(r.get(), b.data(), b.size()), SAFE_OK);
    SAFE_REQUIRE_TRUE(precision::vectors_identical(a, b));
}

SAFE_TEST_CASE(misaligned_features) {
    auto g = c_ring(RING);
    auto x = c_features(RING - 1);
    auto cfg = c_config();
    ResultGuard r;
    safe_features_t m = x.get();
    SAFE_REQUIRE_EQ(safe_run(r.ptr(), g.get(), &m, 1, cfg.get(), nullptr), SAFE_ERROR_INVALID_GRAPH);
}

SAFE_TEST_CASE(null_matrix_handle) {
    auto g = c_ring(RING);
    auto cfg = c_config();
    ResultGuard r;
    safe_features_t m = nullptr;
    SAFE_REQUIRE_EQ(safe_run(r.ptr(), g.get(), &m, 1, cfg.get(), nullptr), SAFE_ERROR_NULL_POINTER);
}

SAFE_TEST_CASE(cancelled_before_start) {
    auto g = c_ring(RING);
    auto x = c_features(RING);
    auto cfg = c_config();
    CancelGuard token;
    SAFE_REQUIRE_EQ(safe_cancel_create(token.ptr()), SAFE_OK);
    SAFE_REQUIRE_EQ(safe_cancel_request(token.get()), SAFE_OK);

    ResultGuard r;
    safe_features_t m = x.get();
    SAFE_REQUIRE_EQ(safe_run(r.ptr(), g.get(), &m, 1, cfg.get(), token.get()), SAFE_ERROR_CANCELLED);
    SAFE_REQUIRE_FALSE(r.valid());
}

SAFE_TEST_SUITE_END

// =============================================================================
// Ordination
// =============================================================================

SAFE_TEST_SUITE(ordination)

SAFE_TEST_CASE(feature_axes) {
    std::vector<safe_real_t> coords(static_cast<std::size_t>(N_FEATURES * 2));
    std::vector<safe_real_t> explained(2);
    SAFE_REQUIRE_EQ(safe_result_ordination(ring_result(), SAFE_AXIS_FEATURES, 2, coords.data(), coords.size(),
                                           explained.data()), SAFE_OK);
    SAFE_REQUIRE_TRUE(precision::all_within(explained, 0.0, 1.0 + 1e-9));
    SAFE_REQUIRE_GE(explained[0], explained[1]);
    SAFE_REQUIRE_LE(explained[0] + explained[1], 1.0 + 1e-9);

    // left and right carry opposite profiles and land apart on the first axis
    SAFE_REQUIRE_LT(coords[0] * coords[2], 0.0);
}

SAFE_TEST_CASE(node_axes) {
    std::vector<safe_real_t> coords(static_cast<std::size_t>(RING * 2));
    SAFE_REQUIRE_EQ(safe_result_ordination(ring_result(), SAFE_AXIS_NODES, 2, coords.data(), coords.size(),
                                           nullptr), SAFE_OK);
    for (double c : coords) {
        SAFE_REQUIRE_TRUE(std::isfinite(c));
    }
}

SAFE_TEST_CASE(bad_requests) {
    std::vector<safe_real_t> coords(16);
    SAFE_REQUIRE_EQ(safe_result_ordination(ring_result(), 7, 2, coords.data(), coords.size(), nullptr),
                    SAFE_ERROR_CONFIGURATION);
    SAFE_REQUIRE_EQ(safe_result_ordination(ring_result(), SAFE_AXIS_FEATURES, 0, coords.data(), coords.size(), nullptr),
                    SAFE_ERROR_CONFIGURATION);
    SAFE_REQUIRE_EQ(safe_result_ordination(ring_result(), SAFE_AXIS_FEATURES, 4, coords.data(), coords.size(), nullptr),
                    SAFE_ERROR_INSUFFICIENT_RANK);
    SAFE_REQUIRE_EQ(safe_result_ordination(ring_result(), SAFE_AXIS_FEATURES, 2, coords.data(), 3, nullptr),
                    SAFE_ERROR_DIMENSION_MISMATCH);
}

SAFE_TEST_CASE(size_mismatch_writes_nothing) {
    std::vector<safe_real_t> coords(3, -7.0);
    std::vector<safe_real_t> explained(2, -7.0);
    SAFE_REQUIRE_EQ(safe_result_ordination(ring_result(), SAFE_AXIS_FEATURES, 2, coords.data(), coords.size(),
                                           explained.data()), SAFE_ERROR_DIMENSION_MISMATCH);
    SAFE_REQUIRE_EQ(explained[0], -7.0);
    SAFE_REQUIRE_EQ(explained[1], -7.0);
    SAFE_REQUIRE_EQ(coords[0], -7.0);
}

SAFE_TEST_SUITE_END

// =============================================================================
// Export
// =============================================================================

SAFE_TEST_SUITE(export)

SAFE_TEST_CASE(tsv_tables) {
    const fs::path dir = temp_path("tsv");
    fs::remove_all(dir);
    fs::create_directories(dir);

    SAFE_REQUIRE_EQ(safe_result_export_tsv(ring_result(), dir.string().c_str()), SAFE_OK);
    SAFE_REQUIRE_TRUE(fs::exists(dir / "enrichment.tsv"));
    SAFE_REQUIRE_TRUE(fs::exists(dir / "strata.tsv"));
    SAFE_REQUIRE_TRUE(fs::exists(dir / "ranking.tsv"));
    SAFE_REQUIRE_TRUE(fs::exists(dir / "skipped.tsv"));

    SAFE_REQUIRE_EQ(safe_result_export_tsv(ring_result(), (dir / "missing" / "sub").string().c_str()),
                    SAFE_ERROR_WRITE_ERROR);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

SAFE_TEST_CASE(hdf5_file) {
    const fs::path path = temp_path("h5").string() + ".h5";
    const safe_error_t err = safe_result_export_hdf5(ring_result(), path.string().c_str());
#ifdef SAFE_HAS_HDF5
    SAFE_REQUIRE_EQ(err, SAFE_OK);
    SAFE_REQUIRE_TRUE(fs::exists(path));
    std::error_code ec;
    fs::remove(path, ec);
#else
    SAFE_REQUIRE_EQ(err, SAFE_ERROR_FEATURE_UNAVAILABLE);
#endif
}

SAFE_TEST_CASE(null_arguments) {
    SAFE_REQUIRE_EQ(safe_result_export_tsv(nullptr, "/tmp"), SAFE_ERROR_NULL_POINTER);
    SAFE_REQUIRE_EQ(safe_result_export_tsv(ring_result(), nullptr), SAFE_ERROR_NULL_POINTER);
}

SAFE_TEST_SUITE_END

SAFE_TEST_END

SAFE_TEST_MAIN()
