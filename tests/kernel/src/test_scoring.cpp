// =============================================================================
// SAFE Tests - Enrichment Scorer
// =============================================================================
//
// Coverage for safe/kernel/scoring.hpp
//
// Functions tested:
//   - scoring::score_feature
//   - scoring::score (waves, skipped features, cancellation, progress)
//   - permutation::at_least / at_most
//   - scoring::safe_score / score_threshold
//
// =============================================================================

#include "test.hpp"
#include "safe/kernel/neighborhood.hpp"
#include "safe/kernel/scoring.hpp"
#include "safe/threading/cancellation.hpp"
#include "safe/threading/scheduler.hpp"

using namespace safe::test;
namespace nb = safe::kernel::neighborhood;
namespace perm = safe::kernel::permutation;
namespace sc = safe::kernel::scoring;

using safe::Direction;

static safe::Array<const safe::Real> as_array(const std::vector<safe::Real>& v) {
    return safe::Array<const safe::Real>(v.data(), v.size());
}

static sc::ScoreOptions options_with(std::size_t n_permutations, uint64_t seed) {
    sc::ScoreOptions opt;
    opt.n_permutations = n_permutations;
    opt.seed = seed;
    return opt;
}

SAFE_TEST_BEGIN

// =============================================================================
// Single Feature
// =============================================================================

SAFE_TEST_SUITE(single_feature)

SAFE_TEST_CASE(ring_directions) {
    auto g = ring_graph(6);
    auto map = nb::build(*g, 1);
    std::vector<safe::Real> v = {10, 10, 10, 0, 0, 0};
    auto s = sc::score_feature(as_array(v), map, perm::Aggregate::Mean, 1000, 2024);

    for (int u = 0; u < 3; ++u) {
        SAFE_REQUIRE_EQ(s.direction[static_cast<std::size_t>(u)], Direction::Enriched);
    }
    for (int u = 3; u < 6; ++u) {
        SAFE_REQUIRE_EQ(s.direction[static_cast<std::size_t>(u)], Direction::Depleted);
    }
    // Centre nodes hit the 1/20 floor of a 3-of-6 draw
    SAFE_REQUIRE_TRUE(s.p_enriched[1] > 0.03 && s.p_enriched[1] < 0.075);
    SAFE_REQUIRE_TRUE(s.p_depleted[4] > 0.03 && s.p_depleted[4] < 0.075);
}

SAFE_TEST_CASE(matches_exact_enumeration) {
    auto g = ring_graph(7);
    auto map = nb::build(*g, 1);
    std::vector<safe::Real> v = {4, 0, 1, 7, 2, 2, 5};
    const std::size_t P = 5000;
    auto s = sc::score_feature(as_array(v), map, perm::Aggregate::Mean, P, 99);

    auto exact = oracle::exact_mean_pvalues(std::vector<double>(v.begin(), v.end()), oracle::neighborhoods(*g, 1));
    for (std::size_t u = 0; u < 7; ++u) {
        SAFE_REQUIRE_NEAR(s.p_enriched[u], exact.enriched[u], 0.035);
        SAFE_REQUIRE_NEAR(s.p_depleted[u], exact.depleted[u], 0.035);
    }
}

SAFE_TEST_CASE(pvalues_in_unit_interval) {
    auto g = two_clique_graph(6);
    auto map = nb::build(*g, 1);
    Random rng(8);
    std::vector<safe::Real> v(12);
    for (auto& x : v) x = rng.normal();

    for (std::size_t P : {std::size_t(1), std::size_t(7), std::size_t(200)}) {
        auto s = sc::score_feature(as_array(v), map, perm::Aggregate::Mean, P, 3);
        SAFE_REQUIRE_TRUE(precision::all_pvalues(s.p_enriched));
        SAFE_REQUIRE_TRUE(precision::all_pvalues(s.p_depleted));
    }
}

SAFE_TEST_CASE(observed_is_neighborhood_aggregate) {
    auto g = path_graph(4);
    auto map = nb::build(*g, 1);
    std::vector<safe::Real> v = {1, 5, 2, 8};
    auto s = sc::score_feature(as_array(v), map, perm::Aggregate::Max, 50, 1);
    SAFE_REQUIRE_NEAR(s.observed[0], 5.0, 1e-12);
    SAFE_REQUIRE_NEAR(s.observed[2], 8.0, 1e-12);
    SAFE_REQUIRE_NEAR(s.observed[3], 8.0, 1e-12);
}

SAFE_TEST_CASE(parallel_blocks_match_serial) {
    auto g = ring_graph(40);
    auto map = nb::build(*g, 2);
    Random rng(4);
    std::vector<safe::Real> v(40);
    for (auto& x : v) x = rng.uniform();

    safe::threading::Scheduler::set_num_threads(4);
    auto a = sc::score_feature(as_array(v), map, perm::Aggregate::Mean, 700, 5, false);
    auto b = sc::score_feature(as_array(v), map, perm::Aggregate::Mean, 700, 5, true);
    safe::threading::Scheduler::set_num_threads(0);

    SAFE_REQUIRE_TRUE(precision::vectors_identical(a.p_enriched, b.p_enriched));
    SAFE_REQUIRE_TRUE(precision::vectors_identical(a.p_depleted, b.p_depleted));
}

SAFE_TEST_CASE(reordered_sums_count_as_ties) {
    // On a triangle every permutation has the same neighborhood mean; only the
    // order of the floating-point additions changes
    auto g = make_graph(3, {{0, 1}, {1, 2}, {0, 2}});
    auto map = nb::build(*g, 1);
    std::vector<safe::Real> v = {0.1, 0.2, 0.3};

    for (auto agg : {perm::Aggregate::Mean, perm::Aggregate::Sum}) {
        auto s = sc::score_feature(as_array(v), map, agg, 1000, 7);
        for (std::size_t u = 0; u < 3; ++u) {
            SAFE_REQUIRE_NEAR(s.p_enriched[u], 1.0, 0.0);
            SAFE_REQUIRE_NEAR(s.p_depleted[u], 1.0, 0.0);
            SAFE_REQUIRE_EQ(s.direction[u], Direction::Neither);
        }
    }
}

SAFE_TEST_CASE(tail_comparison_tolerance) {
    const double obs = (0.1 + 0.2) + 0.3;
    const double alt = 0.1 + (0.2 + 0.3);
    SAFE_REQUIRE_TRUE(perm::at_least(alt, obs) && perm::at_most(alt, obs));
    SAFE_REQUIRE_TRUE(perm::at_least(obs, alt) && perm::at_most(obs, alt));
    SAFE_REQUIRE_FALSE(perm::at_least(0.59, 0.6));
    SAFE_REQUIRE_FALSE(perm::at_most(0.61, 0.6));
    SAFE_REQUIRE_FALSE(perm::at_least(1e6 - 1.0, 1e6));
}

SAFE_TEST_CASE(constant_feature_is_degenerate) {
    auto g = ring_graph(5);
    auto map = nb::build(*g, 1);
    std::vector<safe::Real> v(5, 3.0);
    SAFE_REQUIRE_THROWS(sc::score_feature(as_array(v), map, perm::Aggregate::Mean, 10, 1),
                        safe::DegenerateFeatureError);
}

SAFE_TEST_SUITE_END

// =============================================================================
// All Features
// =============================================================================

SAFE_TEST_SUITE(all_features)

SAFE_TEST_CASE(layout_and_metadata) {
    auto g = ring_graph(6);
    auto map = nb::build(*g, 1);
    auto x = feature_table(6, {"a", "b"}, [](safe::Index i, std::size_t f) { return f == 0 ? double(i) : double(i % 2); });
    auto r = sc::score(*g, map, x, options_with(100, 1));

    SAFE_REQUIRE_EQ(r.n_nodes, 6);
    SAFE_REQUIRE_EQ(r.n_features, 2);
    SAFE_REQUIRE_EQ(r.n_permutations, std::size_t(100));
    SAFE_REQUIRE_EQ(r.radius, 1);
    SAFE_REQUIRE_EQ(r.observed.size(), std::size_t(12));
    SAFE_REQUIRE_EQ(r.feature_index("b"), 1);
    SAFE_REQUIRE_THROWS(r.feature_index("zzz"), safe::ValueError);
    SAFE_REQUIRE_TRUE(r.skipped_features().empty());
}

SAFE_TEST_CASE(degenerate_feature_skipped) {
    auto g = ring_graph(6);
    auto map = nb::build(*g, 1);
    auto x = feature_table(6, {"good", "flat"}, [](safe::Index i, std::size_t f) { return f == 0 ? double(i < 3) : 1.0; });
    auto r = sc::score(*g, map, x, options_with(200, 1));

    SAFE_REQUIRE_TRUE(r.is_scored(0));
    SAFE_REQUIRE_FALSE(r.is_scored(1));
    SAFE_REQUIRE_EQ(r.status[1], sc::FeatureStatus::Degenerate);
    SAFE_REQUIRE_FALSE(r.status_reason[1].empty());
    SAFE_REQUIRE((r.skipped_features() == std::vector<safe::Index>{1}));
    for (safe::Index u = 0; u < 6; ++u) {
        SAFE_REQUIRE_EQ(r.direction_at(u, 1), Direction::Undefined);
        SAFE_REQUIRE_NEAR(r.p_value(u, 1), 1.0, 0.0);
        SAFE_REQUIRE_TRUE(std::isnan(r.observed[r.cell(u, 1)]));
    }
}

SAFE_TEST_CASE(single_node_graph_completes) {
    auto g = make_graph(1, {});
    auto map = nb::build(*g, 1);
    auto x = feature_column(1, "only", [](safe::Index) { return 5.0; });
    auto r = sc::score(*g, map, x, options_with(100, 1));

    SAFE_REQUIRE_EQ(r.status[0], sc::FeatureStatus::Degenerate);
    SAFE_REQUIRE_EQ(r.direction_at(0, 0), Direction::Undefined);
    SAFE_REQUIRE_NEAR(r.p_value(0, 0), 1.0, 0.0);
}

SAFE_TEST_CASE(bit_identical_across_threads_and_waves) {
    auto g = two_clique_graph(8);
    auto map = nb::build(*g, 1);
    Random rng(17);
    auto x = random_features(16, 9, rng);

    safe::threading::Scheduler::set_num_threads(1);
    auto base = sc::score(*g, map, x, options_with(300, 555));

    safe::threading::Scheduler::set_num_threads(4);
    auto wide = sc::score(*g, map, x, options_with(300, 555));

    auto opt = options_with(300, 555);
    opt.max_inflight_features = 2;
    opt.permutation_parallel = false;
    auto narrow = sc::score(*g, map, x, opt);
    safe::threading::Scheduler::set_num_threads(0);

    SAFE_REQUIRE_TRUE(precision::vectors_identical(base.p_enriched, wide.p_enriched));
    SAFE_REQUIRE_TRUE(precision::vectors_identical(base.p_depleted, wide.p_depleted));
    SAFE_REQUIRE_TRUE(precision::vectors_identical(base.p_enriched, narrow.p_enriched));
    SAFE_REQUIRE_TRUE(base.direction == narrow.direction);
}

SAFE_TEST_CASE(feature_result_independent_of_neighbors) {
    // A feature's scores depend on its position and values only
    auto g = ring_graph(10);
    auto map = nb::build(*g, 1);
    auto first = feature_table(10, {"x", "y"}, [](safe::Index i, std::size_t f) { return f == 0 ? double(i) : double(9 - i); });
    auto second = feature_table(10, {"x", "z"}, [](safe::Index i, std::size_t f) { return f == 0 ? double(i) : double(i * i); });
    auto a = sc::score(*g, map, first, options_with(250, 8));
    auto b = sc::score(*g, map, second, options_with(250, 8));
    for (safe::Index u = 0; u < 10; ++u) {
        SAFE_REQUIRE_EQ(a.p_enriched[a.cell(u, 0)], b.p_enriched[b.cell(u, 0)]);
    }
}

SAFE_TEST_CASE(cancelled_before_start) {
    auto g = ring_graph(6);
    auto map = nb::build(*g, 1);
    auto x = feature_table(6, {"a", "b", "c"}, [](safe::Index i, std::size_t f) { return double((i + f) % 3); });
    safe::threading::CancellationToken token;
    token.cancel();

    auto opt = options_with(100, 1);
    opt.cancel = &token;
    auto r = sc::score(*g, map, x, opt);
    for (safe::Index f = 0; f < 3; ++f) {
        SAFE_REQUIRE_EQ(r.status[static_cast<std::size_t>(f)], sc::FeatureStatus::Cancelled);
        SAFE_REQUIRE_EQ(r.direction_at(0, f), Direction::Undefined);
    }
    SAFE_REQUIRE_EQ(r.skipped_features().size(), std::size_t(3));
}

SAFE_TEST_CASE(cancelled_mid_run_keeps_finished_features) {
    auto g = ring_graph(12);
    auto map = nb::build(*g, 1);
    Random rng(31);
    auto x = random_features(12, 6, rng);

    auto opt = options_with(200, 404);
    opt.max_inflight_features = 1;
    auto full = sc::score(*g, map, x, opt);

    const safe::Index k = 2;
    safe::threading::CancellationToken token;
    safe::Index done = 0;
    opt.cancel = &token;
    opt.on_feature_done = [&](safe::Index) {
        if (++done == k) token.cancel();
    };
    auto part = sc::score(*g, map, x, opt);

    SAFE_REQUIRE_EQ(done, k);
    for (safe::Index f = 0; f < 6; ++f) {
        const bool finished = f < k;
        SAFE_REQUIRE_EQ(part.status[static_cast<std::size_t>(f)],
                        finished ? sc::FeatureStatus::Scored : sc::FeatureStatus::Cancelled);
        for (safe::Index u = 0; u < 12; ++u) {
            const std::size_t c = part.cell(u, f);
            if (finished) {
                SAFE_REQUIRE_EQ(part.p_enriched[c], full.p_enriched[c]);
                SAFE_REQUIRE_EQ(part.p_depleted[c], full.p_depleted[c]);
                SAFE_REQUIRE_EQ(part.observed[c], full.observed[c]);
                SAFE_REQUIRE_EQ(part.direction[c], full.direction[c]);
            } else {
                SAFE_REQUIRE_EQ(part.direction[c], Direction::Undefined);
                SAFE_REQUIRE_TRUE(std::isnan(part.observed[c]));
            }
        }
    }
    SAFE_REQUIRE_EQ(part.skipped_features().size(), std::size_t(6 - k));
}

SAFE_TEST_CASE(misaligned_rows_rejected) {
    auto g = ring_graph(4);
    auto map = nb::build(*g, 1);
    auto x = reversed_rows(feature_column(4, "a", [](safe::Index i) { return double(i); }));
    SAFE_REQUIRE_THROWS(sc::score(*g, map, x, options_with(10, 1)), safe::InvalidGraphError);

    auto other_map = nb::build(*ring_graph(5), 1);
    auto y = feature_column(4, "a", [](safe::Index i) { return double(i); });
    SAFE_REQUIRE_THROWS(sc::score(*g, other_map, y, options_with(10, 1)), safe::InvalidGraphError);
}

SAFE_TEST_SUITE_END

// =============================================================================
// Score Normalization
// =============================================================================

SAFE_TEST_SUITE(normalization)

SAFE_TEST_CASE(safe_score_range) {
    SAFE_REQUIRE_NEAR(sc::safe_score(1.0, 999), 0.0, 1e-12);
    SAFE_REQUIRE_NEAR(sc::safe_score(0.001, 999), 1.0, 1e-12);
    SAFE_REQUIRE_NEAR(sc::safe_score(0.1, 999), 1.0 / 3.0, 1e-12);
    SAFE_REQUIRE_NEAR(sc::safe_score(1e-9, 999), 1.0, 1e-12);
}

SAFE_TEST_CASE(threshold_matches_alpha) {
    const double t = sc::score_threshold(0.05, 999);
    SAFE_REQUIRE_NEAR(sc::safe_score(0.05, 999), t, 1e-12);
    SAFE_REQUIRE_TRUE(sc::safe_score(0.04, 999) > t);
    SAFE_REQUIRE_TRUE(sc::safe_score(0.06, 999) < t);
}

SAFE_TEST_SUITE_END

SAFE_TEST_END

SAFE_TEST_MAIN()
