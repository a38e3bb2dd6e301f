#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/graph.hpp"
#include "safe/core/memory.hpp"
#include "safe/kernel/multiple_testing.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

// =============================================================================
// FILE: safe/kernel/subnetwork.hpp
// BRIEF: Connected components of the subgraph induced by enriched nodes
// =============================================================================

namespace safe::kernel::subnetwork {

namespace config {
    constexpr Index DEFAULT_MIN_SIZE = 1;
}

struct Component {
    std::vector<Index> nodes;   // ascending

    Index size() const noexcept { return static_cast<Index>(nodes.size()); }
};

struct Subnetwork {
    Index feature = 0;
    std::vector<Index> enriched_nodes;
    std::vector<Component> components;  // largest first
};

namespace detail {

// Sequential union-find, union by rank with path compression
class UnionFind {
public:
    explicit UnionFind(Size n)
        : parent_(n), rank_(n, 0) {
        std::iota(parent_.begin(), parent_.end(), Index(0));
    }

    Index find(Index x) noexcept {
        Index root = x;
        while (parent_[static_cast<Size>(root)] != root) {
            root = parent_[static_cast<Size>(root)];
        }
        while (parent_[static_cast<Size>(x)] != root) {
            Index next = parent_[static_cast<Size>(x)];
            parent_[static_cast<Size>(x)] = root;
            x = next;
        }
        return root;
    }

    bool unite(Index x, Index y) noexcept {
        Index rx = find(x);
        Index ry = find(y);
        if (rx == ry) return false;

        auto& kx = rank_[static_cast<Size>(rx)];
        auto& ky = rank_[static_cast<Size>(ry)];
        if (kx < ky) {
            parent_[static_cast<Size>(rx)] = ry;
        } else if (kx > ky) {
            parent_[static_cast<Size>(ry)] = rx;
        } else {
            parent_[static_cast<Size>(ry)] = rx;
            ++kx;
        }
        return true;
    }

private:
    std::vector<Index> parent_;
    std::vector<uint8_t> rank_;
};

} // namespace detail

/// Enriched nodes of one feature and the connected components they induce.
/// Components with fewer than `min_size` nodes are dropped, so `min_size` is
/// inclusive: a size filter that discards components of at most k nodes is
/// min_size = k + 1. Ties in size keep the component with the smallest node
/// first.
inline Subnetwork enriched_components(
    const Graph& graph,
    const multiple_testing::CorrectedResult& corrected,
    Index feature,
    Index min_size = config::DEFAULT_MIN_SIZE
) {
    const Index n = graph.num_nodes();
    SAFE_CHECK_GRAPH(corrected.n_nodes() == n, "enriched_components: result does not match graph");
    SAFE_CHECK_RANGE(feature, 0, corrected.n_features() - 1, "enriched_components: feature out of range");
    SAFE_CHECK_ARG(min_size >= 1, "enriched_components: min_size must be at least 1");

    const auto& er = corrected.source();

    Subnetwork out;
    out.feature = feature;

    std::vector<uint8_t> enriched(static_cast<Size>(n), 0);
    for (Index u = 0; u < n; ++u) {
        if (corrected.is_significant(u, feature) && er.direction_at(u, feature) == Direction::Enriched) {
            enriched[static_cast<Size>(u)] = 1;
            out.enriched_nodes.push_back(u);
        }
    }
    if (out.enriched_nodes.empty()) return out;

    detail::UnionFind uf(static_cast<Size>(n));
    for (Index u : out.enriched_nodes) {
        for (Index v : graph.neighbors(u)) {
            if (v > u && enriched[static_cast<Size>(v)]) {
                uf.unite(u, v);
            }
        }
    }

    // Group by root; enriched_nodes is ascending so members stay sorted
    std::vector<Index> slot(static_cast<Size>(n), -1);
    std::vector<Component> comps;
    for (Index u : out.enriched_nodes) {
        const Index root = uf.find(u);
        Index& s = slot[static_cast<Size>(root)];
        if (s < 0) {
            s = static_cast<Index>(comps.size());
            comps.emplace_back();
        }
        comps[static_cast<Size>(s)].nodes.push_back(u);
    }

    std::stable_sort(comps.begin(), comps.end(), [](const Component& a, const Component& b) {
        return a.nodes.size() > b.nodes.size();
    });

    for (auto& c : comps) {
        if (c.size() >= min_size) {
            out.components.push_back(std::move(c));
        }
    }
    return out;
}

} // namespace safe::kernel::subnetwork
