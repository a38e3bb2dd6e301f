#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/macros.hpp"
#include "safe/core/graph.hpp"
#include "safe/threading/parallel_for.hpp"
#include "safe/threading/workspace.hpp"
#include "safe/threading/scheduler.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

// =============================================================================
// FILE: safe/kernel/neighborhood.hpp
// BRIEF: Hop-radius neighborhoods over a similarity network
//
// Every node's neighborhood is the set of nodes reachable within `radius`
// hops, the node itself included. Members are stored sorted in one CSR
// layout. The relation is symmetric because the graph is undirected.
// =============================================================================

namespace safe::kernel::neighborhood {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
    constexpr Index DEFAULT_RADIUS = 1;
    constexpr Index MAX_RADIUS = 64;
    constexpr Size PARALLEL_NODES_THRESHOLD = 256;
}

// =============================================================================
// Neighborhood Map (CSR)
// =============================================================================

struct NeighborhoodMap {
    Index radius = 0;
    std::vector<Index> offsets;   // n + 1
    std::vector<Index> members;   // sorted within each node

    SAFE_FORCE_INLINE Index num_nodes() const noexcept {
        return offsets.empty() ? 0 : static_cast<Index>(offsets.size() - 1);
    }

    SAFE_FORCE_INLINE Index size_of(Index u) const noexcept {
        return offsets[static_cast<Size>(u) + 1] - offsets[static_cast<Size>(u)];
    }

    SAFE_FORCE_INLINE Array<const Index> members_of(Index u) const noexcept {
        return Array<const Index>(members.data() + offsets[static_cast<Size>(u)],
                                  static_cast<Size>(size_of(u)));
    }

    bool contains(Index u, Index v) const noexcept {
        auto m = members_of(u);
        return std::binary_search(m.begin(), m.end(), v);
    }

    Index max_size() const noexcept {
        Index best = 0;
        for (Index u = 0; u < num_nodes(); ++u) {
            best = std::max(best, size_of(u));
        }
        return best;
    }
};

namespace detail {

// BFS queue with per-entry hop depth, reused across sources
class FastQueue {
public:
    explicit FastQueue(Size cap) : nodes_(cap), depth_(cap), head_(0), tail_(0) {}

    SAFE_FORCE_INLINE bool empty() const noexcept { return head_ == tail_; }

    SAFE_FORCE_INLINE void push(Index v, Index d) noexcept {
        nodes_[tail_] = v;
        depth_[tail_] = d;
        ++tail_;
    }

    SAFE_FORCE_INLINE void pop(Index& v, Index& d) noexcept {
        v = nodes_[head_];
        d = depth_[head_];
        ++head_;
    }

    SAFE_FORCE_INLINE void clear() noexcept {
        head_ = 0;
        tail_ = 0;
    }

private:
    std::vector<Index> nodes_;
    std::vector<Index> depth_;
    Size head_;
    Size tail_;
};

// Collect nodes within `radius` hops of `source` into `out` (sorted).
// `stamp` marks visits with source + 1 so it never needs clearing.
inline void truncated_bfs(
    const Graph& graph,
    Index source,
    Index radius,
    Array<Index> stamp,
    FastQueue& queue,
    std::vector<Index>& out
) {
    const Index mark = source + 1;
    out.clear();
    queue.clear();

    stamp[source] = mark;
    queue.push(source, 0);
    out.push_back(source);

    while (!queue.empty()) {
        Index u = 0;
        Index d = 0;
        queue.pop(u, d);
        if (d == radius) continue;

        auto nbrs = graph.neighbors(u);
        for (Size k = 0; k < nbrs.size(); ++k) {
            const Index v = nbrs[static_cast<Index>(k)];
            if (stamp[v] != mark) {
                stamp[v] = mark;
                queue.push(v, d + 1);
                out.push_back(v);
            }
        }
    }

    std::sort(out.begin(), out.end());
}

inline void validate_adjacency(const Graph& graph) {
    const Index n = graph.num_nodes();
    auto offsets = graph.offsets();
    auto indices = graph.indices();

    SAFE_CHECK_GRAPH(n > 0, "Neighborhood: graph has no nodes");
    SAFE_CHECK_GRAPH(offsets.size() == static_cast<Size>(n) + 1,
        "Neighborhood: adjacency offsets do not match node count");
    SAFE_CHECK_GRAPH(static_cast<Size>(offsets[n]) == indices.size(),
        "Neighborhood: adjacency offsets do not cover edge list");
    for (Size k = 0; k < indices.size(); ++k) {
        const Index v = indices[static_cast<Index>(k)];
        SAFE_CHECK_GRAPH(v >= 0 && v < n, "Neighborhood: edge references a non-existent node");
    }
}

} // namespace detail

// =============================================================================
// Build
// =============================================================================

/// Compute every node's neighborhood at hop radius `radius` (>= 0).
inline NeighborhoodMap build(const Graph& graph, Index radius = config::DEFAULT_RADIUS) {
    SAFE_CHECK_CONFIG(radius >= 0 && radius <= config::MAX_RADIUS,
        "Neighborhood: radius must lie in [0, " + std::to_string(config::MAX_RADIUS) + "]");
    detail::validate_adjacency(graph);

    const Index n = graph.num_nodes();
    const Size N = static_cast<Size>(n);

    NeighborhoodMap map;
    map.radius = radius;
    map.offsets.assign(N + 1, 0);

    if (radius == 0) {
        map.members.resize(N);
        for (Index u = 0; u < n; ++u) {
            map.offsets[static_cast<Size>(u) + 1] = u + 1;
            map.members[static_cast<Size>(u)] = u;
        }
        return map;
    }

    std::vector<std::vector<Index>> per_node(N);

    const size_t n_threads = (N >= config::PARALLEL_NODES_THRESHOLD)
        ? safe::threading::Scheduler::get_num_threads() : 1;

    safe::threading::WorkspacePool<Index> stamps;
    stamps.init(n_threads, N);
    for (size_t t = 0; t < n_threads; ++t) {
        stamps.zero(t);
    }
    std::vector<detail::FastQueue> queues;
    queues.reserve(n_threads);
    for (size_t t = 0; t < n_threads; ++t) {
        queues.emplace_back(N);
    }

    auto visit = [&](size_t i, size_t rank) {
        detail::truncated_bfs(graph, static_cast<Index>(i), radius,
                              stamps.span(rank), queues[rank], per_node[i]);
    };

    if (n_threads > 1) {
        safe::threading::parallel_for(Size(0), N, visit);
    } else {
        for (Size i = 0; i < N; ++i) {
            visit(i, 0);
        }
    }

    for (Size i = 0; i < N; ++i) {
        map.offsets[i + 1] = map.offsets[i] + static_cast<Index>(per_node[i].size());
    }
    map.members.resize(static_cast<Size>(map.offsets[N]));
    for (Size i = 0; i < N; ++i) {
        std::copy(per_node[i].begin(), per_node[i].end(),
                  map.members.begin() + map.offsets[i]);
    }

    return map;
}

// =============================================================================
// Cached Index
// =============================================================================

/// Neighborhood maps of one graph, computed once per radius and shared
/// read-only. Lookups are thread-safe.
class NeighborhoodIndex {
public:
    explicit NeighborhoodIndex(std::shared_ptr<const Graph> graph)
        : graph_(std::move(graph))
    {
        SAFE_CHECK_NULL(graph_, "NeighborhoodIndex: graph is null");
    }

    std::shared_ptr<const NeighborhoodMap> get(Index radius = config::DEFAULT_RADIUS) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(radius);
        if (it != cache_.end()) {
            return it->second;
        }
        auto map = std::make_shared<const NeighborhoodMap>(build(*graph_, radius));
        cache_.emplace(radius, map);
        return map;
    }

    const Graph& graph() const noexcept { return *graph_; }

    std::shared_ptr<const Graph> graph_ptr() const noexcept { return graph_; }

    Size cached_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

private:
    std::shared_ptr<const Graph> graph_;
    mutable std::mutex mutex_;
    std::map<Index, std::shared_ptr<const NeighborhoodMap>> cache_;
};

} // namespace safe::kernel::neighborhood
