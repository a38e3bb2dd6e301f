#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/macros.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// =============================================================================
/// @file graph.hpp
/// @brief Owning similarity network with symmetric CSR adjacency
///
/// @section Storage
/// - Row `u` lists the neighbors of node `u`, sorted ascending.
/// - Every undirected edge {u, v} is stored twice (u -> v and v -> u).
/// - Self-loops are dropped and duplicate edges merged at build time.
///
/// Node identifiers are unique strings. The graph is immutable once built
/// and is shared read-only across workers.
// =============================================================================

namespace safe {

class Graph {
public:
    Graph() = default;

    // -------------------------------------------------------------------------
    // Builders
    // -------------------------------------------------------------------------

    /// @brief Build from node ids and edges given by id.
    /// @throws InvalidGraphError on duplicate/empty ids or unknown endpoints.
    static Graph from_edges(
        std::vector<std::string> node_ids,
        const std::vector<std::pair<std::string, std::string>>& edges
    ) {
        Graph g;
        g.init_nodes(std::move(node_ids));

        std::vector<std::pair<Index, Index>> index_edges;
        index_edges.reserve(edges.size());
        for (const auto& [a, b] : edges) {
            auto ia = g.find(a);
            auto ib = g.find(b);
            SAFE_CHECK_GRAPH(ia.has_value(), "Graph: edge references unknown node '" + a + "'");
            SAFE_CHECK_GRAPH(ib.has_value(), "Graph: edge references unknown node '" + b + "'");
            index_edges.emplace_back(*ia, *ib);
        }

        g.build_adjacency(index_edges);
        return g;
    }

    /// @brief Build from node ids and edges given by node position.
    static Graph from_index_edges(
        std::vector<std::string> node_ids,
        const std::vector<std::pair<Index, Index>>& edges
    ) {
        Graph g;
        g.init_nodes(std::move(node_ids));
        g.build_adjacency(edges);
        return g;
    }

    /// @brief Build from a CSR adjacency (offsets of length n+1).
    ///
    /// Asymmetric input is symmetrized.
    static Graph from_csr(
        std::vector<std::string> node_ids,
        Array<const Index> offsets,
        Array<const Index> indices
    ) {
        const Size n = node_ids.size();
        SAFE_CHECK_GRAPH(offsets.size() == n + 1,
            "Graph: CSR offsets length must equal node count + 1");
        SAFE_CHECK_GRAPH(offsets[0] == 0, "Graph: CSR offsets must start at 0");

        std::vector<std::pair<Index, Index>> edges;
        edges.reserve(indices.size());
        for (Size u = 0; u < n; ++u) {
            const Index begin = offsets[static_cast<Index>(u)];
            const Index end = offsets[static_cast<Index>(u + 1)];
            SAFE_CHECK_GRAPH(begin <= end && static_cast<Size>(end) <= indices.size(),
                "Graph: CSR offsets are not monotone or exceed index array");
            for (Index k = begin; k < end; ++k) {
                edges.emplace_back(static_cast<Index>(u), indices[k]);
            }
        }

        return from_index_edges(std::move(node_ids), edges);
    }

    // -------------------------------------------------------------------------
    // Graph Properties
    // -------------------------------------------------------------------------

    SAFE_FORCE_INLINE Index num_nodes() const noexcept {
        return static_cast<Index>(node_ids_.size());
    }

    /// @brief Number of undirected edges.
    SAFE_FORCE_INLINE Index num_edges() const noexcept {
        return static_cast<Index>(indices_.size() / 2);
    }

    // -------------------------------------------------------------------------
    // Traversal API
    // -------------------------------------------------------------------------

    SAFE_FORCE_INLINE Index degree(Index u) const noexcept {
        return offsets_[static_cast<Size>(u) + 1] - offsets_[static_cast<Size>(u)];
    }

    SAFE_FORCE_INLINE Array<const Index> neighbors(Index u) const noexcept {
        const Index begin = offsets_[static_cast<Size>(u)];
        return Array<const Index>(indices_.data() + begin, static_cast<Size>(degree(u)));
    }

    Array<const Index> offsets() const noexcept {
        return Array<const Index>(offsets_.data(), offsets_.size());
    }

    Array<const Index> indices() const noexcept {
        return Array<const Index>(indices_.data(), indices_.size());
    }

    // -------------------------------------------------------------------------
    // Node Identity
    // -------------------------------------------------------------------------

    const std::string& node_id(Index u) const {
        SAFE_CHECK_RANGE(u, Index(0), num_nodes() - 1, "Graph: node index out of range");
        return node_ids_[static_cast<Size>(u)];
    }

    const std::vector<std::string>& node_ids() const noexcept { return node_ids_; }

    std::optional<Index> find(const std::string& id) const {
        auto it = id_to_index_.find(id);
        if (it == id_to_index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// @throws InvalidGraphError if the id is not a node.
    Index index_of(const std::string& id) const {
        auto idx = find(id);
        SAFE_CHECK_GRAPH(idx.has_value(), "Graph: unknown node '" + id + "'");
        return *idx;
    }

    bool has_edge(Index u, Index v) const noexcept {
        auto nbrs = neighbors(u);
        return std::binary_search(nbrs.begin(), nbrs.end(), v);
    }

    bool empty() const noexcept { return node_ids_.empty(); }

private:
    void init_nodes(std::vector<std::string> node_ids) {
        SAFE_CHECK_GRAPH(!node_ids.empty(), "Graph: at least one node is required");

        node_ids_ = std::move(node_ids);
        id_to_index_.reserve(node_ids_.size());
        for (Size i = 0; i < node_ids_.size(); ++i) {
            SAFE_CHECK_GRAPH(!node_ids_[i].empty(), "Graph: empty node id at position " + std::to_string(i));
            auto [it, inserted] = id_to_index_.emplace(node_ids_[i], static_cast<Index>(i));
            SAFE_CHECK_GRAPH(inserted, "Graph: duplicate node id '" + node_ids_[i] + "'");
        }
    }

    void build_adjacency(const std::vector<std::pair<Index, Index>>& edges) {
        const Index n = num_nodes();

        std::vector<std::pair<Index, Index>> arcs;
        arcs.reserve(edges.size() * 2);
        for (const auto& [u, v] : edges) {
            SAFE_CHECK_GRAPH(u >= 0 && u < n && v >= 0 && v < n,
                "Graph: edge (" + std::to_string(u) + ", " + std::to_string(v) +
                ") references a non-existent node");
            if (u == v) continue;
            arcs.emplace_back(u, v);
            arcs.emplace_back(v, u);
        }

        std::sort(arcs.begin(), arcs.end());
        arcs.erase(std::unique(arcs.begin(), arcs.end()), arcs.end());

        offsets_.assign(static_cast<Size>(n) + 1, 0);
        indices_.resize(arcs.size());
        for (Size k = 0; k < arcs.size(); ++k) {
            ++offsets_[static_cast<Size>(arcs[k].first) + 1];
            indices_[k] = arcs[k].second;
        }
        for (Index u = 0; u < n; ++u) {
            offsets_[static_cast<Size>(u) + 1] += offsets_[static_cast<Size>(u)];
        }
    }

    std::vector<std::string> node_ids_;
    std::unordered_map<std::string, Index> id_to_index_;
    std::vector<Index> offsets_;
    std::vector<Index> indices_;
};

} // namespace safe
