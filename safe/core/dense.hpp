#pragma once

#include "safe/core/type.hpp"
#include "safe/core/error.hpp"
#include "safe/core/graph.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// =============================================================================
/// @file dense.hpp
/// @brief Dense row-major matrices
///
/// - DenseArray<T>: non-owning row-major view (ptr, rows, cols)
/// - FeatureMatrix: owning sample x feature table keyed by sample id
// =============================================================================

namespace safe {

// =============================================================================
// DenseArray: Contiguous Row-Major View
// =============================================================================

/// @brief Dense row-major matrix view. Indexing: ptr[r * cols + c].
///
/// Ownership: Non-owning view (ptr must outlive this object)
template <typename T>
struct DenseArray {
    using ValueType = T;

    T* ptr;
    Index rows;
    Index cols;

    constexpr DenseArray() noexcept : ptr(nullptr), rows(0), cols(0) {}

    constexpr DenseArray(T* p, Index r, Index c) noexcept
        : ptr(p), rows(r), cols(c) {}

    SAFE_NODISCARD SAFE_FORCE_INLINE T& operator()(Index r, Index c) const {
#if !defined(NDEBUG)
        SAFE_ASSERT(r >= 0 && r < rows, "DenseArray: Row out of bounds");
        SAFE_ASSERT(c >= 0 && c < cols, "DenseArray: Col out of bounds");
#endif
        return ptr[r * cols + c];
    }

    SAFE_NODISCARD SAFE_FORCE_INLINE Array<T> row(Index r) const {
        return Array<T>(ptr + (r * cols), static_cast<Size>(cols));
    }

    /// @brief Get column (non-contiguous, requires copy).
    void col(Index c, std::remove_const_t<T>* output) const {
        for (Index r = 0; r < rows; ++r) {
            output[r] = ptr[r * cols + c];
        }
    }

    SAFE_NODISCARD constexpr Size size() const noexcept {
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }
};

using RealMatrix = DenseArray<Real>;

// =============================================================================
// FeatureMatrix: Owning Sample x Feature Table
// =============================================================================

/// @brief Sample-level feature values, one row per sample id.
///
/// Columns are continuous features or one-hot indicator columns. Sample ids
/// and feature names are unique within a matrix.
class FeatureMatrix {
public:
    FeatureMatrix() = default;

    /// @param values row-major, sample_ids.size() x feature_names.size()
    FeatureMatrix(
        std::vector<std::string> sample_ids,
        std::vector<std::string> feature_names,
        std::vector<Real> values
    )
        : sample_ids_(std::move(sample_ids))
        , feature_names_(std::move(feature_names))
        , values_(std::move(values))
    {
        SAFE_CHECK_DIM(values_.size() == sample_ids_.size() * feature_names_.size(),
            "FeatureMatrix: values size does not match samples x features");

        std::unordered_set<std::string> seen;
        for (const auto& name : feature_names_) {
            SAFE_CHECK_CONFIG(!name.empty(), "FeatureMatrix: empty feature name");
            SAFE_CHECK_CONFIG(seen.insert(name).second,
                "FeatureMatrix: duplicate feature name '" + name + "'");
        }
        seen.clear();
        for (const auto& id : sample_ids_) {
            SAFE_CHECK_GRAPH(seen.insert(id).second,
                "FeatureMatrix: duplicate sample id '" + id + "'");
        }
    }

    SAFE_FORCE_INLINE Index rows() const noexcept { return static_cast<Index>(sample_ids_.size()); }
    SAFE_FORCE_INLINE Index cols() const noexcept { return static_cast<Index>(feature_names_.size()); }

    SAFE_FORCE_INLINE Real operator()(Index r, Index c) const {
        return values_[static_cast<Size>(r * cols() + c)];
    }

    const std::vector<std::string>& sample_ids() const noexcept { return sample_ids_; }
    const std::vector<std::string>& feature_names() const noexcept { return feature_names_; }
    const std::string& feature_name(Index c) const { return feature_names_.at(static_cast<Size>(c)); }

    DenseArray<const Real> view() const noexcept {
        return DenseArray<const Real>(values_.data(), rows(), cols());
    }

    void copy_column(Index c, Array<Real> out) const {
        SAFE_CHECK_RANGE(c, Index(0), cols() - 1, "FeatureMatrix: column out of range");
        SAFE_CHECK_DIM(out.size() == static_cast<Size>(rows()), "FeatureMatrix: output size mismatch");
        view().col(c, out.data());
    }

    /// @brief Reorder rows to graph node order.
    ///
    /// Requires a strict 1:1 mapping between sample ids and node ids.
    /// @throws InvalidGraphError on a missing or extra sample.
    FeatureMatrix align_to(const Graph& graph) const {
        SAFE_CHECK_GRAPH(rows() == graph.num_nodes(),
            "FeatureMatrix: " + std::to_string(rows()) + " samples but graph has " +
            std::to_string(graph.num_nodes()) + " nodes");

        std::unordered_map<std::string, Index> row_of;
        row_of.reserve(sample_ids_.size());
        for (Index r = 0; r < rows(); ++r) {
            row_of.emplace(sample_ids_[static_cast<Size>(r)], r);
        }

        const Index n_cols = cols();
        std::vector<Real> aligned(values_.size());
        for (Index u = 0; u < graph.num_nodes(); ++u) {
            const auto& id = graph.node_ids()[static_cast<Size>(u)];
            auto it = row_of.find(id);
            SAFE_CHECK_GRAPH(it != row_of.end(), "FeatureMatrix: node '" + id + "' has no sample row");
            std::copy_n(values_.begin() + it->second * n_cols, n_cols,
                        aligned.begin() + u * n_cols);
        }

        return FeatureMatrix(graph.node_ids(), feature_names_, std::move(aligned));
    }

    /// @brief Expand a categorical column into indicator features.
    ///
    /// Feature names are "prefix=label" with labels in sorted order.
    static FeatureMatrix one_hot_encode(
        std::vector<std::string> sample_ids,
        const std::vector<std::string>& labels,
        const std::string& prefix
    ) {
        SAFE_CHECK_DIM(sample_ids.size() == labels.size(),
            "one_hot_encode: sample ids and labels differ in length");

        std::vector<std::string> levels(labels.begin(), labels.end());
        std::sort(levels.begin(), levels.end());
        levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

        std::unordered_map<std::string, Size> level_of;
        std::vector<std::string> names;
        names.reserve(levels.size());
        for (Size k = 0; k < levels.size(); ++k) {
            level_of.emplace(levels[k], k);
            names.push_back(prefix + "=" + levels[k]);
        }

        std::vector<Real> values(sample_ids.size() * levels.size(), Real(0));
        for (Size r = 0; r < labels.size(); ++r) {
            values[r * levels.size() + level_of[labels[r]]] = Real(1);
        }

        return FeatureMatrix(std::move(sample_ids), std::move(names), std::move(values));
    }

private:
    std::vector<std::string> sample_ids_;
    std::vector<std::string> feature_names_;
    std::vector<Real> values_;
};

} // namespace safe
