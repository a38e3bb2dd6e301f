#pragma once

// =============================================================================
// FILE: safe/binding/c_api/core/internal.hpp
// BRIEF: Internal C++ side of the C ABI handles
// =============================================================================
//
// Internal to the binding layer; not part of the public API.
// =============================================================================

#include "safe/binding/c_api/core/core.h"
#include "safe/core/error.hpp"
#include "safe/core/type.hpp"
#include "safe/core/graph.hpp"
#include "safe/core/dense.hpp"
#include "safe/kernel/neighborhood.hpp"
#include "safe/kernel/analysis.hpp"
#include "safe/threading/cancellation.hpp"

#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

namespace safe::binding {

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

void set_last_error(safe_error_t code, const char* message) noexcept;

void set_last_error(safe_error_t code, std::string_view message) noexcept;

void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;

[[nodiscard]] auto get_last_error_code() noexcept -> safe_error_t;

// =============================================================================
// Exception Handling
// =============================================================================

// Convert the active exception to an error code and record its message.
// Must be called from within a catch block.
[[nodiscard]] auto handle_exception() noexcept -> safe_error_t;

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SAFE_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (SAFE_UNLIKELY((ptr) == nullptr)) { \
            safe::binding::set_last_error(SAFE_ERROR_NULL_POINTER, (msg)); \
            return SAFE_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define SAFE_C_API_CHECK(cond, code, msg) \
    do { \
        if (SAFE_UNLIKELY(!(cond))) { \
            safe::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define SAFE_C_API_TRY try {

#define SAFE_C_API_CATCH \
    } catch (...) { \
        return safe::binding::handle_exception(); \
    }

#define SAFE_C_API_RETURN_OK \
    do { \
        safe::binding::clear_last_error(); \
        return SAFE_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

// =============================================================================
// Wrappers
// =============================================================================

/// Graph plus its neighborhood cache, shared by every run on the graph
struct GraphWrapper {
    std::shared_ptr<const Graph> graph;
    std::unique_ptr<kernel::neighborhood::NeighborhoodIndex> index;

    explicit GraphWrapper(Graph&& g)
        : graph(std::make_shared<const Graph>(std::move(g)))
        , index(std::make_unique<kernel::neighborhood::NeighborhoodIndex>(graph)) {}
};

struct FeaturesWrapper {
    FeatureMatrix matrix;

    explicit FeaturesWrapper(FeatureMatrix&& m) : matrix(std::move(m)) {}
};

struct ConfigWrapper {
    kernel::analysis::AnalysisConfig config;
};

struct ResultWrapper {
    kernel::analysis::AnalysisResult result;

    explicit ResultWrapper(kernel::analysis::AnalysisResult&& r) : result(std::move(r)) {}
};

struct CancelWrapper {
    threading::CancellationToken token;
};

} // namespace safe::binding

// =============================================================================
// Opaque Handle Definitions
// =============================================================================

struct safe_graph : safe::binding::GraphWrapper {
    using GraphWrapper::GraphWrapper;
};

struct safe_features : safe::binding::FeaturesWrapper {
    using FeaturesWrapper::FeaturesWrapper;
};

struct safe_config : safe::binding::ConfigWrapper {};

struct safe_result : safe::binding::ResultWrapper {
    using ResultWrapper::ResultWrapper;
};

struct safe_cancel : safe::binding::CancelWrapper {};

static_assert(std::is_same_v<safe_real_t, safe::Real>,
              "safe_real_t must match safe::Real (SAFE_PRECISION)");
static_assert(std::is_same_v<safe_index_t, safe::Index>,
              "safe_index_t must match safe::Index (SAFE_INDEX_PRECISION)");
static_assert(std::is_base_of_v<safe::binding::GraphWrapper, safe_graph>,
              "safe_graph must inherit from GraphWrapper");
static_assert(std::is_base_of_v<safe::binding::ResultWrapper, safe_result>,
              "safe_result must inherit from ResultWrapper");
