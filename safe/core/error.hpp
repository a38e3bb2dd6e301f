#pragma once

#include "safe/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: safe/core/error.hpp
// BRIEF: SAFE Core Exception System
// =============================================================================

namespace safe {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    DOMAIN_ERROR = 12,
    RANGE_ERROR = 13,
    INDEX_OUT_OF_BOUNDS = 14,

    // I/O errors
    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    WRITE_ERROR = 34,

    // Feature errors
    FEATURE_UNAVAILABLE = 41,

    // Numerical errors
    NUMERICAL_ERROR = 50,
    CONVERGENCE_ERROR = 54,

    // Analysis errors
    INVALID_GRAPH = 60,
    DEGENERATE_FEATURE = 61,
    INSUFFICIENT_RANK = 62,
    CONFIGURATION_ERROR = 63,
    CANCELLED = 64,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class SAFE_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class OutOfMemoryError : public RuntimeError {
public:
    explicit OutOfMemoryError(const std::string& msg = "Out of memory")
        : RuntimeError(ErrorCode::OUT_OF_MEMORY, msg) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(const std::string& msg = "Null pointer encountered")
        : RuntimeError(ErrorCode::NULL_POINTER, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal SAFE Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg)
        : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    explicit IOError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "File not found: " + path) {}
};

class WriteError : public IOError {
public:
    explicit WriteError(const std::string& msg)
        : IOError(ErrorCode::WRITE_ERROR, msg) {}
};

// Optional component (e.g. HDF5 export) not compiled in
class FeatureUnavailableError : public RuntimeError {
public:
    explicit FeatureUnavailableError(const std::string& msg)
        : RuntimeError(ErrorCode::FEATURE_UNAVAILABLE, msg) {}
};

// =============================================================================
// Numerical Errors
// =============================================================================

class NumericalError : public Exception {
public:
    explicit NumericalError(const std::string& msg)
        : Exception(ErrorCode::NUMERICAL_ERROR, msg) {}

protected:
    explicit NumericalError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class ConvergenceError : public NumericalError {
public:
    explicit ConvergenceError(const std::string& msg = "Algorithm did not converge")
        : NumericalError(ErrorCode::CONVERGENCE_ERROR, msg) {}
};

// =============================================================================
// Analysis Errors
// =============================================================================

// Malformed graph or node/sample mismatch. Aborts a run before any scoring.
class InvalidGraphError : public ValueError {
public:
    explicit InvalidGraphError(const std::string& msg)
        : ValueError(ErrorCode::INVALID_GRAPH, msg) {}
};

// Feature with fewer than two distinct finite values. Recovered per feature.
class DegenerateFeatureError : public ValueError {
public:
    explicit DegenerateFeatureError(const std::string& msg)
        : ValueError(ErrorCode::DEGENERATE_FEATURE, msg) {}
};

// Too few entities for the requested number of ordination axes.
class InsufficientRankError : public NumericalError {
public:
    explicit InsufficientRankError(const std::string& msg)
        : NumericalError(ErrorCode::INSUFFICIENT_RANK, msg) {}
};

class ConfigurationError : public ValueError {
public:
    explicit ConfigurationError(const std::string& msg)
        : ValueError(ErrorCode::CONFIGURATION_ERROR, msg) {}
};

class CancelledError : public RuntimeError {
public:
    explicit CancelledError(const std::string& msg = "Run cancelled")
        : RuntimeError(ErrorCode::CANCELLED, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Assertion for internal invariants (active in all builds)
#define SAFE_ASSERT(condition, msg) \
    do { \
        if (SAFE_UNLIKELY(!(condition))) { \
            throw safe::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

#define SAFE_CHECK_ARG(condition, msg) \
    do { \
        if (SAFE_UNLIKELY(!(condition))) { \
            throw safe::ValueError(msg); \
        } \
    } while(0)

#define SAFE_CHECK_DIM(condition, msg) \
    do { \
        if (SAFE_UNLIKELY(!(condition))) { \
            throw safe::DimensionError(msg); \
        } \
    } while(0)

#define SAFE_CHECK_NULL(ptr, msg) \
    do { \
        if (SAFE_UNLIKELY((ptr) == nullptr)) { \
            throw safe::NullPointerError(msg); \
        } \
    } while(0)

#define SAFE_CHECK_RANGE(value, min_val, max_val, msg) \
    do { \
        if (SAFE_UNLIKELY((value) < (min_val) || (value) > (max_val))) { \
            throw safe::RangeError(msg); \
        } \
    } while(0)

#define SAFE_CHECK_CONFIG(condition, msg) \
    do { \
        if (SAFE_UNLIKELY(!(condition))) { \
            throw safe::ConfigurationError(msg); \
        } \
    } while(0)

#define SAFE_CHECK_GRAPH(condition, msg) \
    do { \
        if (SAFE_UNLIKELY(!(condition))) { \
            throw safe::InvalidGraphError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace safe
