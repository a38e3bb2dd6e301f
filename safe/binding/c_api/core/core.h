#pragma once

// =============================================================================
// FILE: safe/binding/c_api/core/core.h
// BRIEF: C ABI for the SAFE enrichment engine
// =============================================================================
//
// DESIGN PRINCIPLES:
//   - Stable C ABI for Python FFI and cross-language bindings
//   - Opaque handles, created and destroyed through safe_*_create/destroy
//   - Every function returns safe_error_t; details via safe_get_last_error()
//   - Error state is thread-local
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define SAFE_C_API_VERSION_MAJOR 1
#define SAFE_C_API_VERSION_MINOR 0
#define SAFE_C_API_VERSION_PATCH 0

#if defined(_MSC_VER)
    #define SAFE_C_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define SAFE_C_EXPORT __attribute__((visibility("default")))
#else
    #define SAFE_C_EXPORT
#endif

// Runtime version string (e.g. "1.0.0")
const char* safe_get_version(void);

// Build configuration (e.g. "float64+int64+openmp")
const char* safe_get_build_config(void);

// =============================================================================
// Basic Value Types (must match safe::Real and safe::Index)
// =============================================================================

#if defined(SAFE_USE_FLOAT32)
typedef float safe_real_t;
#define SAFE_REAL_TYPE_NAME "float32"
#else
typedef double safe_real_t;
#define SAFE_REAL_TYPE_NAME "float64"
#endif

#if defined(SAFE_USE_INT32)
typedef int32_t safe_index_t;
#define SAFE_INDEX_TYPE_NAME "int32"
#else
typedef int64_t safe_index_t;
#define SAFE_INDEX_TYPE_NAME "int64"
#endif

typedef size_t safe_size_t;

typedef int safe_bool_t;
#define SAFE_TRUE 1
#define SAFE_FALSE 0

// =============================================================================
// Error Handling
// =============================================================================

// Error codes (stable across versions, match safe::ErrorCode)
typedef int32_t safe_error_t;

#define SAFE_OK 0

// General errors (1-9)
#define SAFE_ERROR_UNKNOWN 1
#define SAFE_ERROR_INTERNAL 2
#define SAFE_ERROR_OUT_OF_MEMORY 3
#define SAFE_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define SAFE_ERROR_INVALID_ARGUMENT 10
#define SAFE_ERROR_DIMENSION_MISMATCH 11
#define SAFE_ERROR_DOMAIN_ERROR 12
#define SAFE_ERROR_RANGE_ERROR 13
#define SAFE_ERROR_INDEX_OUT_OF_BOUNDS 14

// I/O errors (30-39)
#define SAFE_ERROR_IO_ERROR 30
#define SAFE_ERROR_FILE_NOT_FOUND 31
#define SAFE_ERROR_WRITE_ERROR 34

// Feature errors (40-49)
#define SAFE_ERROR_FEATURE_UNAVAILABLE 41

// Numerical errors (50-59)
#define SAFE_ERROR_NUMERICAL_ERROR 50
#define SAFE_ERROR_CONVERGENCE_ERROR 54

// Analysis errors (60-69)
#define SAFE_ERROR_INVALID_GRAPH 60
#define SAFE_ERROR_DEGENERATE_FEATURE 61
#define SAFE_ERROR_INSUFFICIENT_RANK 62
#define SAFE_ERROR_CONFIGURATION 63
#define SAFE_ERROR_CANCELLED 64

// Message of the last error on this thread, "No error" if none
const char* safe_get_last_error(void);

// Code of the last error on this thread, SAFE_OK if none
safe_error_t safe_get_last_error_code(void);

void safe_clear_error(void);

safe_bool_t safe_is_ok(safe_error_t code);

safe_bool_t safe_is_error(safe_error_t code);

// Worker pool size; 0 selects the hardware concurrency
safe_error_t safe_set_num_threads(safe_size_t n);

safe_size_t safe_get_num_threads(void);

#ifdef __cplusplus
}
#endif
