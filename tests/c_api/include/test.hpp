#pragma once

// =============================================================================
// SAFE Tests - Master Include
// =============================================================================
//
// Single include for all test utilities.
//
// Components:
//   - core.hpp      : Test registration, runner, assertions
//   - guard.hpp     : RAII wrappers for C API handles
//   - precision.hpp : Tolerance-based comparison
//   - oracle.hpp    : Eigen reference implementations
//   - data.hpp      : Structured networks and feature tables
//
// Usage:
//   #include "test.hpp"
//
//   SAFE_TEST_BEGIN
//
//   SAFE_TEST_UNIT(ring_neighborhoods) {
//       auto graph = safe::test::ring_graph(6);
//       auto map = safe::kernel::neighborhood::build(*graph, 1);
//       SAFE_REQUIRE_EQ(map.size_of(0), 3);
//   }
//
//   SAFE_TEST_END
//   SAFE_TEST_MAIN()
//
// =============================================================================

// Core testing framework
#include "core.hpp"

// RAII guards for C API handles
#include "guard.hpp"

// Numerical comparison
#include "precision.hpp"

// Eigen reference implementation
#include "oracle.hpp"

// Test data generators
#include "data.hpp"
