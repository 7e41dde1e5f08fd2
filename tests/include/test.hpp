#pragma once

// =============================================================================
// SMAT - Test Framework (Master Include)
// =============================================================================
//
// Components:
//   - core.hpp   : Test registration, runner, assertions
//   - guard.hpp  : RAII wrappers for C API handles
//   - oracle.hpp : Eigen dense reference for arithmetic results
//   - data.hpp   : Seeded random matrices and temporary directories
//
// Usage:
//   #include "test.hpp"
//
//   SMAT_TEST_BEGIN
//
//   SMAT_TEST_UNIT(sum_matches_dense) {
//       auto a = smat::test::random_sparse(8, 8, 0.2);
//       auto b = smat::test::random_sparse(8, 8, 0.2);
//       auto expected = smat::test::oracle::add(a, b);
//       SMAT_ASSERT_TRUE(smat::test::matches(smat::add(a, b), expected));
//   }
//
//   SMAT_TEST_END
//   SMAT_TEST_MAIN()
//
// =============================================================================

#include "core.hpp"
#include "guard.hpp"
#include "oracle.hpp"
#include "data.hpp"
