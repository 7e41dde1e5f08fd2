// =============================================================================
// FILE: smat/kernel/arith.h
// BRIEF: API reference for sparse matrix arithmetic kernels
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "smat/core/type.hpp"
#include "smat/core/sparse.hpp"
#include "smat/core/checked.hpp"

namespace smat::kernel::arith {

/* -----------------------------------------------------------------------------
 * STRUCT: ArithOptions
 * -----------------------------------------------------------------------------
 * FIELDS:
 *     overflow  Policy applied when an intermediate result leaves the Value
 *               range. Reject (default) throws OverflowError, Saturate clamps,
 *               Wrap keeps the two's complement result.
 * -------------------------------------------------------------------------- */
struct ArithOptions;

/* -----------------------------------------------------------------------------
 * FUNCTION: add
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Element-wise sum of two matrices of identical shape.
 *
 * PARAMETERS:
 *     a     [in]  Left operand
 *     b     [in]  Right operand
 *     opts  [in]  Overflow policy
 *
 * PRECONDITIONS:
 *     - a.rows() == b.rows() and a.cols() == b.cols()
 *
 * POSTCONDITIONS:
 *     - Result shape equals the operand shape
 *     - result.get(r, c) == a.get(r, c) + b.get(r, c) for every cell
 *     - No stored entry is zero (cancelled cells are absent)
 *     - Operands are unchanged
 *
 * ALGORITHM:
 *     Merge the two row-major entry sequences; cells present in only one
 *     operand are copied, cells present in both are summed.
 *
 * COMPLEXITY:
 *     Time:  O((nnz(a) + nnz(b)) log nnz(result))
 *     Space: O(nnz(result))
 *
 * THROWS:
 *     DimensionError - shapes differ
 *     OverflowError  - a sum overflows under OverflowPolicy::Reject
 * -------------------------------------------------------------------------- */
SparseMatrix add(
    const SparseMatrix& a,           // Left operand
    const SparseMatrix& b,           // Right operand
    const ArithOptions& opts = {}    // Overflow policy
);

/* -----------------------------------------------------------------------------
 * FUNCTION: subtract
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Element-wise difference a - b of two matrices of identical shape.
 *
 * PRECONDITIONS / POSTCONDITIONS / COMPLEXITY:
 *     As add, with result.get(r, c) == a.get(r, c) - b.get(r, c).
 *     subtract(m, m) is an empty matrix of m's shape.
 *
 * THROWS:
 *     DimensionError - shapes differ
 *     OverflowError  - a difference overflows under OverflowPolicy::Reject
 * -------------------------------------------------------------------------- */
SparseMatrix subtract(
    const SparseMatrix& a,           // Minuend
    const SparseMatrix& b,           // Subtrahend
    const ArithOptions& opts = {}    // Overflow policy
);

/* -----------------------------------------------------------------------------
 * FUNCTION: multiply
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Matrix product a * b.
 *
 * PRECONDITIONS:
 *     - a.cols() == b.rows()
 *
 * POSTCONDITIONS:
 *     - Result shape is a.rows() x b.cols()
 *     - result.get(i, j) == sum_k a.get(i, k) * b.get(k, j)
 *     - No stored entry is zero
 *
 * ALGORITHM:
 *     1. Compress both operands into non-empty-row arrays
 *     2. For each non-empty row i of a (parallel above
 *        config::PARALLEL_ROW_THRESHOLD rows):
 *        for each (k, a_ik) in row i, for each (j, b_kj) in row k of b,
 *        acc[j] += a_ik * b_kj
 *     3. Rethrow the first row error, in row order
 *     4. Append the non-zero accumulators row by row
 *
 * COMPLEXITY:
 *     Time:  O(nnz(a) log rows(b) + flops log nnz(row))
 *     Space: O(nnz(a) + nnz(b) + nnz(result))
 *
 * THREAD SAFETY:
 *     Safe - every worker writes only its own result row slot
 *
 * THROWS:
 *     DimensionError - inner dimensions differ
 *     OverflowError  - a product or running sum overflows under
 *                      OverflowPolicy::Reject
 * -------------------------------------------------------------------------- */
SparseMatrix multiply(
    const SparseMatrix& a,           // Left operand
    const SparseMatrix& b,           // Right operand
    const ArithOptions& opts = {}    // Overflow policy
);

} // namespace smat::kernel::arith
