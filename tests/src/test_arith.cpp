// =============================================================================
// SMAT - Arithmetic Kernel Tests
// =============================================================================
//
// Tests smat/kernel/arith.hpp against the Eigen dense oracle:
//   - add / subtract / multiply results and shapes
//   - Shape validation
//   - Overflow policies
//   - Parallel multiply path
//
// =============================================================================

#include "test.hpp"

#include "smat/kernel/arith.hpp"
#include "smat/threading/scheduler.hpp"
#include "smat/io/text.hpp"
#include "smat/core/error.hpp"

#include <cstddef>
#include <limits>
#include <string>

using namespace smat;
using namespace smat::test;
using namespace smat::kernel::arith;

namespace {

constexpr Value VMAX = std::numeric_limits<Value>::max();
constexpr Value VMIN = std::numeric_limits<Value>::min();

ArithOptions with(OverflowPolicy policy) {
    ArithOptions opts;
    opts.overflow = policy;
    return opts;
}

SparseMatrix diag_5_3() {
    return io::parse("rows=2\ncols=2\n(0,0,5)\n(1,1,3)");
}

} // namespace

SMAT_TEST_BEGIN

// =============================================================================
// Reference Scenarios
// =============================================================================

SMAT_TEST_SUITE(scenarios)

SMAT_TEST_CASE(add_to_itself_doubles) {
    const auto m = diag_5_3();
    const auto r = add(m, m);
    SMAT_ASSERT_EQ(r.nnz(), Size(2));
    SMAT_ASSERT_EQ(r.get(0, 0), Value(10));
    SMAT_ASSERT_EQ(r.get(1, 1), Value(6));
    SMAT_ASSERT_STR_EQ("rows=2\ncols=2\n(0, 0, 10)\n(1, 1, 6)\n", io::serialize(r));
}

SMAT_TEST_CASE(subtract_itself_is_empty) {
    const auto m = diag_5_3();
    const auto r = subtract(m, m);
    SMAT_ASSERT_TRUE(r.empty());
    SMAT_ASSERT_EQ(r.rows(), Index(2));
    SMAT_ASSERT_EQ(r.cols(), Index(2));
}

SMAT_TEST_CASE(identity_times_b_is_b) {
    const auto eye = io::parse("rows=2\ncols=2\n(0,0,1)\n(1,1,1)");
    for (int trial = 0; trial < 4; ++trial) {
        const auto b = random_sparse(2, 2, 0.6);
        SMAT_ASSERT_TRUE(multiply(eye, b) == b);
    }
}

SMAT_TEST_CASE(multiply_shape_mismatch) {
    SMAT_ASSERT_THROWS(multiply(SparseMatrix(2, 3), SparseMatrix(2, 2)), DimensionMismatchError);
}

SMAT_TEST_SUITE_END

// =============================================================================
// Oracle Comparison
// =============================================================================

SMAT_TEST_SUITE(oracle_checks)

SMAT_TEST_CASE(add_matches_dense) {
    Random rng(101);
    for (int trial = 0; trial < 6; ++trial) {
        auto [rows, cols] = random_shape(1, 30, rng);
        const auto a = random_sparse(rows, cols, 0.2, 50, rng);
        const auto b = random_sparse(rows, cols, 0.2, 50, rng);
        SMAT_ASSERT_TRUE(matches(add(a, b), oracle::add(a, b)));
    }
}

SMAT_TEST_CASE(subtract_matches_dense) {
    Random rng(202);
    for (int trial = 0; trial < 6; ++trial) {
        auto [rows, cols] = random_shape(1, 30, rng);
        const auto a = random_sparse(rows, cols, 0.2, 50, rng);
        const auto b = random_sparse(rows, cols, 0.2, 50, rng);
        SMAT_ASSERT_TRUE(matches(subtract(a, b), oracle::subtract(a, b)));
    }
}

SMAT_TEST_CASE(multiply_matches_dense) {
    Random rng(303);
    for (int trial = 0; trial < 6; ++trial) {
        const Index n = rng.uniform_int(1, 25);
        const Index k = rng.uniform_int(1, 25);
        const Index p = rng.uniform_int(1, 25);
        const auto a = random_sparse(n, k, 0.25, 20, rng);
        const auto b = random_sparse(k, p, 0.25, 20, rng);
        const auto r = multiply(a, b);
        SMAT_ASSERT_EQ(r.rows(), n);
        SMAT_ASSERT_EQ(r.cols(), p);
        SMAT_ASSERT_TRUE(matches(r, oracle::multiply(a, b)));
    }
}

SMAT_TEST_CASE(operands_unchanged) {
    const auto a = random_sparse(10, 10, 0.3);
    const auto b = random_sparse(10, 10, 0.3);
    const SparseMatrix a0 = a;
    const SparseMatrix b0 = b;
    (void)add(a, b);
    (void)subtract(a, b);
    (void)multiply(a, b);
    SMAT_ASSERT_TRUE(a == a0);
    SMAT_ASSERT_TRUE(b == b0);
}

SMAT_TEST_SUITE_END

// =============================================================================
// Sparsity and Edge Shapes
// =============================================================================

SMAT_TEST_SUITE(edges)

SMAT_TEST_CASE(add_cancellation_not_stored) {
    SparseMatrix a(2, 2);
    SparseMatrix b(2, 2);
    a.set(0, 0, 5);
    b.set(0, 0, -5);
    b.set(1, 0, 2);
    const auto r = add(a, b);
    SMAT_ASSERT_FALSE(r.contains(0, 0));
    SMAT_ASSERT_EQ(r.nnz(), Size(1));
    SMAT_ASSERT_EQ(r.get(1, 0), Value(2));
}

SMAT_TEST_CASE(subtract_one_sided_entries) {
    SparseMatrix a(1, 3);
    SparseMatrix b(1, 3);
    a.set(0, 0, 4);
    b.set(0, 2, 6);
    const auto r = subtract(a, b);
    SMAT_ASSERT_EQ(r.get(0, 0), Value(4));
    SMAT_ASSERT_EQ(r.get(0, 2), Value(-6));
}

SMAT_TEST_CASE(multiply_cancellation_not_stored) {
    const auto a = io::parse("rows=1\ncols=2\n(0,0,1)\n(0,1,1)");
    const auto b = io::parse("rows=2\ncols=1\n(0,0,1)\n(1,0,-1)");
    const auto r = multiply(a, b);
    SMAT_ASSERT_EQ(r.rows(), Index(1));
    SMAT_ASSERT_EQ(r.cols(), Index(1));
    SMAT_ASSERT_TRUE(r.empty());
}

SMAT_TEST_CASE(zero_inner_dimension) {
    const auto r = multiply(SparseMatrix(3, 0), SparseMatrix(0, 4));
    SMAT_ASSERT_EQ(r.rows(), Index(3));
    SMAT_ASSERT_EQ(r.cols(), Index(4));
    SMAT_ASSERT_TRUE(r.empty());
}

SMAT_TEST_CASE(empty_operands) {
    const auto a = random_sparse(4, 5, 0.5);
    SMAT_ASSERT_TRUE(add(a, SparseMatrix(4, 5)) == a);
    SMAT_ASSERT_TRUE(multiply(a, SparseMatrix(5, 2)).empty());
    SMAT_ASSERT_TRUE(multiply(SparseMatrix(3, 4), a).empty());
}

SMAT_TEST_CASE(add_shape_mismatch_message) {
    try {
        (void)add(SparseMatrix(2, 2), SparseMatrix(2, 3));
        SMAT_FAIL("mismatched add accepted");
    } catch (const DimensionError& e) {
        SMAT_ASSERT_STR_CONTAINS(e.what(), "do not match for addition");
        SMAT_ASSERT_STR_CONTAINS(e.what(), "2x2 vs 2x3");
    }
    SMAT_ASSERT_THROWS(subtract(SparseMatrix(3, 2), SparseMatrix(2, 2)), DimensionError);
}

SMAT_TEST_CASE(multiply_mismatch_message) {
    try {
        (void)multiply(SparseMatrix(2, 3), SparseMatrix(2, 2));
        SMAT_FAIL("mismatched multiply accepted");
    } catch (const DimensionError& e) {
        SMAT_ASSERT_STR_CONTAINS(e.what(), "not compatible for multiplication");
        SMAT_ASSERT_STR_CONTAINS(e.what(), "3 != 2");
    }
}

SMAT_TEST_SUITE_END

// =============================================================================
// Overflow Policies
// =============================================================================

SMAT_TEST_SUITE(overflow)

SMAT_TEST_CASE(add_reject_names_cell) {
    SparseMatrix a(2, 2);
    SparseMatrix b(2, 2);
    a.set(1, 0, VMAX);
    b.set(1, 0, 1);
    try {
        (void)add(a, b);
        SMAT_FAIL("overflowing add accepted");
    } catch (const OverflowError& e) {
        SMAT_ASSERT_STR_CONTAINS(e.what(), "addition");
        SMAT_ASSERT_STR_CONTAINS(e.what(), "(1, 0)");
    }
}

SMAT_TEST_CASE(add_saturate_and_wrap) {
    SparseMatrix a(1, 1);
    SparseMatrix b(1, 1);
    a.set(0, 0, VMAX);
    b.set(0, 0, 1);
    SMAT_ASSERT_EQ(add(a, b, with(OverflowPolicy::Saturate)).get(0, 0), VMAX);
    SMAT_ASSERT_EQ(add(a, b, with(OverflowPolicy::Wrap)).get(0, 0), VMIN);
}

SMAT_TEST_CASE(subtract_absent_minus_min) {
    SparseMatrix a(1, 1);
    SparseMatrix b(1, 1);
    b.set(0, 0, VMIN);
    SMAT_ASSERT_THROWS(subtract(a, b), OverflowError);
    SMAT_ASSERT_EQ(subtract(a, b, with(OverflowPolicy::Saturate)).get(0, 0), VMAX);
}

SMAT_TEST_CASE(multiply_product_overflow) {
    SparseMatrix a(1, 1);
    SparseMatrix b(1, 1);
    a.set(0, 0, VMAX);
    b.set(0, 0, 2);
    SMAT_ASSERT_THROWS(multiply(a, b), OverflowError);
    SMAT_ASSERT_EQ(multiply(a, b, with(OverflowPolicy::Saturate)).get(0, 0), VMAX);
    SMAT_ASSERT_EQ(multiply(a, b, with(OverflowPolicy::Wrap)).get(0, 0), Value(-2));
}

SMAT_TEST_CASE(multiply_running_sum_in_inner_order) {
    // Contributions arrive as VMAX, +1, -1
    SparseMatrix a(1, 3);
    SparseMatrix b(3, 1);
    a.set(0, 0, VMAX);
    a.set(0, 1, 1);
    a.set(0, 2, -1);
    b.set(0, 0, 1);
    b.set(1, 0, 1);
    b.set(2, 0, 1);
    SMAT_ASSERT_THROWS(multiply(a, b), OverflowError);
    SMAT_ASSERT_EQ(multiply(a, b, with(OverflowPolicy::Saturate)).get(0, 0), VMAX - 1);
    SMAT_ASSERT_EQ(multiply(a, b, with(OverflowPolicy::Wrap)).get(0, 0), VMAX);
}

SMAT_TEST_SUITE_END

// =============================================================================
// Parallel Multiply
// =============================================================================

SMAT_TEST_SUITE(parallel)

SMAT_TEST_CASE(large_product_matches_dense) {
    Random rng(404);
    const auto a = random_sparse(300, 60, 0.08, 20, rng);
    const auto b = random_sparse(60, 40, 0.1, 20, rng);
    SMAT_ASSERT_TRUE(matches(multiply(a, b), oracle::multiply(a, b)));
}

SMAT_TEST_CASE(result_independent_of_thread_count) {
    Random rng(505);
    const auto a = random_sparse(256, 64, 0.1, 30, rng);
    const auto b = random_sparse(64, 64, 0.1, 30, rng);

    threading::Scheduler::set_num_threads(1);
    const auto serial = multiply(a, b);
    threading::Scheduler::set_num_threads(4);
    const auto parallel = multiply(a, b);
    threading::Scheduler::set_num_threads(0);

    SMAT_ASSERT_TRUE(serial == parallel);
}

SMAT_TEST_CASE(worker_count_follows_requests) {
    using threading::Scheduler;
    const bool serial = std::string(Scheduler::backend_name()) == "serial";

    Scheduler::set_num_threads(1);
    SMAT_ASSERT_EQ(Scheduler::get_num_threads(), std::size_t(1));

    Scheduler::set_num_threads(3);
    SMAT_ASSERT_EQ(Scheduler::get_num_threads(), serial ? std::size_t(1) : std::size_t(3));

    Scheduler::set_num_threads(Scheduler::MAX_WORKERS * 4);
    SMAT_ASSERT_LE(Scheduler::get_num_threads(), Scheduler::MAX_WORKERS);

    Scheduler::set_num_threads(0);
    SMAT_ASSERT_GT(Scheduler::get_num_threads(), std::size_t(0));
    SMAT_ASSERT_LE(Scheduler::get_num_threads(),
                   serial ? std::size_t(1) : Scheduler::hardware_concurrency());
}

SMAT_TEST_CASE(first_failing_row_is_reported) {
    const Index n = 200;
    SparseMatrix a(n, 2);
    for (Index i = 0; i < n; ++i) {
        a.set(i, 0, 1);
    }
    a.set(150, 0, VMAX);
    a.set(150, 1, 1);
    a.set(170, 0, VMAX);
    a.set(170, 1, 1);
    const auto b = io::parse("rows=2\ncols=1\n(0,0,1)\n(1,0,1)");

    try {
        (void)multiply(a, b);
        SMAT_FAIL("overflowing multiply accepted");
    } catch (const OverflowError& e) {
        SMAT_ASSERT_STR_CONTAINS(e.what(), "(150, 0)");
    }
}

SMAT_TEST_SUITE_END

SMAT_TEST_END

SMAT_TEST_MAIN()
