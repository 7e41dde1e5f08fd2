#pragma once

#include "smat/config.hpp"
#include "smat/core/type.hpp"
#include "smat/core/sparse.hpp"
#include "smat/core/error.hpp"
#include "smat/core/checked.hpp"
#include "smat/core/macros.hpp"
#include "smat/threading/parallel_for.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: smat/kernel/arith.hpp
// BRIEF: Element-wise add/subtract and matrix product on SparseMatrix
// =============================================================================

namespace smat::kernel::arith {

struct ArithOptions {
    OverflowPolicy overflow = OverflowPolicy::Reject;
};

// =============================================================================
// Internal Helpers
// =============================================================================

namespace detail {

// Doubly compressed rows: only non-empty rows are materialized
struct RowCompressed {
    std::vector<Index> row_ids;     // ascending
    std::vector<Size>  row_ptr;     // size = row_ids.size() + 1
    std::vector<Index> col_ind;     // size = nnz
    std::vector<Value> values;      // size = nnz

    static RowCompressed from(const SparseMatrix& m) {
        RowCompressed rc;
        rc.col_ind.reserve(m.nnz());
        rc.values.reserve(m.nnz());
        rc.row_ptr.push_back(0);

        for (const auto& [coord, value] : m) {
            if (rc.row_ids.empty() || rc.row_ids.back() != coord.row) {
                if (!rc.row_ids.empty()) {
                    rc.row_ptr.push_back(rc.col_ind.size());
                }
                rc.row_ids.push_back(coord.row);
            }
            rc.col_ind.push_back(coord.col);
            rc.values.push_back(value);
        }
        if (!rc.row_ids.empty()) {
            rc.row_ptr.push_back(rc.col_ind.size());
        }
        return rc;
    }

    [[nodiscard]] Size row_count() const noexcept { return row_ids.size(); }

    // Slot of `row` in row_ids, or -1 when the row is empty
    [[nodiscard]] Index find_row(Index row) const noexcept {
        auto it = std::lower_bound(row_ids.begin(), row_ids.end(), row);
        if (it == row_ids.end() || *it != row) {
            return -1;
        }
        return static_cast<Index>(it - row_ids.begin());
    }
};

[[noreturn]] inline void throw_overflow(const char* op, Index row, Index col) {
    throw OverflowError(std::string("Integer overflow in ") + op + " at (" +
                        std::to_string(row) + ", " + std::to_string(col) + ")");
}

// Two-way merge over the row-major key order of both operands
template <bool Subtract>
SparseMatrix merge_elementwise(const SparseMatrix& a, const SparseMatrix& b,
                               const ArithOptions& opts) {
    const char* op = Subtract ? "subtraction" : "addition";

    SMAT_CHECK_DIM(a.rows() == b.rows() && a.cols() == b.cols(),
        std::string("Matrix dimensions do not match for ") + op + ": " +
        a.shape_string() + " vs " + b.shape_string());

    SparseMatrix result(a.rows(), a.cols());

    auto ia = a.begin();
    auto ib = b.begin();
    const auto ea = a.end();
    const auto eb = b.end();

    while (ia != ea || ib != eb) {
        Coordinate key{};
        Value lhs = 0;
        Value rhs = 0;

        if (ib == eb || (ia != ea && ia->first < ib->first)) {
            key = ia->first;
            lhs = ia->second;
            ++ia;
        } else if (ia == ea || ib->first < ia->first) {
            key = ib->first;
            rhs = ib->second;
            ++ib;
        } else {
            key = ia->first;
            lhs = ia->second;
            rhs = ib->second;
            ++ia;
            ++ib;
        }

        Value out = 0;
        const bool ok = Subtract ? checked::sub(lhs, rhs, opts.overflow, out)
                                 : checked::add(lhs, rhs, opts.overflow, out);
        if (SMAT_UNLIKELY(!ok)) {
            throw_overflow(op, key.row, key.col);
        }
        result.append_ordered(key.row, key.col, out);
    }

    return result;
}

} // namespace detail

// =============================================================================
// Public Operations
// =============================================================================

/// @brief A + B
/// @throws DimensionError if shapes differ
/// @throws OverflowError under OverflowPolicy::Reject
inline SparseMatrix add(const SparseMatrix& a, const SparseMatrix& b,
                        const ArithOptions& opts = {}) {
    return detail::merge_elementwise<false>(a, b, opts);
}

/// @brief A - B
/// @throws DimensionError if shapes differ
/// @throws OverflowError under OverflowPolicy::Reject
inline SparseMatrix subtract(const SparseMatrix& a, const SparseMatrix& b,
                             const ArithOptions& opts = {}) {
    return detail::merge_elementwise<true>(a, b, opts);
}

/// @brief A * B by row-wise (Gustavson) accumulation
///
/// Contributions to a result cell arrive in ascending inner index, the same
/// order as the dense triple loop, so Saturate and Reject see the same
/// running sums the dense definition would.
///
/// @throws DimensionError if a.cols() != b.rows()
/// @throws OverflowError under OverflowPolicy::Reject
inline SparseMatrix multiply(const SparseMatrix& a, const SparseMatrix& b,
                             const ArithOptions& opts = {}) {
    SMAT_CHECK_DIM(a.cols() == b.rows(),
        "Matrix dimensions are not compatible for multiplication: " +
        a.shape_string() + " * " + b.shape_string() + " (inner dimensions " +
        std::to_string(a.cols()) + " != " + std::to_string(b.rows()) + ")");

    SparseMatrix result(a.rows(), b.cols());
    if (a.empty() || b.empty()) {
        return result;
    }

    const auto lhs = detail::RowCompressed::from(a);
    const auto rhs = detail::RowCompressed::from(b);
    const Size n_rows = lhs.row_count();

    std::vector<std::vector<std::pair<Index, Value>>> out_rows(n_rows);
    std::vector<std::exception_ptr> errors(n_rows);

    auto compute_row = [&](size_t r) {
        try {
            const Index row = lhs.row_ids[r];
            std::map<Index, Value> acc;

            for (Size p = lhs.row_ptr[r]; p < lhs.row_ptr[r + 1]; ++p) {
                const Index slot = rhs.find_row(lhs.col_ind[p]);
                if (slot < 0) {
                    continue;
                }
                const Value av = lhs.values[p];
                const auto s = static_cast<Size>(slot);

                for (Size q = rhs.row_ptr[s]; q < rhs.row_ptr[s + 1]; ++q) {
                    const Index col = rhs.col_ind[q];
                    Value prod = 0;
                    if (SMAT_UNLIKELY(!checked::mul(av, rhs.values[q], opts.overflow, prod))) {
                        detail::throw_overflow("multiplication", row, col);
                    }
                    Value& cell = acc[col];
                    Value sum = 0;
                    if (SMAT_UNLIKELY(!checked::add(cell, prod, opts.overflow, sum))) {
                        detail::throw_overflow("multiplication", row, col);
                    }
                    cell = sum;
                }
            }

            auto& dst = out_rows[r];
            for (const auto& [col, value] : acc) {
                if (value != 0) {
                    dst.emplace_back(col, value);
                }
            }
        } catch (...) {
            errors[r] = std::current_exception();
        }
    };

    if (n_rows < config::PARALLEL_ROW_THRESHOLD) {
        for (Size r = 0; r < n_rows; ++r) {
            compute_row(r);
        }
    } else {
        threading::parallel_for(Size(0), n_rows, compute_row);
    }

    // First failing row in row order, independent of scheduling
    for (const auto& err : errors) {
        if (err) {
            std::rethrow_exception(err);
        }
    }

    for (Size r = 0; r < n_rows; ++r) {
        for (const auto& [col, value] : out_rows[r]) {
            result.append_ordered(lhs.row_ids[r], col, value);
        }
    }

    return result;
}

} // namespace smat::kernel::arith
