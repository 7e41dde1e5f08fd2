#pragma once

// =============================================================================
// SMAT - Oracle (Eigen Reference Implementation)
// =============================================================================
//
// Dense Eigen matrices are the source of truth for arithmetic results.
// Operands in tests are kept small enough that no dense result overflows.
//
// =============================================================================

#include "smat/core/sparse.hpp"
#include "smat/binding/c_api/core.h"
#include "smat/binding/c_api/matrix.h"

#include <Eigen/Core>

#include <stdexcept>
#include <string>
#include <vector>

namespace smat::test {

using EigenDense = Eigen::Matrix<Value, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// =============================================================================
// Conversion
// =============================================================================

inline EigenDense to_dense(const SparseMatrix& m) {
    EigenDense d = EigenDense::Zero(m.rows(), m.cols());
    for (const auto& [coord, value] : m) {
        d(coord.row, coord.col) = value;
    }
    return d;
}

/// Dense copy of a C API handle, built from smat_matrix_export
inline EigenDense to_dense(smat_matrix_t mat) {
    smat_index_t rows = 0;
    smat_index_t cols = 0;
    smat_size_t nnz = 0;
    if (smat_matrix_rows(mat, &rows) != SMAT_OK ||
        smat_matrix_cols(mat, &cols) != SMAT_OK ||
        smat_matrix_export(mat, nullptr, nullptr, nullptr, 0, &nnz) != SMAT_OK) {
        throw std::runtime_error(std::string("to_dense: ") + smat_get_last_error());
    }

    std::vector<smat_index_t> r(nnz);
    std::vector<smat_index_t> c(nnz);
    std::vector<smat_value_t> v(nnz);
    smat_size_t written = 0;
    if (smat_matrix_export(mat, r.data(), c.data(), v.data(), nnz, &written) != SMAT_OK) {
        throw std::runtime_error(std::string("to_dense: ") + smat_get_last_error());
    }

    EigenDense d = EigenDense::Zero(rows, cols);
    for (smat_size_t k = 0; k < written; ++k) {
        d(r[k], c[k]) = v[k];
    }
    return d;
}

/// Sparse copy of a dense matrix; zero cells are not stored
inline SparseMatrix from_dense(const EigenDense& d) {
    SparseMatrix m(d.rows(), d.cols());
    for (Index i = 0; i < d.rows(); ++i) {
        for (Index j = 0; j < d.cols(); ++j) {
            m.set(i, j, d(i, j));
        }
    }
    return m;
}

// =============================================================================
// Reference Operations
// =============================================================================

namespace oracle {

inline EigenDense add(const SparseMatrix& a, const SparseMatrix& b) {
    return to_dense(a) + to_dense(b);
}

inline EigenDense subtract(const SparseMatrix& a, const SparseMatrix& b) {
    return to_dense(a) - to_dense(b);
}

inline EigenDense multiply(const SparseMatrix& a, const SparseMatrix& b) {
    return to_dense(a) * to_dense(b);
}

} // namespace oracle

// =============================================================================
// Verification
// =============================================================================

/// True when m has d's shape, equals d cell by cell, and stores no zeros
inline bool matches(const SparseMatrix& m, const EigenDense& d) {
    if (m.rows() != d.rows() || m.cols() != d.cols()) {
        return false;
    }
    Size nonzero = 0;
    for (Index i = 0; i < d.rows(); ++i) {
        for (Index j = 0; j < d.cols(); ++j) {
            if (m.get(i, j) != d(i, j)) {
                return false;
            }
            if (d(i, j) != 0) {
                ++nonzero;
            }
        }
    }
    return m.nnz() == nonzero;
}

} // namespace smat::test
