#pragma once

#include "smat/core/type.hpp"
#include "smat/core/macros.hpp"
#include "smat/core/error.hpp"

#include <iterator>
#include <map>
#include <span>
#include <string>
#include <utility>

// =============================================================================
// FILE: smat/core/sparse.hpp
// BRIEF: Sparse integer matrix with composite-key storage
//
// DESIGN NOTES:
// - Entries live in an ordered map keyed by (row, col), so iteration is
//   always row-major ascending and a row is one contiguous key range
// - Zero is represented by absence only
// - Value semantics: copies are deep, no two matrices share storage
//
// INVARIANT:
// - Every stored value is non-zero
// - Every stored coordinate lies in [0, rows) x [0, cols)
// =============================================================================

namespace smat {

/// @brief One (row, col, value) entry, as read from or written to text
struct Triplet {
    Index row;
    Index col;
    Value value;

    constexpr bool operator==(const Triplet&) const noexcept = default;
};

class SparseMatrix {
public:
    using Storage = std::map<Coordinate, Value>;
    using const_iterator = Storage::const_iterator;
    using RowRange = std::pair<const_iterator, const_iterator>;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// @brief Empty 0 x 0 matrix
    SparseMatrix() noexcept = default;

    /// @brief All-zero matrix of the given shape
    /// @throws ValueError if rows or cols is negative
    SparseMatrix(Index rows, Index cols)
        : rows_(rows), cols_(cols) {
        SMAT_CHECK_ARG(rows >= 0 && cols >= 0,
            "SparseMatrix: shape must be non-negative, got " +
            std::to_string(rows) + "x" + std::to_string(cols));
    }

    /// @brief Build from a triplet list, later entries overwrite earlier ones
    /// @throws RangeError on the first out-of-bounds triplet
    static SparseMatrix from_triplets(Index rows, Index cols,
                                      std::span<const Triplet> triplets) {
        SparseMatrix m(rows, cols);
        for (const auto& t : triplets) {
            m.set(t.row, t.col, t.value);
        }
        return m;
    }

    // =========================================================================
    // Shape Queries
    // =========================================================================

    [[nodiscard]] Index rows() const noexcept { return rows_; }
    [[nodiscard]] Index cols() const noexcept { return cols_; }
    [[nodiscard]] Size nnz() const noexcept { return cells_.size(); }
    [[nodiscard]] bool empty() const noexcept { return cells_.empty(); }

    [[nodiscard]] bool in_bounds(Index row, Index col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    [[nodiscard]] std::string shape_string() const {
        return std::to_string(rows_) + "x" + std::to_string(cols_);
    }

    // =========================================================================
    // Element Access
    // =========================================================================

    /// @brief Stored value, or 0 when absent or out of bounds
    [[nodiscard]] Value get(Index row, Index col) const noexcept {
        auto it = cells_.find(Coordinate{row, col});
        return it != cells_.end() ? it->second : Value(0);
    }

    [[nodiscard]] bool contains(Index row, Index col) const noexcept {
        return cells_.find(Coordinate{row, col}) != cells_.end();
    }

    /// @brief Insert, overwrite, or (for value 0) erase an entry
    /// @throws RangeError if (row, col) is outside the matrix
    void set(Index row, Index col, Value value) {
        SMAT_CHECK_COORD(row, col, rows_, cols_,
            "Invalid row or column index (" + std::to_string(row) + ", " +
            std::to_string(col) + ") for " + shape_string() + " matrix");

        if (value == 0) {
            cells_.erase(Coordinate{row, col});
        } else {
            cells_.insert_or_assign(Coordinate{row, col}, value);
        }
    }

    /// @brief Drop every entry, keep the shape
    void clear() noexcept { cells_.clear(); }

    // =========================================================================
    // Iteration (row-major ascending)
    // =========================================================================

    [[nodiscard]] const_iterator begin() const noexcept { return cells_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return cells_.end(); }

    /// @brief Entries of one row as an iterator range, empty for rows outside the matrix
    [[nodiscard]] RowRange row_range(Index row) const {
        if (row < 0 || row >= rows_) {
            return {cells_.end(), cells_.end()};
        }
        return {cells_.lower_bound(Coordinate{row, 0}),
                cells_.lower_bound(Coordinate{row + 1, 0})};
    }

    template <typename Func>
    void for_each_in_row(Index row, Func&& func) const {
        auto [first, last] = row_range(row);
        for (; first != last; ++first) {
            func(first->first.col, first->second);
        }
    }

    bool operator==(const SparseMatrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && cells_ == other.cells_;
    }

    // =========================================================================
    // Kernel Support
    // =========================================================================

    /// @brief Append an entry strictly after every stored coordinate
    ///
    /// Kernels produce results in row-major order; appending with an end hint
    /// keeps construction linear. Zero values are skipped.
    void append_ordered(Index row, Index col, Value value) {
        if (value == 0) {
            return;
        }
        SMAT_ASSERT(in_bounds(row, col), "append_ordered: coordinate out of bounds");
        SMAT_ASSERT((cells_.empty() || std::prev(cells_.end())->first < Coordinate{row, col}),
                    "append_ordered: coordinates must be strictly increasing");
        cells_.emplace_hint(cells_.end(), Coordinate{row, col}, value);
    }

private:
    Index rows_ = 0;
    Index cols_ = 0;
    Storage cells_;
};

} // namespace smat
