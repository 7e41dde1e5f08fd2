#pragma once

#include "smat/config.hpp"
#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: smat/core/type.hpp
// BRIEF: Unified scalar types
// =============================================================================

namespace smat {

#if defined(SMAT_USE_VALUE_INT32)
    using Value = std::int32_t;
    constexpr const char* VALUE_DTYPE_NAME = "int32";
#elif defined(SMAT_USE_VALUE_INT64)
    using Value = std::int64_t;
    constexpr const char* VALUE_DTYPE_NAME = "int64";
#else
    #error "SMAT: No value precision selected."
#endif

// Row/column coordinates are always 64-bit signed
using Index = std::int64_t;
using Size = std::size_t;

/// @brief Zero-indexed (row, col) pair, ordered row-major
struct Coordinate {
    Index row;
    Index col;

    constexpr bool operator==(const Coordinate&) const noexcept = default;

    constexpr bool operator<(const Coordinate& other) const noexcept {
        return row < other.row || (row == other.row && col < other.col);
    }
};

} // namespace smat
