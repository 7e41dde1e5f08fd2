#pragma once

// =============================================================================
// FILE: smat/binding/c_api/matrix.h
// BRIEF: C ABI for sparse integer matrices
// =============================================================================
//
// THREAD SAFETY:
//   - All functions are thread-safe with respect to error reporting
//   - A handle is NOT synchronized; concurrent reads are safe, writes are not
// =============================================================================

#include "smat/binding/c_api/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Handle and Options
// =============================================================================

typedef struct smat_matrix smat_matrix;
typedef smat_matrix* smat_matrix_t;

typedef enum {
    SMAT_OVERFLOW_REJECT = 0,
    SMAT_OVERFLOW_SATURATE = 1,
    SMAT_OVERFLOW_WRAP = 2
} smat_overflow_policy_t;

// =============================================================================
// Lifecycle
// =============================================================================

/// @brief Create an all-zero rows x cols matrix
/// @param[out] out New handle
/// @return SMAT_ERROR_INVALID_ARGUMENT if rows or cols is negative
SMAT_EXPORT smat_error_t smat_matrix_create(
    smat_index_t rows,
    smat_index_t cols,
    smat_matrix_t* out
);

/// @brief Deep copy
SMAT_EXPORT smat_error_t smat_matrix_clone(
    smat_matrix_t src,
    smat_matrix_t* out
);

/// @brief Release a handle and set *matrix to NULL (NULL is a no-op)
SMAT_EXPORT smat_error_t smat_matrix_destroy(smat_matrix_t* matrix);

// =============================================================================
// Queries and Element Access
// =============================================================================

SMAT_EXPORT smat_error_t smat_matrix_rows(smat_matrix_t matrix, smat_index_t* out);
SMAT_EXPORT smat_error_t smat_matrix_cols(smat_matrix_t matrix, smat_index_t* out);
SMAT_EXPORT smat_error_t smat_matrix_nnz(smat_matrix_t matrix, smat_size_t* out);

/// @brief Value at (row, col); 0 when absent or out of bounds
SMAT_EXPORT smat_error_t smat_matrix_get(
    smat_matrix_t matrix,
    smat_index_t row,
    smat_index_t col,
    smat_value_t* out
);

/// @brief Assign (row, col); value 0 removes the entry
/// @return SMAT_ERROR_RANGE_ERROR if (row, col) is out of bounds
SMAT_EXPORT smat_error_t smat_matrix_set(
    smat_matrix_t matrix,
    smat_index_t row,
    smat_index_t col,
    smat_value_t value
);

/// @brief Copy all entries, row-major, into caller arrays
/// @param[in] capacity Length of each array, must be >= nnz
/// @param[out] count Number of entries written
/// @note Pass NULL arrays to query the required capacity in *count
SMAT_EXPORT smat_error_t smat_matrix_export(
    smat_matrix_t matrix,
    smat_index_t* rows,
    smat_index_t* cols,
    smat_value_t* values,
    smat_size_t capacity,
    smat_size_t* count
);

// =============================================================================
// Text Codec
// =============================================================================

/// @brief Parse the text form
/// @param[in] text Text bytes (need not be NUL-terminated)
/// @param[in] length Byte count of text
/// @param[in] strict_header SMAT_TRUE to require the literal "rows" / "cols" labels
/// @return SMAT_ERROR_FORMAT_ERROR or SMAT_ERROR_RANGE_ERROR on bad input
SMAT_EXPORT smat_error_t smat_matrix_parse(
    const char* text,
    smat_size_t length,
    smat_bool_t strict_header,
    smat_matrix_t* out
);

/// @brief Serialize into a caller buffer
///
/// Two-call protocol: with buffer == NULL, *length receives the text size
/// (excluding the terminating NUL). Otherwise capacity must be at least
/// *length + 1 and the text is written NUL-terminated.
SMAT_EXPORT smat_error_t smat_matrix_serialize(
    smat_matrix_t matrix,
    char* buffer,
    smat_size_t capacity,
    smat_size_t* length
);

SMAT_EXPORT smat_error_t smat_matrix_load(
    const char* path,
    smat_bool_t strict_header,
    smat_matrix_t* out
);

SMAT_EXPORT smat_error_t smat_matrix_save(
    smat_matrix_t matrix,
    const char* path
);

// =============================================================================
// Arithmetic (result is a new handle)
// =============================================================================

SMAT_EXPORT smat_error_t smat_matrix_add(
    smat_matrix_t a,
    smat_matrix_t b,
    smat_overflow_policy_t policy,
    smat_matrix_t* out
);

SMAT_EXPORT smat_error_t smat_matrix_subtract(
    smat_matrix_t a,
    smat_matrix_t b,
    smat_overflow_policy_t policy,
    smat_matrix_t* out
);

SMAT_EXPORT smat_error_t smat_matrix_multiply(
    smat_matrix_t a,
    smat_matrix_t b,
    smat_overflow_policy_t policy,
    smat_matrix_t* out
);

#ifdef __cplusplus
}
#endif
