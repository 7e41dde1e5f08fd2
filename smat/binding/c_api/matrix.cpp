// =============================================================================
// FILE: smat/binding/c_api/matrix.cpp
// BRIEF: Sparse integer matrix C API implementation
// =============================================================================

#include "smat/binding/c_api/matrix.h"
#include "smat/binding/c_api/internal.hpp"
#include "smat/core/sparse.hpp"
#include "smat/core/error.hpp"
#include "smat/kernel/arith.hpp"
#include "smat/io/text.hpp"

#include <cstring>
#include <string>
#include <string_view>
#include <utility>

using namespace smat;
using namespace smat::binding;

namespace {

[[nodiscard]] auto make_parse_options(smat_bool_t strict_header) noexcept -> io::ParseOptions {
    io::ParseOptions opts;
    opts.header_mode = (strict_header != SMAT_FALSE) ? io::HeaderMode::Strict
                                                     : io::HeaderMode::Tolerant;
    return opts;
}

[[nodiscard]] auto make_arith_options(smat_overflow_policy_t policy)
    -> kernel::arith::ArithOptions {
    kernel::arith::ArithOptions opts;
    opts.overflow = convert_overflow_policy(policy);
    return opts;
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Lifecycle
// =============================================================================

SMAT_EXPORT smat_error_t smat_matrix_create(
    const smat_index_t rows,
    const smat_index_t cols,
    smat_matrix_t* out) {

    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    SMAT_C_API_TRY
        publish_handle(SparseMatrix(rows, cols), out);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_clone(
    smat_matrix_t src,
    smat_matrix_t* out) {

    SMAT_C_API_CHECK_NULL(src, "Source matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    SMAT_C_API_TRY
        SparseMatrix copy = src->matrix;
        publish_handle(std::move(copy), out);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_destroy(smat_matrix_t* matrix) {
    if (matrix == nullptr || *matrix == nullptr) {
        SMAT_C_API_RETURN_OK;
    }
    destroy_handle(matrix);
    SMAT_C_API_RETURN_OK;
}

// =============================================================================
// Queries and Element Access
// =============================================================================

SMAT_EXPORT smat_error_t smat_matrix_rows(smat_matrix_t matrix, smat_index_t* out) {
    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = matrix->matrix.rows();
    SMAT_C_API_RETURN_OK;
}

SMAT_EXPORT smat_error_t smat_matrix_cols(smat_matrix_t matrix, smat_index_t* out) {
    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = matrix->matrix.cols();
    SMAT_C_API_RETURN_OK;
}

SMAT_EXPORT smat_error_t smat_matrix_nnz(smat_matrix_t matrix, smat_size_t* out) {
    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = matrix->matrix.nnz();
    SMAT_C_API_RETURN_OK;
}

SMAT_EXPORT smat_error_t smat_matrix_get(
    smat_matrix_t matrix,
    const smat_index_t row,
    const smat_index_t col,
    smat_value_t* out) {

    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = matrix->matrix.get(row, col);
    SMAT_C_API_RETURN_OK;
}

SMAT_EXPORT smat_error_t smat_matrix_set(
    smat_matrix_t matrix,
    const smat_index_t row,
    const smat_index_t col,
    const smat_value_t value) {

    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");

    SMAT_C_API_TRY
        matrix->matrix.set(row, col, value);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_export(
    smat_matrix_t matrix,
    smat_index_t* rows,
    smat_index_t* cols,
    smat_value_t* values,
    const smat_size_t capacity,
    smat_size_t* count) {

    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");
    SMAT_C_API_CHECK_NULL(count, "Count pointer is null");

    const smat_size_t nnz = matrix->matrix.nnz();
    if (rows == nullptr && cols == nullptr && values == nullptr) {
        *count = nnz;
        SMAT_C_API_RETURN_OK;
    }

    SMAT_C_API_CHECK_NULL(rows, "Row array pointer is null");
    SMAT_C_API_CHECK_NULL(cols, "Column array pointer is null");
    SMAT_C_API_CHECK_NULL(values, "Value array pointer is null");
    SMAT_C_API_CHECK(capacity >= nnz, SMAT_ERROR_INVALID_ARGUMENT,
                     "Export capacity is smaller than the number of entries");

    smat_size_t k = 0;
    for (const auto& [coord, value] : matrix->matrix) {
        rows[k] = coord.row;
        cols[k] = coord.col;
        values[k] = value;
        ++k;
    }
    *count = k;
    SMAT_C_API_RETURN_OK;
}

// =============================================================================
// Text Codec
// =============================================================================

SMAT_EXPORT smat_error_t smat_matrix_parse(
    const char* text,
    const smat_size_t length,
    const smat_bool_t strict_header,
    smat_matrix_t* out) {

    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");
    SMAT_C_API_CHECK(text != nullptr || length == 0, SMAT_ERROR_NULL_POINTER,
                     "Text pointer is null");

    SMAT_C_API_TRY
        const std::string_view view = (text != nullptr) ? std::string_view(text, length)
                                                        : std::string_view{};
        SparseMatrix parsed = io::parse(view, make_parse_options(strict_header));
        publish_handle(std::move(parsed), out);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_serialize(
    smat_matrix_t matrix,
    char* buffer,
    const smat_size_t capacity,
    smat_size_t* length) {

    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");
    SMAT_C_API_CHECK_NULL(length, "Length pointer is null");

    SMAT_C_API_TRY
        const std::string text = io::serialize(matrix->matrix);
        *length = text.size();
        if (buffer == nullptr) {
            SMAT_C_API_RETURN_OK;
        }
        SMAT_CHECK_ARG(capacity > text.size(),
            "Serialize buffer too small: need " + std::to_string(text.size() + 1) +
            " bytes, got " + std::to_string(capacity));
        std::memcpy(buffer, text.data(), text.size());
        buffer[text.size()] = '\0';
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_load(
    const char* path,
    const smat_bool_t strict_header,
    smat_matrix_t* out) {

    SMAT_C_API_CHECK_NULL(path, "Path is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    SMAT_C_API_TRY
        SparseMatrix loaded = io::load_file(path, make_parse_options(strict_header));
        publish_handle(std::move(loaded), out);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_save(
    smat_matrix_t matrix,
    const char* path) {

    SMAT_C_API_CHECK_NULL(matrix, "Matrix is null");
    SMAT_C_API_CHECK_NULL(path, "Path is null");

    SMAT_C_API_TRY
        io::save_file(path, matrix->matrix);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

// =============================================================================
// Arithmetic
// =============================================================================

SMAT_EXPORT smat_error_t smat_matrix_add(
    smat_matrix_t a,
    smat_matrix_t b,
    const smat_overflow_policy_t policy,
    smat_matrix_t* out) {

    SMAT_C_API_CHECK_NULL(a, "Left matrix is null");
    SMAT_C_API_CHECK_NULL(b, "Right matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    SMAT_C_API_TRY
        SparseMatrix result = kernel::arith::add(a->matrix, b->matrix,
                                                 make_arith_options(policy));
        publish_handle(std::move(result), out);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_subtract(
    smat_matrix_t a,
    smat_matrix_t b,
    const smat_overflow_policy_t policy,
    smat_matrix_t* out) {

    SMAT_C_API_CHECK_NULL(a, "Left matrix is null");
    SMAT_C_API_CHECK_NULL(b, "Right matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    SMAT_C_API_TRY
        SparseMatrix result = kernel::arith::subtract(a->matrix, b->matrix,
                                                      make_arith_options(policy));
        publish_handle(std::move(result), out);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

SMAT_EXPORT smat_error_t smat_matrix_multiply(
    smat_matrix_t a,
    smat_matrix_t b,
    const smat_overflow_policy_t policy,
    smat_matrix_t* out) {

    SMAT_C_API_CHECK_NULL(a, "Left matrix is null");
    SMAT_C_API_CHECK_NULL(b, "Right matrix is null");
    SMAT_C_API_CHECK_NULL(out, "Output pointer is null");

    SMAT_C_API_TRY
        SparseMatrix result = kernel::arith::multiply(a->matrix, b->matrix,
                                                      make_arith_options(policy));
        publish_handle(std::move(result), out);
        SMAT_C_API_RETURN_OK;
    SMAT_C_API_CATCH
}

} // extern "C"
