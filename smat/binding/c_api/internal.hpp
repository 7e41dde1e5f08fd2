#pragma once

// =============================================================================
// FILE: smat/binding/c_api/internal.hpp
// BRIEF: Internal glue between C handles and C++ objects
// =============================================================================
//
// WARNING: Internal to the C API binding layer, do not include from user code
// =============================================================================

#include "smat/core/type.hpp"
#include "smat/core/sparse.hpp"
#include "smat/core/checked.hpp"
#include "smat/core/error.hpp"
#include "smat/binding/c_api/core.h"
#include "smat/binding/c_api/matrix.h"

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace smat::binding {

// =============================================================================
// Handle Wrapper
// =============================================================================

/// @brief Owns one SparseMatrix on behalf of a C handle
struct MatrixWrapper {
    SparseMatrix matrix;

    MatrixWrapper() = default;

    explicit MatrixWrapper(SparseMatrix&& m) noexcept
        : matrix(std::move(m)) {}

    MatrixWrapper(const MatrixWrapper&) = delete;
    MatrixWrapper& operator=(const MatrixWrapper&) = delete;
};

// =============================================================================
// Thread-Local Error State
// =============================================================================

void set_last_error(smat_error_t code, const char* message) noexcept;

void set_last_error(smat_error_t code, std::string_view message) noexcept;

void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;

[[nodiscard]] auto get_last_error_code() noexcept -> smat_error_t;

// =============================================================================
// Exception Handling
// =============================================================================

// Convert the active exception to an error code and record its message.
// Must be called from within a catch block.
[[nodiscard]] auto handle_exception() noexcept -> smat_error_t;

// =============================================================================
// Option Conversion
// =============================================================================

/// @throws ValueError on an unknown enumerator
[[nodiscard]] inline auto convert_overflow_policy(smat_overflow_policy_t policy)
    -> OverflowPolicy {
    switch (policy) {
        case SMAT_OVERFLOW_REJECT:   return OverflowPolicy::Reject;
        case SMAT_OVERFLOW_SATURATE: return OverflowPolicy::Saturate;
        case SMAT_OVERFLOW_WRAP:     return OverflowPolicy::Wrap;
    }
    throw ValueError("Unknown overflow policy: " + std::to_string(static_cast<int>(policy)));
}

// =============================================================================
// Convenience Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SMAT_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (SMAT_UNLIKELY((ptr) == nullptr)) { \
            smat::binding::set_last_error(SMAT_ERROR_NULL_POINTER, (msg)); \
            return SMAT_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define SMAT_C_API_CHECK(cond, code, msg) \
    do { \
        if (SMAT_UNLIKELY(!(cond))) { \
            smat::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

#define SMAT_C_API_TRY try {

#define SMAT_C_API_CATCH \
    } catch (...) { \
        return smat::binding::handle_exception(); \
    }

#define SMAT_C_API_RETURN_OK \
    do { \
        smat::binding::clear_last_error(); \
        return SMAT_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace smat::binding

// =============================================================================
// Opaque Handle Definition
// =============================================================================

// Completes the forward declaration in matrix.h
struct smat_matrix : smat::binding::MatrixWrapper {
    using MatrixWrapper::MatrixWrapper;
};

namespace smat::binding {

/// @brief Move a matrix into a new handle and publish it through out
///
/// *out is written only after the allocation succeeded.
inline void publish_handle(SparseMatrix&& m, smat_matrix_t* out) {
    auto handle = std::make_unique<smat_matrix>(std::move(m));
    *out = handle.release();
}

/// @brief Release a handle created by publish_handle and null the caller's copy
inline void destroy_handle(smat_matrix_t* handle) noexcept {
    std::unique_ptr<smat_matrix> owned(*handle);
    *handle = nullptr;
}

} // namespace smat::binding

static_assert(std::is_base_of_v<smat::binding::MatrixWrapper, smat_matrix>,
              "smat_matrix must inherit from MatrixWrapper");
static_assert(!std::is_copy_constructible_v<smat_matrix>,
              "smat_matrix must not be copyable");
static_assert(sizeof(smat_value_t) == sizeof(smat::Value),
              "smat_value_t does not match smat::Value");
static_assert(sizeof(smat_index_t) == sizeof(smat::Index),
              "smat_index_t does not match smat::Index");
