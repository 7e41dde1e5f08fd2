#pragma once

// =============================================================================
// FILE: smat/binding/c_api/core.h
// BRIEF: C ABI core types, version query and error reporting
// =============================================================================
//
// ERROR MODEL:
//   - Every function returns smat_error_t (SMAT_OK on success)
//   - No C++ exception ever crosses this boundary
//   - The message of the last failure is kept per thread
//
// MEMORY MODEL:
//   - Handles are created by smat_matrix_* functions and released with
//     smat_matrix_destroy()
//   - Strings and arrays are always caller-owned
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Export Macro
// =============================================================================

#ifndef SMAT_EXPORT
    #if defined(_MSC_VER)
        #define SMAT_EXPORT __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define SMAT_EXPORT __attribute__((visibility("default")))
    #else
        #define SMAT_EXPORT
    #endif
#endif

// =============================================================================
// Basic Value Types (Must Match C++ smat::Value and smat::Index)
// =============================================================================

#if defined(SMAT_USE_VALUE_INT32) || (defined(SMAT_VALUE_PRECISION) && SMAT_VALUE_PRECISION == 0)
typedef int32_t smat_value_t;
#define SMAT_VALUE_TYPE_NAME "int32"
#else
typedef int64_t smat_value_t;
#define SMAT_VALUE_TYPE_NAME "int64"
#endif

typedef int64_t smat_index_t;
typedef size_t smat_size_t;

typedef int smat_bool_t;
#define SMAT_TRUE 1
#define SMAT_FALSE 0

// =============================================================================
// Error Codes (stable, match smat::ErrorCode)
// =============================================================================

typedef int32_t smat_error_t;

#define SMAT_OK 0

// General errors (1-9)
#define SMAT_ERROR_UNKNOWN 1
#define SMAT_ERROR_INTERNAL 2
#define SMAT_ERROR_OUT_OF_MEMORY 3
#define SMAT_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define SMAT_ERROR_INVALID_ARGUMENT 10
#define SMAT_ERROR_DIMENSION_MISMATCH 11
#define SMAT_ERROR_RANGE_ERROR 13
#define SMAT_ERROR_FORMAT_ERROR 15

// I/O errors (30-39)
#define SMAT_ERROR_IO_ERROR 30
#define SMAT_ERROR_FILE_NOT_FOUND 31
#define SMAT_ERROR_READ_ERROR 33
#define SMAT_ERROR_WRITE_ERROR 34

// Numerical errors (50-59)
#define SMAT_ERROR_OVERFLOW 52

// =============================================================================
// Version Information
// =============================================================================

// Runtime version string, e.g. "1.0.0"
SMAT_EXPORT const char* smat_get_version(void);

// Build configuration, e.g. "int64+openmp"
SMAT_EXPORT const char* smat_get_build_config(void);

// =============================================================================
// Error Reporting
// =============================================================================

// Message of the last failure on this thread, "No error" if none
SMAT_EXPORT const char* smat_get_last_error(void);

// Code of the last failure on this thread, SMAT_OK if none
SMAT_EXPORT smat_error_t smat_get_last_error_code(void);

SMAT_EXPORT void smat_clear_error(void);

#ifdef __cplusplus
}
#endif
