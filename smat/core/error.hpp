#pragma once

#include "smat/core/macros.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

// =============================================================================
// FILE: smat/core/error.hpp
// BRIEF: SMAT Exception System
// =============================================================================

namespace smat {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    RANGE_ERROR = 13,
    FORMAT_ERROR = 15,

    // I/O errors
    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,
    WRITE_ERROR = 34,

    // Numerical errors
    OVERFLOW = 52,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class SMAT_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(const std::string& msg = "Null pointer encountered")
        : RuntimeError(ErrorCode::NULL_POINTER, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal SMAT Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

/// Operand shapes incompatible with the requested operation
using DimensionMismatchError = DimensionError;

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg)
        : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

class FormatError : public ValueError {
public:
    explicit FormatError(const std::string& msg)
        : ValueError(ErrorCode::FORMAT_ERROR, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    explicit IOError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "File not found: " + path) {}
};

class ReadError : public IOError {
public:
    explicit ReadError(const std::string& msg)
        : IOError(ErrorCode::READ_ERROR, msg) {}
};

class WriteError : public IOError {
public:
    explicit WriteError(const std::string& msg)
        : IOError(ErrorCode::WRITE_ERROR, msg) {}
};

class OverflowError : public Exception {
public:
    explicit OverflowError(const std::string& msg = "Integer overflow")
        : Exception(ErrorCode::OVERFLOW, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Assertion for internal invariants (active in all builds)
#define SMAT_ASSERT(condition, msg) \
    do { \
        if (SMAT_UNLIKELY(!(condition))) { \
            throw smat::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Validation for user inputs
#define SMAT_CHECK_ARG(condition, msg) \
    do { \
        if (SMAT_UNLIKELY(!(condition))) { \
            throw smat::ValueError(msg); \
        } \
    } while(0)

// Validation for dimension mismatches
#define SMAT_CHECK_DIM(condition, msg) \
    do { \
        if (SMAT_UNLIKELY(!(condition))) { \
            throw smat::DimensionError(msg); \
        } \
    } while(0)

// Validation for coordinates against a shape
#define SMAT_CHECK_COORD(row, col, rows, cols, msg) \
    do { \
        if (SMAT_UNLIKELY((row) < 0 || (row) >= (rows) || (col) < 0 || (col) >= (cols))) { \
            throw smat::RangeError(msg); \
        } \
    } while(0)

// Validation for textual input
#define SMAT_CHECK_FORMAT(condition, msg) \
    do { \
        if (SMAT_UNLIKELY(!(condition))) { \
            throw smat::FormatError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace smat
