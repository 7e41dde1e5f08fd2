#pragma once

#include "smat/config.hpp"

// =============================================================================
// FILE: smat/core/macros.hpp
// BRIEF: Compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 0: Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define SMAT_PLATFORM_WINDOWS 1
    #define SMAT_PLATFORM_POSIX 0
#elif defined(__APPLE__) || defined(__MACH__) || defined(__linux__) || \
      defined(__linux) || defined(__unix__) || defined(__unix)
    #define SMAT_PLATFORM_WINDOWS 0
    #define SMAT_PLATFORM_POSIX 1
#else
    #define SMAT_PLATFORM_WINDOWS 0
    #define SMAT_PLATFORM_POSIX 0
    #define SMAT_PLATFORM_UNKNOWN 1
#endif

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define SMAT_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define SMAT_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define SMAT_LIKELY(x)   (x)
    #define SMAT_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define SMAT_FORCE_INLINE __forceinline
    #define SMAT_EXPORT __declspec(dllexport)
#else
    #define SMAT_FORCE_INLINE inline __attribute__((always_inline))
    #define SMAT_EXPORT __attribute__((visibility("default")))
#endif

// =============================================================================
// SECTION 3: Checked Integer Arithmetic
// =============================================================================

// Return true when the mathematical result does not fit in *out
#if defined(__clang__) || defined(__GNUC__)
    #define SMAT_HAS_BUILTIN_OVERFLOW 1
    #define SMAT_ADD_OVERFLOW(a, b, out) __builtin_add_overflow((a), (b), (out))
    #define SMAT_SUB_OVERFLOW(a, b, out) __builtin_sub_overflow((a), (b), (out))
    #define SMAT_MUL_OVERFLOW(a, b, out) __builtin_mul_overflow((a), (b), (out))
#else
    #define SMAT_HAS_BUILTIN_OVERFLOW 0
#endif
