#pragma once

#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: smat/config.hpp
// BRIEF: SMAT Configuration Header
// =============================================================================

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define SMAT_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define SMAT_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define SMAT_OS_LINUX
#else
    #define SMAT_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

// Auto-select backend based on platform if none specified
#if !defined(SMAT_BACKEND_SERIAL) && !defined(SMAT_BACKEND_TBB) && \
    !defined(SMAT_BACKEND_OPENMP)
    #if defined(SMAT_OS_MAC)
        // macOS: avoid the libomp dependency unless explicitly requested
        #if defined(SMAT_MAC_USE_OPENMP)
            #define SMAT_BACKEND_OPENMP
        #else
            #define SMAT_BACKEND_SERIAL
        #endif
    #elif defined(SMAT_OS_WINDOWS) || defined(SMAT_OS_LINUX)
        #define SMAT_BACKEND_OPENMP
    #else
        #define SMAT_BACKEND_SERIAL
    #endif
#endif

// Exactly one backend must be selected
#if (defined(SMAT_BACKEND_SERIAL) && (defined(SMAT_BACKEND_TBB) || defined(SMAT_BACKEND_OPENMP))) || \
    (defined(SMAT_BACKEND_TBB) && defined(SMAT_BACKEND_OPENMP))
    #error "SMAT Configuration Error: Multiple threading backends defined! " \
           "Please define only one of SMAT_BACKEND_SERIAL, SMAT_BACKEND_OPENMP, SMAT_BACKEND_TBB."
#endif

#if defined(SMAT_OS_MAC) && defined(SMAT_BACKEND_OPENMP)
    #pragma GCC warning "SMAT_WARNING: OpenMP enabled on macOS. " \
                        "Ensure 'libomp' is installed and linker flags are correct."
#endif

// =============================================================================
// Feature Flags (Public API)
// =============================================================================

#if defined(SMAT_BACKEND_OPENMP)
    #define SMAT_USE_OPENMP 1
#elif defined(SMAT_BACKEND_TBB)
    #define SMAT_USE_TBB 1
#elif defined(SMAT_BACKEND_SERIAL)
    #define SMAT_USE_SERIAL 1
#endif

// =============================================================================
// Value Precision Control
// =============================================================================

// Stored value type
// 0: int32
// 1: int64 (default)
#ifndef SMAT_VALUE_PRECISION
    #define SMAT_VALUE_PRECISION 1
#endif

#if SMAT_VALUE_PRECISION == 0
    #define SMAT_USE_VALUE_INT32
#elif SMAT_VALUE_PRECISION == 1
    #define SMAT_USE_VALUE_INT64
#else
    #error "SMAT Configuration Error: Invalid SMAT_VALUE_PRECISION value. " \
           "Must be 0 (int32) or 1 (int64)."
#endif

// =============================================================================
// Kernel Configuration
// =============================================================================

namespace smat::kernel::config {
    // Below this many non-empty rows, multiply stays on the calling thread
    inline constexpr std::size_t PARALLEL_ROW_THRESHOLD = 64;

    // Rows handed to a worker at a time once multiply goes parallel
    inline constexpr std::size_t PARALLEL_ROW_GRAIN = 16;
}

namespace smat::io::config {
    // fread chunk size for file reads
    inline constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;
}
