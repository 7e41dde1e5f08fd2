#pragma once

#include "smat/config.hpp"
#include "smat/core/macros.hpp"

#include <cstddef>

#if defined(SMAT_USE_TBB)
    #include <tbb/blocked_range.h>
    #include <tbb/parallel_for.h>
#elif defined(SMAT_USE_OPENMP)
    #include <omp.h>
#endif

// =============================================================================
// FILE: smat/threading/parallel_for.hpp
// BRIEF: Run body(i) for every i in [first, last) on the configured backend
//
// body must not throw: an exception leaving an OpenMP region terminates the
// process. Kernels record per-index errors and rethrow after the loop.
// Iterations are handed out in chunks of kernel::config::PARALLEL_ROW_GRAIN.
// =============================================================================

namespace smat::threading {

template <typename Body>
void parallel_for(std::size_t first, std::size_t last, Body&& body) {
    if (first >= last) {
        return;
    }
    constexpr std::size_t grain = kernel::config::PARALLEL_ROW_GRAIN;

#if defined(SMAT_USE_OPENMP)
    // Nested call: the enclosing region already owns the workers
    if (omp_in_parallel()) {
        for (std::size_t i = first; i < last; ++i) {
            body(i);
        }
        return;
    }
    #pragma omp parallel for schedule(dynamic, grain)
    for (std::size_t i = first; i < last; ++i) {
        body(i);
    }

#elif defined(SMAT_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<std::size_t>(first, last, grain),
        [&body](const tbb::blocked_range<std::size_t>& chunk) {
            for (std::size_t i = chunk.begin(); i != chunk.end(); ++i) {
                body(i);
            }
        });

#else
    for (std::size_t i = first; i < last; ++i) {
        body(i);
    }
#endif
}

} // namespace smat::threading
