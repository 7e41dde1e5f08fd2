#pragma once

#include "smat/config.hpp"
#include "smat/core/macros.hpp"

#include <cstddef>
#include <memory>
#include <thread>

#if defined(SMAT_USE_OPENMP)
    #include <omp.h>
#elif defined(SMAT_USE_TBB)
    #include <tbb/global_control.h>
#endif

// =============================================================================
// FILE: smat/threading/scheduler.hpp
// BRIEF: Process-wide worker count for the parallel multiply
//
// The serial backend accepts every request and always reports one worker.
// =============================================================================

namespace smat::threading {

class Scheduler {
public:
    // Upper bound applied to any requested worker count
    static constexpr std::size_t MAX_WORKERS = 1024;

    /// @brief Cores reported by the OS, at least 1
    [[nodiscard]] static std::size_t hardware_concurrency() noexcept {
        const unsigned cores = std::thread::hardware_concurrency();
        return cores == 0 ? 1 : static_cast<std::size_t>(cores);
    }

    /// @brief Set the worker count; 0 selects hardware_concurrency()
    static void set_num_threads(std::size_t n) {
        const std::size_t workers = clamp_request(n);
#if defined(SMAT_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(workers));
#elif defined(SMAT_USE_TBB)
        // A global_control only limits parallelism while it is alive
        limit() = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, workers);
#else
        (void)workers;
#endif
    }

    /// @brief Workers the next parallel region may use, at least 1
    [[nodiscard]] static std::size_t get_num_threads() noexcept {
#if defined(SMAT_USE_OPENMP)
        const int n = omp_get_max_threads();
        return n > 0 ? static_cast<std::size_t>(n) : 1;
#elif defined(SMAT_USE_TBB)
        const std::size_t n = tbb::global_control::active_value(
            tbb::global_control::max_allowed_parallelism);
        return n > 0 ? n : 1;
#else
        return 1;
#endif
    }

    [[nodiscard]] static constexpr const char* backend_name() noexcept {
#if defined(SMAT_USE_OPENMP)
        return "openmp";
#elif defined(SMAT_USE_TBB)
        return "tbb";
#else
        return "serial";
#endif
    }

    /// @brief Startup hook for executables
    static void init(std::size_t n = 0) { set_num_threads(n); }

private:
    [[nodiscard]] static std::size_t clamp_request(std::size_t n) noexcept {
        if (n == 0) {
            n = hardware_concurrency();
        }
        return n < MAX_WORKERS ? n : MAX_WORKERS;
    }

#if defined(SMAT_USE_TBB)
    static std::unique_ptr<tbb::global_control>& limit() {
        static std::unique_ptr<tbb::global_control> control;
        return control;
    }
#endif
};

} // namespace smat::threading
