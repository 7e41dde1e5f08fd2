#pragma once

// =============================================================================
// SMAT - Test Data Generators
// =============================================================================
//
// Reproducible random sparse matrices and scratch directories.
//
// =============================================================================

#include "smat/core/sparse.hpp"

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <system_error>
#include <utility>

namespace smat::test {

// =============================================================================
// Random Number Generator
// =============================================================================

class Random {
public:
    explicit Random(uint64_t seed = 42) : rng_(seed) {}

    /// Uniform random double in [min, max]
    [[nodiscard]] double uniform(double min = 0.0, double max = 1.0) {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(rng_);
    }

    /// Uniform random integer in [min, max]
    [[nodiscard]] int64_t uniform_int(int64_t min, int64_t max) {
        std::uniform_int_distribution<int64_t> dist(min, max);
        return dist(rng_);
    }

    [[nodiscard]] bool bernoulli(double p = 0.5) {
        std::bernoulli_distribution dist(p);
        return dist(rng_);
    }

    [[nodiscard]] std::mt19937_64& engine() { return rng_; }

private:
    std::mt19937_64 rng_;
};

inline Random& global_rng() {
    static Random rng(42);
    return rng;
}

inline void set_seed(uint64_t seed) {
    global_rng() = Random(seed);
}

// =============================================================================
// Random Matrices
// =============================================================================

/// Non-zero value in [-max_abs, max_abs]
inline Value random_nonzero(Value max_abs = 50, Random& rng = global_rng()) {
    Value v = 0;
    while (v == 0) {
        v = static_cast<Value>(rng.uniform_int(-max_abs, max_abs));
    }
    return v;
}

/// rows x cols matrix where each cell is non-zero with probability density
inline SparseMatrix random_sparse(Index rows, Index cols, double density,
                                  Value max_abs = 50, Random& rng = global_rng()) {
    SparseMatrix m(rows, cols);
    for (Index i = 0; i < rows; ++i) {
        for (Index j = 0; j < cols; ++j) {
            if (rng.bernoulli(density)) {
                m.set(i, j, random_nonzero(max_abs, rng));
            }
        }
    }
    return m;
}

inline std::pair<Index, Index> random_shape(Index min_dim = 1, Index max_dim = 32,
                                            Random& rng = global_rng()) {
    return {rng.uniform_int(min_dim, max_dim), rng.uniform_int(min_dim, max_dim)};
}

/// Identity matrix of order n
inline SparseMatrix identity(Index n) {
    SparseMatrix m(n, n);
    for (Index i = 0; i < n; ++i) {
        m.set(i, i, 1);
    }
    return m;
}

// =============================================================================
// Scratch Directory
// =============================================================================

/// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        namespace fs = std::filesystem;
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("smat_test_" + tag + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

private:
    std::filesystem::path path_;
};

} // namespace smat::test
