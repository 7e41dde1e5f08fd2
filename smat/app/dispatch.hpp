#pragma once

#include "smat/core/sparse.hpp"
#include "smat/core/error.hpp"
#include "smat/kernel/arith.hpp"
#include "smat/io/text.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// =============================================================================
// FILE: smat/app/dispatch.hpp
// BRIEF: Operation selection and file-to-file execution
//
// Everything a front end needs except terminal I/O: turning a user choice
// into an Operation, running it on two matrices, and the load/compute/save
// round for a pair of input files.
// =============================================================================

namespace smat::app {

enum class Operation {
    Add,
    Subtract,
    Multiply
};

[[nodiscard]] constexpr auto operation_name(Operation op) noexcept -> const char* {
    switch (op) {
        case Operation::Add:      return "add";
        case Operation::Subtract: return "subtract";
        case Operation::Multiply: return "multiply";
    }
    return "unknown";
}

namespace detail {

// Trimmed, lower-cased copy of a typed command
inline std::string normalize_command(std::string_view text) {
    std::string key(io::detail::trim(text));
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return key;
}

} // namespace detail

/// @brief Map user input to an Operation
///
/// Accepts "add", "subtract", "multiply" in any case, or the menu digits
/// "1", "2", "3". Surrounding whitespace is ignored.
[[nodiscard]] inline std::optional<Operation> parse_operation(std::string_view text) {
    const std::string key = detail::normalize_command(text);

    if (key == "add" || key == "1") {
        return Operation::Add;
    }
    if (key == "subtract" || key == "2") {
        return Operation::Subtract;
    }
    if (key == "multiply" || key == "3") {
        return Operation::Multiply;
    }
    return std::nullopt;
}

[[nodiscard]] inline bool is_quit_command(std::string_view text) {
    return detail::normalize_command(text) == "quit";
}

inline SparseMatrix execute(Operation op, const SparseMatrix& a, const SparseMatrix& b,
                            const kernel::arith::ArithOptions& opts = {}) {
    switch (op) {
        case Operation::Add:      return kernel::arith::add(a, b, opts);
        case Operation::Subtract: return kernel::arith::subtract(a, b, opts);
        case Operation::Multiply: return kernel::arith::multiply(a, b, opts);
    }
    throw ValueError("Unknown operation");
}

/// @brief "result_<op>_<basename1>_<basename2>"
[[nodiscard]] inline std::string result_file_name(Operation op, const std::string& file1,
                                                  const std::string& file2) {
    namespace fs = std::filesystem;
    return std::string("result_") + operation_name(op) + "_" +
           fs::path(file1).filename().string() + "_" +
           fs::path(file2).filename().string();
}

// =============================================================================
// Session
// =============================================================================

struct SessionConfig {
    std::string input_dir  = "sample_inputs";
    std::string output_dir = "output";
    std::string file1      = "matrix1.txt";
    std::string file2      = "matrix2.txt";
    io::ParseOptions parse;
    kernel::arith::ArithOptions arith;
};

class Session {
public:
    Session() = default;

    explicit Session(SessionConfig config)
        : config_(std::move(config)) {}

    [[nodiscard]] const SessionConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::string input_path(const std::string& file) const {
        return (std::filesystem::path(config_.input_dir) / file).string();
    }

    [[nodiscard]] std::string output_path(Operation op) const {
        return (std::filesystem::path(config_.output_dir) /
                result_file_name(op, config_.file1, config_.file2)).string();
    }

    /// @brief Load both inputs, apply op, write the result
    /// @return Path of the written result file
    /// @throws Any io:: or kernel:: error; nothing is written on failure
    std::string run(Operation op) const {
        const SparseMatrix a = io::load_file(input_path(config_.file1), config_.parse);
        const SparseMatrix b = io::load_file(input_path(config_.file2), config_.parse);
        const SparseMatrix result = execute(op, a, b, config_.arith);

        io::ensure_directory(config_.output_dir);
        std::string path = output_path(op);
        io::save_file(path, result);
        return path;
    }

private:
    SessionConfig config_;
};

} // namespace smat::app
