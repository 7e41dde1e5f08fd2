#pragma once

#include "smat/config.hpp"
#include "smat/core/type.hpp"
#include "smat/core/sparse.hpp"
#include "smat/core/error.hpp"
#include "smat/core/macros.hpp"

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

// =============================================================================
/// @file text.hpp
/// @brief Plain-text codec for SparseMatrix
///
/// Format:
///   rows=<integer>
///   cols=<integer>
///   (<row>, <col>, <value>)
///   ...
///
/// Blank data lines are skipped. Any other line that is not an entry fails
/// the whole parse; no partial matrix is ever returned.
// =============================================================================

namespace smat::io {

enum class HeaderMode {
    Tolerant,   // text before '=' is ignored
    Strict      // label must be exactly "rows" / "cols"
};

struct ParseOptions {
    HeaderMode header_mode = HeaderMode::Tolerant;
};

namespace detail {

constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

inline std::string_view trim_left(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(WHITESPACE);
    return first == std::string_view::npos ? std::string_view{} : s.substr(first);
}

inline std::string_view trim(std::string_view s) noexcept {
    s = trim_left(s);
    const auto last = s.find_last_not_of(WHITESPACE);
    return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
}

enum class IntStatus { Ok, Malformed, OutOfRange };

// Whole-token decimal parse; no sign unless allow_negative, no '+', no spaces
template <typename Int>
inline IntStatus parse_int(std::string_view s, bool allow_negative, Int& out) noexcept {
    if (s.empty()) {
        return IntStatus::Malformed;
    }
    if (s.front() == '-' && !allow_negative) {
        return IntStatus::Malformed;
    }
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec == std::errc::result_out_of_range) {
        return IntStatus::OutOfRange;
    }
    if (ec != std::errc() || ptr != last) {
        return IntStatus::Malformed;
    }
    return IntStatus::Ok;
}

inline std::string line_prefix(Size line_no) {
    return "line " + std::to_string(line_no) + ": ";
}

// Splits text on '\n'; a trailing newline does not produce an extra line
class LineReader {
public:
    explicit LineReader(std::string_view text) noexcept : text_(text) {}

    bool next(std::string_view& line) noexcept {
        if (pos_ >= text_.size()) {
            return false;
        }
        const auto nl = text_.find('\n', pos_);
        const auto end = (nl == std::string_view::npos) ? text_.size() : nl;
        line = text_.substr(pos_, end - pos_);
        pos_ = end + 1;
        ++line_no_;
        return true;
    }

    [[nodiscard]] Size line_no() const noexcept { return line_no_; }

private:
    std::string_view text_;
    Size pos_ = 0;
    Size line_no_ = 0;
};

inline Index parse_header(std::string_view raw, std::string_view label,
                          Size line_no, HeaderMode mode) {
    const std::string expected = std::string(label) + "=<integer>";
    const auto eq = raw.find('=');
    SMAT_CHECK_FORMAT(eq != std::string_view::npos,
        line_prefix(line_no) + "expected '" + expected + "', got '" + std::string(raw) + "'");

    if (mode == HeaderMode::Strict) {
        SMAT_CHECK_FORMAT(trim(raw.substr(0, eq)) == label,
            line_prefix(line_no) + "expected label '" + std::string(label) +
            "', got '" + std::string(trim(raw.substr(0, eq))) + "'");
    }

    const auto number = trim(raw.substr(eq + 1));
    Index value = 0;
    const auto status = parse_int(number, false, value);
    SMAT_CHECK_FORMAT(status != IntStatus::OutOfRange,
        line_prefix(line_no) + std::string(label) + " count out of range: '" +
        std::string(number) + "'");
    SMAT_CHECK_FORMAT(status == IntStatus::Ok,
        line_prefix(line_no) + "expected '" + expected + "', got '" + std::string(raw) + "'");
    return value;
}

// Entry grammar: '(' row ',' ws* col ',' ws* ['-'] value ')'
inline Triplet parse_entry(std::string_view line, Size line_no) {
    auto malformed = [&]() {
        return FormatError(line_prefix(line_no) + "Input file has wrong format: '" +
                           std::string(line) + "'");
    };

    if (line.size() < 2 || line.front() != '(' || line.back() != ')') {
        throw malformed();
    }
    const auto inner = line.substr(1, line.size() - 2);

    const auto c1 = inner.find(',');
    if (c1 == std::string_view::npos) {
        throw malformed();
    }
    const auto c2 = inner.find(',', c1 + 1);
    if (c2 == std::string_view::npos || inner.find(',', c2 + 1) != std::string_view::npos) {
        throw malformed();
    }

    const auto row_tok = inner.substr(0, c1);
    const auto col_tok = trim_left(inner.substr(c1 + 1, c2 - c1 - 1));
    const auto val_tok = trim_left(inner.substr(c2 + 1));

    Triplet t{};
    const IntStatus statuses[] = {
        parse_int(row_tok, false, t.row),
        parse_int(col_tok, false, t.col),
        parse_int(val_tok, true, t.value),
    };
    for (auto s : statuses) {
        if (s == IntStatus::OutOfRange) {
            throw FormatError(line_prefix(line_no) + "number out of range in '" +
                              std::string(line) + "'");
        }
        if (s != IntStatus::Ok) {
            throw malformed();
        }
    }
    return t;
}

struct FileCloser {
    void operator()(std::FILE* f) const noexcept {
        if (f) {
            std::fclose(f);
        }
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

} // namespace detail

// =============================================================================
// Codec
// =============================================================================

/// @brief Parse the text form of a matrix
///
/// Duplicate coordinates resolve last-write-wins; an explicit 0 removes the
/// coordinate.
///
/// @throws FormatError on a missing/non-numeric header or malformed entry
/// @throws RangeError on an entry outside the declared shape
inline SparseMatrix parse(std::string_view text, const ParseOptions& opts = {}) {
    detail::LineReader reader(text);
    std::string_view line;

    SMAT_CHECK_FORMAT(reader.next(line), "line 1: missing 'rows=<integer>' header");
    const Index rows = detail::parse_header(line, "rows", reader.line_no(), opts.header_mode);

    SMAT_CHECK_FORMAT(reader.next(line), "line 2: missing 'cols=<integer>' header");
    const Index cols = detail::parse_header(line, "cols", reader.line_no(), opts.header_mode);

    SparseMatrix m(rows, cols);

    while (reader.next(line)) {
        const auto trimmed = detail::trim(line);
        if (trimmed.empty()) {
            continue;
        }
        const Triplet t = detail::parse_entry(trimmed, reader.line_no());
        try {
            m.set(t.row, t.col, t.value);
        } catch (const RangeError& e) {
            throw RangeError(detail::line_prefix(reader.line_no()) + e.message());
        }
    }

    return m;
}

/// @brief Text form of a matrix, entries in row-major ascending order
[[nodiscard]] inline std::string serialize(const SparseMatrix& m) {
    std::string out;
    out.reserve(32 + m.nnz() * 24);

    out += "rows=";
    out += std::to_string(m.rows());
    out += "\ncols=";
    out += std::to_string(m.cols());
    out += '\n';

    for (const auto& [coord, value] : m) {
        out += '(';
        out += std::to_string(coord.row);
        out += ", ";
        out += std::to_string(coord.col);
        out += ", ";
        out += std::to_string(value);
        out += ")\n";
    }
    return out;
}

// =============================================================================
// File Helpers
// =============================================================================

/// @brief Read a whole file into memory
inline std::string read_text_file(const std::string& path) {
    detail::FilePtr file(std::fopen(path.c_str(), "rb"));
    if (!file) {
        if (errno == ENOENT) {
            throw FileNotFoundError(path);
        }
        throw ReadError("Failed to open " + path + ": " + std::strerror(errno));
    }

    std::string text;
    std::string chunk(config::READ_CHUNK_SIZE, '\0');
    for (;;) {
        const Size n = std::fread(chunk.data(), 1, chunk.size(), file.get());
        text.append(chunk.data(), n);
        if (n < chunk.size()) {
            break;
        }
    }
    if (std::ferror(file.get())) {
        throw ReadError("Failed to read " + path);
    }
    return text;
}

/// @brief Write text to a file, replacing existing content
inline void write_text_file(const std::string& path, std::string_view text) {
    std::FILE* raw = std::fopen(path.c_str(), "wb");
    if (!raw) {
        throw WriteError("Failed to create " + path + ": " + std::strerror(errno));
    }
    detail::FilePtr file(raw);

    if (std::fwrite(text.data(), 1, text.size(), file.get()) != text.size()) {
        throw WriteError("Failed to write " + path);
    }
    // Close explicitly so a failed flush is reported
    if (std::fclose(file.release()) != 0) {
        throw WriteError("Failed to close " + path);
    }
}

/// @throws FileNotFoundError, ReadError, FormatError, RangeError
inline SparseMatrix load_file(const std::string& path, const ParseOptions& opts = {}) {
    const std::string text = read_text_file(path);
    try {
        return parse(text, opts);
    } catch (const FormatError& e) {
        throw FormatError(path + ": " + e.message());
    } catch (const RangeError& e) {
        throw RangeError(path + ": " + e.message());
    }
}

/// @throws WriteError
inline void save_file(const std::string& path, const SparseMatrix& m) {
    write_text_file(path, serialize(m));
}

/// @brief Create a directory and its parents if missing
/// @throws IOError if creation fails or the path is not a directory
inline void ensure_directory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw IOError("Failed to create directory " + path + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(path, ec)) {
        throw IOError("Not a directory: " + path);
    }
}

} // namespace smat::io
