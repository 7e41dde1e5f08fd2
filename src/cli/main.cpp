// =============================================================================
// FILE: src/cli/main.cpp
// BRIEF: Interactive front end: pick an operation, combine two matrix files
// =============================================================================

#include "smat/smat.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr int EXIT_USAGE = 2;

constexpr const char* PROMPT =
    "Select operation (add/subtract/multiply) or 'quit' to exit: ";

struct CliOptions {
    smat::app::SessionConfig session;
    std::size_t threads = 0;    // 0 = hardware concurrency
};

void print_help(const char* prog_name) {
    std::printf(R"(Usage: %s [options]

Reads <input-dir>/<file1> and <input-dir>/<file2>, then repeatedly asks for an
operation and writes result_<op>_<file1>_<file2> to <output-dir>.

Options:
  --input-dir <dir>     Directory holding the operands (default: sample_inputs)
  --output-dir <dir>    Directory for results, created if missing (default: output)
  --file1 <name>        Left operand file name (default: matrix1.txt)
  --file2 <name>        Right operand file name (default: matrix2.txt)
  --threads <n>         Worker threads for multiply, 0 = all cores (default: 0)
  --strict-header       Require the literal 'rows=' / 'cols=' header labels
  --overflow <policy>   reject | saturate | wrap (default: reject)
  --help, -h            Show this help message
  --version             Show version information

Environment Variables:
  SMAT_INPUT_DIR        Default for --input-dir
  SMAT_OUTPUT_DIR       Default for --output-dir
  SMAT_NUM_THREADS      Default for --threads

)", prog_name);
}

void print_version() {
    std::printf("smat %s (%s, %s backend)\n", SMAT_VERSION_STRING,
                smat::VALUE_DTYPE_NAME, smat::threading::Scheduler::backend_name());
}

bool parse_thread_count(const char* text, std::size_t& out) {
    const std::string_view s(text);
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

bool parse_overflow_policy(const char* text, smat::OverflowPolicy& out) {
    for (auto p : {smat::OverflowPolicy::Reject, smat::OverflowPolicy::Saturate,
                   smat::OverflowPolicy::Wrap}) {
        if (std::strcmp(text, smat::overflow_policy_name(p)) == 0) {
            out = p;
            return true;
        }
    }
    return false;
}

// Returns -1 to continue, otherwise the process exit code
int parse_args(int argc, char* argv[], CliOptions& opts) {
    auto& cfg = opts.session;

    // Environment first, flags override
    if (const char* env = std::getenv("SMAT_INPUT_DIR")) {
        cfg.input_dir = env;
    }
    if (const char* env = std::getenv("SMAT_OUTPUT_DIR")) {
        cfg.output_dir = env;
    }
    if (const char* env = std::getenv("SMAT_NUM_THREADS")) {
        if (!parse_thread_count(env, opts.threads)) {
            std::fprintf(stderr, "WARNING: ignoring invalid SMAT_NUM_THREADS='%s'\n", env);
            opts.threads = 0;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_help(argv[0]);
            return EXIT_SUCCESS;
        }
        else if (std::strcmp(arg, "--version") == 0) {
            print_version();
            return EXIT_SUCCESS;
        }
        else if (std::strcmp(arg, "--input-dir") == 0 && i + 1 < argc) {
            cfg.input_dir = argv[++i];
        }
        else if (std::strcmp(arg, "--output-dir") == 0 && i + 1 < argc) {
            cfg.output_dir = argv[++i];
        }
        else if (std::strcmp(arg, "--file1") == 0 && i + 1 < argc) {
            cfg.file1 = argv[++i];
        }
        else if (std::strcmp(arg, "--file2") == 0 && i + 1 < argc) {
            cfg.file2 = argv[++i];
        }
        else if (std::strcmp(arg, "--threads") == 0 && i + 1 < argc) {
            if (!parse_thread_count(argv[++i], opts.threads)) {
                std::fprintf(stderr, "ERROR: --threads expects a non-negative integer, got '%s'\n",
                             argv[i]);
                return EXIT_USAGE;
            }
        }
        else if (std::strcmp(arg, "--strict-header") == 0) {
            cfg.parse.header_mode = smat::io::HeaderMode::Strict;
        }
        else if (std::strcmp(arg, "--overflow") == 0 && i + 1 < argc) {
            if (!parse_overflow_policy(argv[++i], cfg.arith.overflow)) {
                std::fprintf(stderr, "ERROR: --overflow expects reject, saturate or wrap, got '%s'\n",
                             argv[i]);
                return EXIT_USAGE;
            }
        }
        else {
            std::fprintf(stderr, "ERROR: Unknown or incomplete option: %s\n", arg);
            std::fprintf(stderr, "Use --help for usage information\n");
            return EXIT_USAGE;
        }
    }
    return -1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (const int rc = parse_args(argc, argv, opts); rc >= 0) {
        return rc;
    }

    smat::threading::Scheduler::init(opts.threads);
    const smat::app::Session session(opts.session);

    try {
        smat::io::ensure_directory(session.config().output_dir);
    } catch (const smat::Exception& e) {
        std::fprintf(stderr, "ERROR: %s\n", e.what());
        return EXIT_FAILURE;
    }

    std::string line;
    for (;;) {
        std::printf("%s", PROMPT);
        std::fflush(stdout);

        if (!std::getline(std::cin, line)) {
            std::printf("\n");
            break;
        }
        if (smat::app::is_quit_command(line)) {
            break;
        }

        const auto op = smat::app::parse_operation(line);
        if (!op) {
            std::printf("Invalid operation. Please try again.\n");
            continue;
        }

        try {
            const std::string path = session.run(*op);
            std::printf("Operation completed. Result written to %s\n", path.c_str());
        } catch (const smat::Exception& e) {
            std::fprintf(stderr, "ERROR: %s\n", e.what());
        } catch (const std::exception& e) {
            std::fprintf(stderr, "ERROR: %s\n", e.what());
        }
    }

    return EXIT_SUCCESS;
}
