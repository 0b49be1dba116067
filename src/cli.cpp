// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "treestrat/cli.hpp"
#include "treestrat/converter.hpp"
#include "treestrat/test.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace treestrat {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--keep-always-false") {
            opts.conversion.ignore_always_false = false;
        } else if (arg == "--solver") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--solver requires an argument (pairwise or z3)");
            }
            opts.conversion.backend = parse_sat_backend(argv[++i]);
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--max-depth requires a number argument");
            }
            int depth = std::stoi(argv[++i]);
            if (depth <= 0) {
                throw std::runtime_error("--max-depth must be > 0");
            }
            opts.conversion.max_depth = static_cast<std::size_t>(depth);
        } else if (arg == "--batch") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--batch requires an output directory argument");
            }
            opts.batch = true;
            opts.batch_dir = argv[++i];
        } else if (arg == "--threads" || arg == "-j") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--threads requires a number argument");
            }
            opts.num_threads = std::stoi(argv[++i]);
            if (opts.num_threads < 0) {
                throw std::runtime_error("--threads must be >= 0");
            }
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (opts.selftest || opts.help) {
        return opts;
    }

    if (opts.batch) {
        if (positional.empty()) {
            throw std::runtime_error("--batch needs at least one tree file");
        }
        opts.batch_inputs = std::move(positional);
    } else {
        if (positional.size() != 2) {
            throw std::runtime_error("expected <tree.txt> <strategies.txt> (use --help for usage)");
        }
        opts.input = positional[0];
        opts.output = positional[1];
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] <tree.txt> <strategies.txt>\n"
        << "       " << program_name << " [OPTIONS] --batch <out_dir> <tree.txt>...\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Converts a dumped decision tree into a sorted list of strategies,\n"
        << "one per reachable leaf: 'cond1 & cond2 & ... : value'.\n"
        << "\n"
        << "Options:\n"
        << "  --batch <dir>        Convert every tree file into <dir>/<stem>.strategies.txt\n"
        << "  --keep-always-false  Keep strategies whose conditions contradict each other\n"
        << "  --solver <name>      Contradiction check: pairwise (default) or z3\n"
        << "  --max-depth N        Reject trees nested deeper than N nodes (default 10000)\n"
        << "  --threads N, -j N    OpenMP threads for --batch (0 = auto, default)\n"
        << "  --stats              Show conversion statistics\n"
        << "  --verbose, -v        Print debug diagnostics (skipped lines, dropped strategies)\n"
        << "  --selftest           Run built-in tests\n"
        << "  --help, -h           Show this message\n"
        << "\n"
        << "Input format (one entry per line, blank lines ignored):\n"
        << "  <id>:leaf=<value in [0,1]>\n"
        << "  <id>:[feature=value] yes=<id>,no=<id>\n"
        << "  <id>:[f1=v1||or||f2!=v2] yes=<id>,no=<id>\n";
}

// ── report ──────────────────────────────────────────────────────────────────
// Diagnostics go to stderr; Debug only with --verbose.

static void report(const Options& opts, const std::string& input,
                   const std::string& output, const ConversionResult& result) {
    for (const auto& d : result.diagnostics) {
        if (opts.verbose || d.severity == Severity::Warning) {
            std::cerr << severity_name(d.severity) << ": " << d.message << "\n";
        }
    }

    std::cout << input << ": " << result.strategies.size()
              << " strategies -> " << output << "\n";

    if (opts.show_stats) {
        std::cout << "  Stats: solver="
                  << (opts.conversion.ignore_always_false
                          ? sat_backend_name(opts.conversion.backend)
                          : "off")
                  << " " << result.stats.to_string() << "\n";
    }
}

// ── make_batch_jobs ─────────────────────────────────────────────────────────

std::vector<BatchJob> make_batch_jobs(const std::string& out_dir,
                                      const std::vector<std::string>& inputs) {
    std::vector<BatchJob> jobs;
    jobs.reserve(inputs.size());
    for (const auto& input : inputs) {
        std::filesystem::path out = std::filesystem::path(out_dir) /
            (std::filesystem::path(input).stem().string() + ".strategies.txt");
        jobs.push_back(BatchJob{input, out.string()});
    }
    return jobs;
}

// ── run ─────────────────────────────────────────────────────────────────────

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }

    if (!opts.batch) {
        try {
            ConversionResult result =
                convert_file(opts.input, opts.output, opts.conversion);
            report(opts, opts.input, opts.output, result);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << opts.input << ": " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    // ── Batch mode ──────────────────────────────────────────────────────
    std::filesystem::create_directories(opts.batch_dir);
    if (!std::filesystem::is_directory(opts.batch_dir)) {
        throw std::runtime_error("output path is not a directory: " + opts.batch_dir);
    }

    const std::vector<BatchJob> jobs = make_batch_jobs(opts.batch_dir, opts.batch_inputs);

    std::vector<BatchOutcome> outcomes;
    try {
        outcomes = convert_batch(jobs, opts.conversion, opts.num_threads);
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    bool had_errors = false;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].ok) {
            report(opts, jobs[i].input, jobs[i].output, outcomes[i].result);
        } else {
            std::cerr << "ERROR: " << outcomes[i].error << "\n";
            had_errors = true;
        }
    }

    return had_errors ? 1 : 0;
}

}  // namespace treestrat
