// ============================================================================
// treestrat/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver: read tree file(s) → convert → write sorted strategies file(s).
//
// ============================================================================

#ifndef TREESTRAT_CLI_HPP
#define TREESTRAT_CLI_HPP

#include "treestrat/converter.hpp"
#include "treestrat/options.hpp"

#include <string>
#include <vector>

namespace treestrat {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string              input;          // single mode: tree file
    std::string              output;         // single mode: strategies file
    std::string              batch_dir;      // batch mode: output directory
    std::vector<std::string> batch_inputs;   // batch mode: tree files
    bool                     batch      = false;
    bool                     selftest   = false;
    bool                     show_stats = false;
    bool                     verbose    = false;
    bool                     help       = false;
    int                      num_threads = 0; // OpenMP threads (0 = default)
    ConversionOptions        conversion;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// One job per input, writing `<out_dir>/<stem>.strategies.txt`.
std::vector<BatchJob> make_batch_jobs(const std::string& out_dir,
                                      const std::vector<std::string>& inputs);

/// Main driver.  Returns the process exit code (0 = ok, 1 = errors).
int run(const Options& opts);

}  // namespace treestrat

#endif  // TREESTRAT_CLI_HPP
