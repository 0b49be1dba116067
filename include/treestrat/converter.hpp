// ============================================================================
// treestrat/converter.hpp — End-to-end tree → strategies conversion
// ============================================================================
//
// Chains the stages:
//
//   text ─ parse_tree ─▶ ParsedTree ─ normalize ─▶ BinaryTree
//        ─ enumerate_strategies ─▶ StrategySet ─ render_sorted ─▶ lines
//
// Any ConversionError aborts the whole call.  convert_file() only touches
// the output path after the conversion has succeeded, and writes it
// atomically.
//
// ============================================================================

#ifndef TREESTRAT_CONVERTER_HPP
#define TREESTRAT_CONVERTER_HPP

#include "treestrat/model.hpp"
#include "treestrat/options.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace treestrat {

// ── ConversionResult ────────────────────────────────────────────────────────

struct ConversionResult {
    StrategySet     strategies;
    Diagnostics     diagnostics;
    ConversionStats stats;
};

/// Convert a tree dump held in memory.
ConversionResult convert_tree_to_strategies(std::string_view text,
                                            const ConversionOptions& options);

/// Rendered strategies ("c1 & c2 : v"), sorted bytewise.
std::vector<std::string> render_sorted(const StrategySet& strategies);

/// Read `tree_path`, convert, and write the sorted lines to
/// `strategies_path`.
ConversionResult convert_file(const std::string& tree_path,
                              const std::string& strategies_path,
                              const ConversionOptions& options);

// ── Batch conversion ────────────────────────────────────────────────────────
// Converts every job independently; with OpenMP enabled the jobs run in
// parallel.  A failing job records its error and does not affect others.
// Outcomes are returned in job order.  Two jobs naming the same output path
// are rejected with std::runtime_error before any job runs.

struct BatchJob {
    std::string input;
    std::string output;
};

struct BatchOutcome {
    bool             ok = false;
    std::string      error;
    ConversionResult result;
};

/// num_threads: 0 = OpenMP default, 1 = sequential.
std::vector<BatchOutcome> convert_batch(const std::vector<BatchJob>& jobs,
                                        const ConversionOptions& options,
                                        int num_threads = 0);

}  // namespace treestrat

#endif  // TREESTRAT_CONVERTER_HPP
