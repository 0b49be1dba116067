// ============================================================================
// converter.cpp — End-to-end tree → strategies conversion
// ============================================================================

#include "treestrat/converter.hpp"
#include "treestrat/enumeration.hpp"
#include "treestrat/normalization.hpp"
#include "treestrat/parser.hpp"
#include "treestrat/utils.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

#ifdef TREESTRAT_USE_OPENMP
#include <omp.h>
#endif

namespace treestrat {

// ── convert_tree_to_strategies ──────────────────────────────────────────────

ConversionResult convert_tree_to_strategies(std::string_view text,
                                            const ConversionOptions& options) {
    ConversionResult result;

    ParsedTree tree = parse_tree(text, result.diagnostics);

    ConversionStats& stats = result.stats;
    stats.entries = static_cast<std::uint32_t>(tree.size());
    stats.blank_lines = tree.blank_lines;
    for (const auto& kv : tree.entries) {
        const TreeEntry& entry = kv.second;
        switch (entry.kind) {
            case EntryKind::Leaf:
                ++stats.leaves;
                break;
            case EntryKind::Node:
                ++stats.nodes;
                if (entry.node.is_or()) ++stats.or_nodes;
                break;
        }
    }

    BinaryTree binary = normalize(tree, options);
    result.strategies = enumerate_strategies(binary, options,
                                             result.diagnostics, stats);
    return result;
}

// ── render_sorted ───────────────────────────────────────────────────────────

std::vector<std::string> render_sorted(const StrategySet& strategies) {
    std::vector<std::string> lines;
    lines.reserve(strategies.size());
    for (const auto& s : strategies) {
        lines.push_back(s.to_string());
    }
    std::sort(lines.begin(), lines.end());
    return lines;
}

// ── convert_file ────────────────────────────────────────────────────────────

ConversionResult convert_file(const std::string& tree_path,
                              const std::string& strategies_path,
                              const ConversionOptions& options) {
    const std::string text = read_file(tree_path);
    ConversionResult result = convert_tree_to_strategies(text, options);
    write_lines_atomic(strategies_path, render_sorted(result.strategies));
    return result;
}

// ── convert_batch ───────────────────────────────────────────────────────────
// Each iteration owns its outcome slot and its output file; nothing else is
// shared.  Exceptions must not leave an OpenMP region, so each one is stored
// in its slot.

static void check_distinct_outputs(const std::vector<BatchJob>& jobs) {
    std::unordered_map<std::string, const BatchJob*> seen;
    for (const auto& job : jobs) {
        std::string key =
            std::filesystem::path(job.output).lexically_normal().string();
        auto [it, inserted] = seen.emplace(std::move(key), &job);
        if (!inserted) {
            throw std::runtime_error("'" + it->second->input + "' and '" +
                                     job.input + "' would both write '" +
                                     job.output + "'");
        }
    }
}

std::vector<BatchOutcome> convert_batch(const std::vector<BatchJob>& jobs,
                                        const ConversionOptions& options,
                                        int num_threads) {
    check_distinct_outputs(jobs);

    std::vector<BatchOutcome> outcomes(jobs.size());
    const long n = static_cast<long>(jobs.size());

#ifdef TREESTRAT_USE_OPENMP
    if (num_threads > 0) omp_set_num_threads(num_threads);
    #pragma omp parallel for schedule(dynamic) if(num_threads != 1)
#else
    (void)num_threads;
#endif
    for (long i = 0; i < n; ++i) {
        BatchOutcome& out = outcomes[static_cast<std::size_t>(i)];
        const BatchJob& job = jobs[static_cast<std::size_t>(i)];
        try {
            out.result = convert_file(job.input, job.output, options);
            out.ok = true;
        } catch (const std::exception& e) {
            out.ok = false;
            out.error = job.input + ": " + e.what();
        }
    }

    return outcomes;
}

}  // namespace treestrat
