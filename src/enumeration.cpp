// ============================================================================
// enumeration.cpp — Root-to-leaf path enumeration
// ============================================================================

#include "treestrat/enumeration.hpp"
#include "treestrat/contradiction.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace treestrat {

namespace {

struct Frame {
    Branch                 branch;
    std::vector<Condition> conditions;
};

}  // namespace

StrategySet enumerate_strategies(const BinaryTree& tree,
                                 const ConversionOptions& options,
                                 Diagnostics& diagnostics,
                                 ConversionStats& stats) {
    StrategySet strategies;
    if (!tree) return strategies;

    std::optional<ContradictionFilter> filter;
    if (options.ignore_always_false) {
        filter.emplace(options.backend);
    }

    std::vector<Frame> stack;
    stack.push_back(Frame{Branch::make_split(tree), {}});

    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();

        switch (frame.branch.kind) {
            case BranchKind::Redundant:
                ++stats.redundant_pruned;
                break;

            case BranchKind::Leaf: {
                ++stats.paths;
                Strategy strategy{std::move(frame.conditions), frame.branch.leaf};

                if (filter) {
                    FilterVerdict verdict = filter->check(strategy);
                    if (verdict.always_false) {
                        ++stats.always_false;
                        std::string msg = "Always false strategy: " + strategy.to_string();
                        if (verdict.conflict) {
                            msg += " for " + verdict.conflict->to_string();
                        }
                        diagnostics.push_back({Severity::Debug, std::move(msg)});
                        break;
                    }
                    if (verdict.undecided) {
                        diagnostics.push_back({Severity::Warning,
                                               "Solver could not decide " +
                                               strategy.to_string() + ", keeping it"});
                    }
                }

                if (!strategies.insert(std::move(strategy)).second) {
                    ++stats.duplicates;
                }
                break;
            }

            case BranchKind::Split: {
                // Pushed in reverse so the first split's true side pops first.
                const auto& splits = frame.branch.node->splits;
                for (auto it = splits.rbegin(); it != splits.rend(); ++it) {
                    std::vector<Condition> on_false = frame.conditions;
                    on_false.push_back(it->condition.negated());
                    stack.push_back(Frame{it->when_false, std::move(on_false)});

                    std::vector<Condition> on_true = frame.conditions;
                    on_true.push_back(it->condition);
                    stack.push_back(Frame{it->when_true, std::move(on_true)});
                }
                break;
            }
        }
    }

    stats.strategies = static_cast<std::uint32_t>(strategies.size());
    return strategies;
}

}  // namespace treestrat
