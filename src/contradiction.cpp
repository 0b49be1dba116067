// ============================================================================
// contradiction.cpp — Always-false strategy detection
// ============================================================================
//
// Grouping by feature keeps the quadratic pair search to conditions that
// can actually interact.  Real trees test each feature only a few times per
// path.
//
// ============================================================================

#include "treestrat/contradiction.hpp"
#include "treestrat/z3_solver.hpp"

#include <unordered_map>

namespace treestrat {

// ── ConditionConflict ───────────────────────────────────────────────────────

std::string ConditionConflict::to_string() const {
    return first.to_string() + " and " + second.to_string();
}

// ── conflicts ───────────────────────────────────────────────────────────────

bool conflicts(const Condition& a, const Condition& b) noexcept {
    if (a.feature != b.feature) return false;

    const bool equal_on_different_values =
        a.is_equal && b.is_equal && a.value != b.value;
    const bool equal_and_negated_on_same_value =
        a.is_equal != b.is_equal && a.value == b.value;
    return equal_on_different_values || equal_and_negated_on_same_value;
}

// ── find_contradiction ──────────────────────────────────────────────────────

std::optional<ConditionConflict>
find_contradiction(const std::vector<Condition>& conditions) {
    std::vector<std::vector<const Condition*>> groups;
    std::unordered_map<std::string, std::size_t> group_of;
    for (const auto& c : conditions) {
        auto [it, inserted] = group_of.emplace(c.feature, groups.size());
        if (inserted) groups.emplace_back();
        groups[it->second].push_back(&c);
    }

    for (const auto& group : groups) {
        if (group.size() < 2) continue;
        for (std::size_t i = 0; i < group.size(); ++i) {
            for (std::size_t j = i + 1; j < group.size(); ++j) {
                if (conflicts(*group[i], *group[j])) {
                    return ConditionConflict{*group[i], *group[j]};
                }
            }
        }
    }
    return std::nullopt;
}

// ── ContradictionFilter ─────────────────────────────────────────────────────

ContradictionFilter::ContradictionFilter(SatBackend backend) : backend_(backend) {
    if (backend_ == SatBackend::Z3) {
        z3_ = std::make_unique<Z3Checker>();
    }
}

ContradictionFilter::~ContradictionFilter() = default;

FilterVerdict ContradictionFilter::check(const Strategy& strategy) {
    FilterVerdict verdict;

    switch (backend_) {
        case SatBackend::Pairwise:
            verdict.conflict = find_contradiction(strategy.conditions);
            verdict.always_false = verdict.conflict.has_value();
            break;

        case SatBackend::Z3: {
            Z3Result r = z3_->check_conditions(strategy.conditions);
            if (r == Z3Result::UNSAT) {
                verdict.always_false = true;
                verdict.conflict = find_contradiction(strategy.conditions);
            } else if (r == Z3Result::UNKNOWN) {
                verdict.undecided = true;
            }
            break;
        }
    }
    return verdict;
}

}  // namespace treestrat
