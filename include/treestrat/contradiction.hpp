// ============================================================================
// treestrat/contradiction.hpp — Always-false strategy detection
// ============================================================================
//
// A strategy is always false when its conditions cannot hold together.
// Conditions only interact when they test the same feature; two of them
// conflict when
//
//   feature=a  and  feature=b     with a != b
//   feature=a  and  feature!=a
//
// Any number of inequalities on distinct values (x!=a, x!=b, ...) can hold
// at the same time and never conflict.
//
// ContradictionFilter runs either the pairwise search above or the Z3
// encoding from z3_solver.hpp, depending on SatBackend.
//
// ============================================================================

#ifndef TREESTRAT_CONTRADICTION_HPP
#define TREESTRAT_CONTRADICTION_HPP

#include "treestrat/model.hpp"
#include "treestrat/options.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace treestrat {

class Z3Checker;

// ── ConditionConflict ───────────────────────────────────────────────────────

struct ConditionConflict {
    Condition first;
    Condition second;

    std::string to_string() const;
};

/// True when `a` and `b` can never hold together.
bool conflicts(const Condition& a, const Condition& b) noexcept;

/// First conflicting pair, grouping by feature in order of first
/// appearance.  nullopt when the conjunction is satisfiable.
std::optional<ConditionConflict>
find_contradiction(const std::vector<Condition>& conditions);

// ── FilterVerdict ───────────────────────────────────────────────────────────

struct FilterVerdict {
    bool                             always_false = false;
    bool                             undecided    = false;  // Z3 said unknown
    std::optional<ConditionConflict> conflict;
};

// ── ContradictionFilter ─────────────────────────────────────────────────────

class ContradictionFilter {
public:
    explicit ContradictionFilter(SatBackend backend);
    ~ContradictionFilter();

    ContradictionFilter(const ContradictionFilter&) = delete;
    ContradictionFilter& operator=(const ContradictionFilter&) = delete;

    FilterVerdict check(const Strategy& strategy);

private:
    SatBackend                 backend_;
    std::unique_ptr<Z3Checker> z3_;
};

}  // namespace treestrat

#endif  // TREESTRAT_CONTRADICTION_HPP
