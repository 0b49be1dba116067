// ============================================================================
// treestrat/z3_solver.hpp — Z3 wrapper for condition conjunctions
// ============================================================================
//
// Decides whether a conjunction of feature (in)equality conditions can hold.
//
// Encoding:
//   - one uninterpreted sort `Value`
//   - every feature becomes a constant of sort Value
//   - every value literal becomes a constant of sort Value, and the literals
//     used by one query are asserted pairwise distinct
//   - feature=value  →  (= f v),  feature!=value  →  (not (= f v))
//
// Value has no cardinality bound, so any number of inequalities on one
// feature stays satisfiable, matching the pairwise filter.
//
// Usage:
//   Z3Checker checker;
//   if (checker.check_conditions(strategy.conditions) == Z3Result::UNSAT) ...
//
// ============================================================================

#ifndef TREESTRAT_Z3_SOLVER_HPP
#define TREESTRAT_Z3_SOLVER_HPP

#include "treestrat/model.hpp"

#include <z3++.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace treestrat {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

// ── Z3Checker ───────────────────────────────────────────────────────────────
// Owns a Z3 context; not thread-safe, use one per thread.

class Z3Checker {
public:
    Z3Checker();

    /// Assert one condition on the current solver scope.
    void add_condition(const Condition& c);

    /// Check satisfiability of everything asserted so far.
    Z3Result check();

    /// Check a conjunction in a temporary scope; the solver is left as it
    /// was before the call.
    Z3Result check_conditions(const std::vector<Condition>& conditions);

    /// Drop all assertions and cached constants.
    void reset();

private:
    z3::expr feature_var(const std::string& feature);
    z3::expr value_const(const std::string& value);

    z3::context ctx_;
    z3::sort    value_sort_;
    z3::solver  solver_;

    std::unordered_map<std::string, std::unique_ptr<z3::expr>> features_;
    std::unordered_map<std::string, std::unique_ptr<z3::expr>> values_;
};

}  // namespace treestrat

#endif  // TREESTRAT_Z3_SOLVER_HPP
