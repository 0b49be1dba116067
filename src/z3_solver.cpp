// ============================================================================
// z3_solver.cpp — Implementation of the Z3 condition checker
// ============================================================================

#include "treestrat/z3_solver.hpp"

#include <stdexcept>
#include <unordered_set>

namespace treestrat {

// ── Z3Checker ───────────────────────────────────────────────────────────────

Z3Checker::Z3Checker()
    : ctx_(), value_sort_(ctx_.uninterpreted_sort("Value")), solver_(ctx_) {}

void Z3Checker::reset() {
    solver_.reset();
    features_.clear();
    values_.clear();
}

// Names are prefixed so a feature and a value spelled alike stay distinct.

z3::expr Z3Checker::feature_var(const std::string& feature) {
    auto it = features_.find(feature);
    if (it != features_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(
        ctx_.constant(("f!" + feature).c_str(), value_sort_));
    z3::expr result = *var;
    features_[feature] = std::move(var);
    return result;
}

z3::expr Z3Checker::value_const(const std::string& value) {
    auto it = values_.find(value);
    if (it != values_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(
        ctx_.constant(("v!" + value).c_str(), value_sort_));
    z3::expr result = *var;
    values_[value] = std::move(var);
    return result;
}

void Z3Checker::add_condition(const Condition& c) {
    z3::expr eq = feature_var(c.feature) == value_const(c.value);
    if (c.is_equal) {
        solver_.add(eq);
    } else {
        solver_.add(!eq);
    }
}

Z3Result Z3Checker::check() {
    try {
        switch (solver_.check()) {
            case z3::sat:     return Z3Result::SAT;
            case z3::unsat:   return Z3Result::UNSAT;
            case z3::unknown: return Z3Result::UNKNOWN;
        }
    } catch (const z3::exception& e) {
        throw std::runtime_error(std::string("z3 error: ") + e.msg());
    }
    return Z3Result::UNKNOWN;
}

Z3Result Z3Checker::check_conditions(const std::vector<Condition>& conditions) {
    solver_.push();

    z3::expr_vector literals(ctx_);
    std::unordered_set<std::string> seen;
    for (const auto& c : conditions) {
        add_condition(c);
        if (seen.insert(c.value).second) {
            literals.push_back(value_const(c.value));
        }
    }
    if (literals.size() >= 2) {
        solver_.add(z3::distinct(literals));
    }

    Z3Result result = Z3Result::UNKNOWN;
    try {
        result = check();
    } catch (const std::exception&) {
        solver_.pop();
        throw;
    }
    solver_.pop();
    return result;
}

}  // namespace treestrat
