// ============================================================================
// treestrat/model.hpp — Value types shared by every conversion stage
// ============================================================================
//
// Design notes:
//
//   All types here have value semantics and are never mutated once built.
//   Equality is structural.  Condition and Strategy come with hash functors
//   so they can key unordered containers; a StrategySet collapses
//   structurally identical strategies.
//
//   Condition : feature (in)equality test   "device_type=pc" / "os!=linux"
//   Leaf      : terminal value in [0, 1]
//   Node      : one condition, or an OR of two, plus yes/no branch ids
//   Strategy  : conjunction of conditions leading to a leaf
//
// ============================================================================

#ifndef TREESTRAT_MODEL_HPP
#define TREESTRAT_MODEL_HPP

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace treestrat {

// ── Condition ───────────────────────────────────────────────────────────────

struct Condition {
    std::string feature;
    std::string value;
    bool        is_equal = true;

    /// Same feature and value with the operator flipped.
    Condition negated() const;

    /// "feature=value" or "feature!=value".
    std::string to_string() const;

    bool operator==(const Condition& o) const noexcept {
        return is_equal == o.is_equal && feature == o.feature && value == o.value;
    }
    bool operator!=(const Condition& o) const noexcept { return !(*this == o); }
};

struct ConditionHash {
    std::size_t operator()(const Condition& c) const noexcept;
};

// ── Leaf ────────────────────────────────────────────────────────────────────
// Constructor throws ConversionError(InvalidLeafValue) outside [0, 1].
// Values compare exactly; there is no epsilon.

class Leaf {
public:
    explicit Leaf(double value);

    double value() const noexcept { return value_; }

    /// Shortest round-trip decimal, e.g. "0.1", "1.0", "1e-05".
    std::string to_string() const;

    bool operator==(const Leaf& o) const noexcept { return value_ == o.value_; }
    bool operator!=(const Leaf& o) const noexcept { return value_ != o.value_; }

private:
    double value_;
};

// ── Node ────────────────────────────────────────────────────────────────────
// eligible_conditions holds 1 entry (plain test) or 2 entries (OR of both).
// yes / no are identifiers of other entries in the same ParsedTree.

struct Node {
    std::vector<Condition> eligible_conditions;
    std::string            yes;
    std::string            no;

    bool is_or() const noexcept { return eligible_conditions.size() == 2; }

    bool operator==(const Node& o) const noexcept {
        return eligible_conditions == o.eligible_conditions &&
               yes == o.yes && no == o.no;
    }
};

// ── Strategy ────────────────────────────────────────────────────────────────
// One root-to-leaf path.  Conditions keep traversal order; equality is
// order-sensitive.

struct Strategy {
    std::vector<Condition> conditions;
    Leaf                   value;

    /// "c1 & c2 & ... : value"
    std::string to_string() const;

    bool operator==(const Strategy& o) const noexcept {
        return value == o.value && conditions == o.conditions;
    }
};

struct StrategyHash {
    std::size_t operator()(const Strategy& s) const noexcept;
};

using StrategySet = std::unordered_set<Strategy, StrategyHash>;

}  // namespace treestrat

#endif  // TREESTRAT_MODEL_HPP
