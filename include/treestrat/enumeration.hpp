// ============================================================================
// treestrat/enumeration.hpp — Root-to-leaf path enumeration
// ============================================================================
//
// Walks a BinaryTree depth-first and emits one Strategy per Leaf reached.
// Following the true side of a split on C appends C, the false side appends
// C.negated().  Redundant branches end the path silently.
//
// Traversal uses an explicit stack, visits splits in declaration order and
// the true side before the false side, so diagnostics come out in the same
// order on every run.
//
// When ConversionOptions::ignore_always_false is set, every candidate is
// passed through a ContradictionFilter and unsatisfiable ones are dropped
// with a Debug diagnostic.
//
// ============================================================================

#ifndef TREESTRAT_ENUMERATION_HPP
#define TREESTRAT_ENUMERATION_HPP

#include "treestrat/model.hpp"
#include "treestrat/normalization.hpp"
#include "treestrat/options.hpp"

namespace treestrat {

StrategySet enumerate_strategies(const BinaryTree& tree,
                                 const ConversionOptions& options,
                                 Diagnostics& diagnostics,
                                 ConversionStats& stats);

}  // namespace treestrat

#endif  // TREESTRAT_ENUMERATION_HPP
