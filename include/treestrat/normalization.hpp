// ============================================================================
// treestrat/normalization.hpp — OR elimination into a binary condition-tree
// ============================================================================
//
// The normalizer turns the id-indexed ParsedTree into a tree in which every
// decision is a single-condition binary split.  A BinaryNode holds one or two
// splits; each split sends the "condition true" and "condition false" cases
// to a Branch, which is another BinaryNode, a Leaf, or the Redundant
// sentinel (a path that must not produce a strategy).
//
// Rewrite rules, starting from ParsedTree::root_id:
//
//   leaf                        →   the leaf
//   [C] yes=Y,no=N              →   { C ? Y' : N' }
//   [A||or||B] yes=Y,no=N       →   { A ? Y' : { B ? ~ : N' }
//                                   | B ? Y' : ~ }
//
// where Y', N' are the normalized targets and ~ is Redundant.  The OR form
// follows De Morgan: ¬(A ∨ B) ≡ ¬A ∧ ¬B, so N is reached only through
// (¬A, ¬B).  Y is reached from A alone and from B alone.  The B side under ¬A
// and the ¬B side of the B split would only repeat those paths, hence the
// sentinels.
//
// Y' is built once and shared by both OR splits.
//
// Errors (ConversionError):
//   NodelessTree         root is a leaf, or the tree is empty
//   DanglingReference    a reachable yes/no id has no entry
//   CyclicReference      a yes/no id refers back to an ancestor
//   DepthLimitExceeded   more than ConversionOptions::max_depth nested nodes
//
// ============================================================================

#ifndef TREESTRAT_NORMALIZATION_HPP
#define TREESTRAT_NORMALIZATION_HPP

#include "treestrat/model.hpp"
#include "treestrat/options.hpp"
#include "treestrat/parser.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace treestrat {

struct BinaryNode;

using BinaryTree = std::shared_ptr<const BinaryNode>;

// ── Branch ──────────────────────────────────────────────────────────────────

enum class BranchKind : std::uint8_t {
    Leaf,
    Split,
    Redundant
};

struct Branch {
    BranchKind kind = BranchKind::Redundant;
    Leaf       leaf{0.0};   // kind == Leaf
    BinaryTree node;        // kind == Split

    static Branch make_leaf(Leaf l);
    static Branch make_split(BinaryTree n);
    static Branch redundant();
};

// ── Split / BinaryNode ──────────────────────────────────────────────────────

struct Split {
    Condition condition;
    Branch    when_true;
    Branch    when_false;
};

struct BinaryNode {
    std::vector<Split> splits;   // 1 for a plain node, 2 for an OR node

    BinaryNode() = default;
    BinaryNode(const BinaryNode&) = delete;
    BinaryNode& operator=(const BinaryNode&) = delete;
    ~BinaryNode();
};

// ── Normalizer ──────────────────────────────────────────────────────────────

class Normalizer {
public:
    Normalizer(const ParsedTree& tree, std::size_t max_depth);

    /// Normalize from the root.  Never returns nullptr.
    BinaryTree run();

private:
    // A node whose children are still being built.
    struct Pending {
        const std::string* id;
        const Node*        node;
        std::size_t        depth;
        int                next;    // 0: yes, 1: no, 2: both built
    };

    void enter(const std::string& id, const std::string& referrer,
               std::size_t depth);
    static Branch expand(const Node& node, Branch yes, Branch no);

    const ParsedTree&               tree_;
    std::size_t                     max_depth_;
    std::unordered_set<std::string> on_path_;   // ids of the current ancestors
    std::vector<Pending>            pending_;
    std::vector<Branch>             built_;     // finished subtrees, yes before no
};

/// Convenience wrapper around Normalizer.
BinaryTree normalize(const ParsedTree& tree, const ConversionOptions& options);

// ── Pretty-print ────────────────────────────────────────────────────────────
// "{device_type=pc ? 0.1 : 0.2}"; OR nodes print both splits joined by " | "
// and Redundant prints as "~".

std::string to_string(const BinaryTree& tree);

}  // namespace treestrat

#endif  // TREESTRAT_NORMALIZATION_HPP
