// ============================================================================
// normalization.cpp — OR elimination into a binary condition-tree
// ============================================================================
//
// A single top-down pass over the ParsedTree driven by an explicit work
// stack, so input depth costs heap, not call stack.  max_depth bounds that
// work stack.  The set of ids on the current path detects cycles, which would
// otherwise never terminate.
//
// ============================================================================

#include "treestrat/normalization.hpp"
#include "treestrat/errors.hpp"

#include <utility>
#include <vector>

namespace treestrat {

// ── Branch ──────────────────────────────────────────────────────────────────

Branch Branch::make_leaf(Leaf l) {
    Branch b;
    b.kind = BranchKind::Leaf;
    b.leaf = l;
    return b;
}

Branch Branch::make_split(BinaryTree n) {
    Branch b;
    b.kind = BranchKind::Split;
    b.node = std::move(n);
    return b;
}

Branch Branch::redundant() {
    return Branch{};
}

// ── BinaryNode ──────────────────────────────────────────────────────────────
// Child nodes owned only by this node are detached onto a work list before
// they are released, so tearing down a deep chain stays flat.

BinaryNode::~BinaryNode() {
    std::vector<BinaryTree> pending;
    auto detach = [&pending](std::vector<Split>& from) {
        for (auto& s : from) {
            if (s.when_true.node) pending.push_back(std::move(s.when_true.node));
            if (s.when_false.node) pending.push_back(std::move(s.when_false.node));
        }
    };

    detach(splits);
    while (!pending.empty()) {
        BinaryTree child = std::move(pending.back());
        pending.pop_back();
        if (child.use_count() == 1) {
            detach(const_cast<BinaryNode&>(*child).splits);
        }
    }
}

// ── Normalizer ──────────────────────────────────────────────────────────────

Normalizer::Normalizer(const ParsedTree& tree, std::size_t max_depth)
    : tree_(tree), max_depth_(max_depth) {}

BinaryTree Normalizer::run() {
    if (tree_.empty()) {
        throw ConversionError(ErrorKind::NodelessTree,
                              "expected a tree with at least one node, "
                              "input is empty");
    }

    const TreeEntry* root = tree_.find(tree_.root_id);
    if (root == nullptr || root->kind == EntryKind::Leaf) {
        throw ConversionError(ErrorKind::NodelessTree,
                              "expected a tree with at least one node, root '" +
                              tree_.root_id + "' is a leaf");
    }

    on_path_.clear();
    pending_.clear();
    built_.clear();

    enter(tree_.root_id, tree_.root_id, 0);
    while (!pending_.empty()) {
        Pending& top = pending_.back();
        const std::string& id = *top.id;
        const Node& node = *top.node;
        const std::size_t depth = top.depth;

        switch (top.next++) {
            case 0:
                enter(node.yes, id, depth + 1);
                break;
            case 1:
                enter(node.no, id, depth + 1);
                break;
            default: {
                Branch no = std::move(built_.back());
                built_.pop_back();
                Branch yes = std::move(built_.back());
                built_.pop_back();
                on_path_.erase(id);
                pending_.pop_back();
                built_.push_back(expand(node, std::move(yes), std::move(no)));
                break;
            }
        }
    }

    BinaryTree top = built_.back().node;
    built_.clear();
    return top;
}

// Leaves go straight to built_; nodes are checked and queued on pending_.

void Normalizer::enter(const std::string& id, const std::string& referrer,
                       std::size_t depth) {
    const TreeEntry* entry = tree_.find(id);
    if (entry == nullptr) {
        throw ConversionError(ErrorKind::DanglingReference,
                              "node '" + referrer +
                              "' references undefined id '" + id + "'");
    }

    switch (entry->kind) {
        case EntryKind::Leaf:
            built_.push_back(Branch::make_leaf(entry->leaf));
            return;

        case EntryKind::Node:
            break;
    }

    if (depth >= max_depth_) {
        throw ConversionError(ErrorKind::DepthLimitExceeded,
                              "tree is deeper than " +
                              std::to_string(max_depth_) + " nodes at '" +
                              id + "'");
    }
    if (!on_path_.insert(id).second) {
        throw ConversionError(ErrorKind::CyclicReference,
                              "node '" + referrer + "' points back to ancestor '" +
                              id + "'");
    }
    pending_.push_back(Pending{&id, &entry->node, depth, 0});
}

Branch Normalizer::expand(const Node& node, Branch yes, Branch no) {
    auto out = std::make_shared<BinaryNode>();
    if (node.is_or()) {
        const Condition& a = node.eligible_conditions[0];
        const Condition& b = node.eligible_conditions[1];

        // ¬A continues into B: B already covered via its own split, ¬B → no.
        auto inner = std::make_shared<BinaryNode>();
        inner->splits.push_back(Split{b, Branch::redundant(), std::move(no)});

        out->splits.push_back(Split{a, yes, Branch::make_split(std::move(inner))});
        out->splits.push_back(Split{b, std::move(yes), Branch::redundant()});
    } else {
        out->splits.push_back(
            Split{node.eligible_conditions[0], std::move(yes), std::move(no)});
    }
    return Branch::make_split(std::move(out));
}

// ── normalize ───────────────────────────────────────────────────────────────

BinaryTree normalize(const ParsedTree& tree, const ConversionOptions& options) {
    Normalizer normalizer(tree, options.max_depth);
    return normalizer.run();
}

// ── to_string ───────────────────────────────────────────────────────────────
// Rendered from an explicit stack of pending pieces: either literal text or a
// branch still to be expanded.

namespace {

struct Piece {
    std::string   text;
    const Branch* branch = nullptr;
};

}  // namespace

std::string to_string(const BinaryTree& tree) {
    if (!tree) return "{}";

    const Branch root = Branch::make_split(tree);
    std::string out;
    std::vector<Piece> stack;
    stack.push_back(Piece{"", &root});

    while (!stack.empty()) {
        Piece piece = std::move(stack.back());
        stack.pop_back();
        if (piece.branch == nullptr) {
            out += piece.text;
            continue;
        }

        const Branch& b = *piece.branch;
        switch (b.kind) {
            case BranchKind::Leaf:
                out += b.leaf.to_string();
                break;
            case BranchKind::Redundant:
                out += "~";
                break;
            case BranchKind::Split: {
                const auto& splits = b.node->splits;
                stack.push_back(Piece{"}", nullptr});
                for (std::size_t i = splits.size(); i-- > 0;) {
                    const Split& s = splits[i];
                    stack.push_back(Piece{"", &s.when_false});
                    stack.push_back(Piece{" : ", nullptr});
                    stack.push_back(Piece{"", &s.when_true});
                    stack.push_back(Piece{(i > 0 ? " | " : "") +
                                          s.condition.to_string() + " ? ",
                                          nullptr});
                }
                out += "{";
                break;
            }
        }
    }
    return out;
}

}  // namespace treestrat
