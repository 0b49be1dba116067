// ============================================================================
// treestrat/parser.hpp — Line parser for dumped decision trees
// ============================================================================
//
// Grammar (one entity per non-blank line, surrounding whitespace ignored):
//
//   line        ::= leaf_line | node_line
//   leaf_line   ::= ID ':leaf=' FLOAT
//   node_line   ::= ID ':[' cond_expr '] yes=' ID ',no=' ID
//   cond_expr   ::= condition
//                 | condition '||or||' condition
//   condition   ::= TOKEN op TOKEN
//   op          ::= '!=' | '='             ('!=' is detected first)
//
// ID is any non-empty run of characters without ':' or whitespace.  TOKEN is
// non-empty and contains no '=', ',' or whitespace.
//
// The first parsed entry is the root of the tree.  ParsedTree stores it as
// root_id so nothing downstream depends on container iteration order.
//
// Errors are ConversionError:
//   UnparsableLine         line matches neither form
//   DuplicateIdentifier    id already defined on an earlier line
//   InvalidLeafValue       leaf value outside [0, 1]
//   UnsupportedCombinator  two or more '||or||' in one expression
//
// ============================================================================

#ifndef TREESTRAT_PARSER_HPP
#define TREESTRAT_PARSER_HPP

#include "treestrat/model.hpp"
#include "treestrat/options.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace treestrat {

// ── TreeEntry ───────────────────────────────────────────────────────────────
// Tagged Leaf | Node.  Only the member named by `kind` is meaningful.

enum class EntryKind : std::uint8_t {
    Leaf,
    Node
};

struct TreeEntry {
    EntryKind kind = EntryKind::Leaf;
    Leaf      leaf{0.0};
    Node      node;

    static TreeEntry make_leaf(Leaf l);
    static TreeEntry make_node(Node n);
};

// ── ParsedTree ──────────────────────────────────────────────────────────────

struct ParsedTree {
    std::string                                root_id;   // first parsed id
    std::unordered_map<std::string, TreeEntry> entries;
    std::vector<std::string>                   order;     // ids in input order
    std::uint32_t                              blank_lines = 0;

    /// nullptr when `id` is not defined.
    const TreeEntry* find(const std::string& id) const;

    bool empty() const noexcept { return entries.empty(); }
    std::size_t size() const noexcept { return entries.size(); }
};

// ── TreeParser ──────────────────────────────────────────────────────────────
// Blank lines are reported to `diagnostics` at Debug severity as
// "Skipping empty line: <0-based index>".

class TreeParser {
public:
    explicit TreeParser(Diagnostics& diagnostics);

    /// Parse a complete tree dump.
    ParsedTree parse(std::string_view text);

private:
    Diagnostics& diags_;
};

// ── Single-item parsers ─────────────────────────────────────────────────────
// `line` is the trimmed raw line, used in error messages.

Condition parse_condition(std::string_view text, const std::string& line);
Leaf      parse_leaf_line(std::string_view rest, const std::string& line);
Node      parse_node_line(std::string_view rest, const std::string& line);

// ── Convenience free function ───────────────────────────────────────────────

ParsedTree parse_tree(std::string_view text, Diagnostics& diagnostics);

}  // namespace treestrat

#endif  // TREESTRAT_PARSER_HPP
