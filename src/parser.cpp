// ============================================================================
// parser.cpp — Line parser for dumped decision trees
// ============================================================================
//
// Implementation notes
// --------------------
//
// Each non-blank line is handled on its own:
//
//   1. the id is everything before the first ':'
//   2. the id is checked for duplicates before the rest of the line is
//      looked at, so a leaf and a node sharing an id are rejected alike
//   3. the remainder selects the form: ":leaf=" or ":["
//
// Anything that does not fit exactly is an UnparsableLine naming the line;
// nothing is guessed or truncated.
//
// ============================================================================

#include "treestrat/parser.hpp"
#include "treestrat/errors.hpp"
#include "treestrat/utils.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace treestrat {

namespace {

constexpr std::string_view kLeafPrefix  = ":leaf=";
constexpr std::string_view kNodePrefix  = ":[";
constexpr std::string_view kBranchSep   = "] ";
constexpr std::string_view kCombinator  = "||or||";
constexpr std::string_view kYesPrefix   = "yes=";
constexpr std::string_view kNoPrefix    = "no=";

[[noreturn]] void unparsable(const std::string& line, const std::string& why) {
    throw ConversionError(ErrorKind::UnparsableLine,
                          "'" + line + "' (" + why + ")");
}

bool has_space(std::string_view s) {
    return s.find_first_of(" \t\r\n\f\v") != std::string_view::npos;
}

bool is_valid_token(std::string_view s) {
    return !s.empty() && !has_space(s) &&
           s.find('=') == std::string_view::npos &&
           s.find(',') == std::string_view::npos;
}

std::size_t count_occurrences(std::string_view haystack, std::string_view needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

std::string parse_branch_id(std::string_view field, std::string_view prefix,
                            const std::string& line) {
    std::string f = trim(field);
    std::string_view v(f);
    if (!v.starts_with(prefix)) {
        unparsable(line, "expected '" + std::string(prefix) + "<id>'");
    }
    v.remove_prefix(prefix.size());
    if (v.empty() || has_space(v) || v.find(':') != std::string_view::npos) {
        unparsable(line, "invalid branch id '" + std::string(v) + "'");
    }
    return std::string(v);
}

}  // namespace

// ── TreeEntry ───────────────────────────────────────────────────────────────

TreeEntry TreeEntry::make_leaf(Leaf l) {
    TreeEntry e;
    e.kind = EntryKind::Leaf;
    e.leaf = l;
    return e;
}

TreeEntry TreeEntry::make_node(Node n) {
    TreeEntry e;
    e.kind = EntryKind::Node;
    e.node = std::move(n);
    return e;
}

// ── ParsedTree ──────────────────────────────────────────────────────────────

const TreeEntry* ParsedTree::find(const std::string& id) const {
    auto it = entries.find(id);
    return it == entries.end() ? nullptr : &it->second;
}

// ── parse_condition ─────────────────────────────────────────────────────────
// "feature=value" or "feature!=value".  Inequality wins when both operators
// could match.

Condition parse_condition(std::string_view text, const std::string& line) {
    std::string_view op = "=";
    bool is_equal = true;
    if (text.find("!=") != std::string_view::npos) {
        op = "!=";
        is_equal = false;
    }

    auto pos = text.find(op);
    if (pos == std::string_view::npos) {
        unparsable(line, "condition '" + std::string(text) + "' has no operator");
    }

    std::string_view feature = text.substr(0, pos);
    std::string_view value = text.substr(pos + op.size());
    if (!is_valid_token(feature) || !is_valid_token(value)) {
        unparsable(line, "malformed condition '" + std::string(text) + "'");
    }
    return Condition{std::string(feature), std::string(value), is_equal};
}

// ── parse_leaf_line ─────────────────────────────────────────────────────────
// `rest` starts at ":leaf=".

Leaf parse_leaf_line(std::string_view rest, const std::string& line) {
    rest.remove_prefix(kLeafPrefix.size());
    std::string text = trim(rest);
    std::string_view num(text);
    if (!num.empty() && num.front() == '+') num.remove_prefix(1);

    double value = 0.0;
    auto res = std::from_chars(num.data(), num.data() + num.size(), value);
    if (num.empty() || res.ec != std::errc() ||
        res.ptr != num.data() + num.size()) {
        unparsable(line, "leaf value '" + text + "' is not a number");
    }
    return Leaf(value);
}

// ── parse_node_line ─────────────────────────────────────────────────────────
// `rest` starts at ":[".

Node parse_node_line(std::string_view rest, const std::string& line) {
    rest.remove_prefix(kNodePrefix.size());

    auto close = rest.find(kBranchSep);
    if (close == std::string_view::npos) {
        unparsable(line, "missing '] ' after condition");
    }
    std::string_view expr = rest.substr(0, close);
    std::string_view branches = rest.substr(close + kBranchSep.size());

    Node node;

    const std::size_t combinators = count_occurrences(expr, kCombinator);
    if (combinators > 1) {
        throw ConversionError(ErrorKind::UnsupportedCombinator,
                              "'" + line + "' combines " +
                              std::to_string(combinators + 1) +
                              " conditions, at most 2 are supported");
    }
    if (combinators == 1) {
        auto pos = expr.find(kCombinator);
        node.eligible_conditions.push_back(parse_condition(expr.substr(0, pos), line));
        node.eligible_conditions.push_back(
            parse_condition(expr.substr(pos + kCombinator.size()), line));
    } else {
        node.eligible_conditions.push_back(parse_condition(expr, line));
    }

    auto comma = branches.find(',');
    if (comma == std::string_view::npos ||
        branches.find(',', comma + 1) != std::string_view::npos) {
        unparsable(line, "expected 'yes=<id>,no=<id>'");
    }
    node.yes = parse_branch_id(branches.substr(0, comma), kYesPrefix, line);
    node.no = parse_branch_id(branches.substr(comma + 1), kNoPrefix, line);
    return node;
}

// ── TreeParser ──────────────────────────────────────────────────────────────

TreeParser::TreeParser(Diagnostics& diagnostics) : diags_(diagnostics) {}

ParsedTree TreeParser::parse(std::string_view text) {
    ParsedTree tree;
    const std::vector<std::string> lines = split_lines(text);

    for (std::size_t index = 0; index < lines.size(); ++index) {
        const std::string line = trim(lines[index]);
        if (line.empty()) {
            diags_.push_back({Severity::Debug,
                              "Skipping empty line: " + std::to_string(index)});
            ++tree.blank_lines;
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            unparsable(line, "missing '<id>:' prefix");
        }
        std::string id = line.substr(0, colon);
        if (has_space(id)) {
            unparsable(line, "identifier contains whitespace");
        }
        if (tree.entries.count(id) != 0) {
            throw ConversionError(ErrorKind::DuplicateIdentifier,
                                  "id '" + id + "' is defined more than once");
        }

        std::string_view rest = std::string_view(line).substr(colon);
        TreeEntry entry;
        if (rest.starts_with(kLeafPrefix)) {
            entry = TreeEntry::make_leaf(parse_leaf_line(rest, line));
        } else if (rest.starts_with(kNodePrefix)) {
            entry = TreeEntry::make_node(parse_node_line(rest, line));
        } else {
            unparsable(line, "expected ':leaf=' or ':['");
        }

        if (tree.order.empty()) {
            tree.root_id = id;
        }
        tree.order.push_back(id);
        tree.entries.emplace(std::move(id), std::move(entry));
    }

    return tree;
}

// ── parse_tree ──────────────────────────────────────────────────────────────

ParsedTree parse_tree(std::string_view text, Diagnostics& diagnostics) {
    TreeParser parser(diagnostics);
    return parser.parse(text);
}

}  // namespace treestrat
