// ============================================================================
// test.cpp — Self-test suite for the treestrat tool
// ============================================================================
//
// Contains tests covering:
//   - Model types (condition rendering/negation, leaf range, strategy sets)
//   - Float rendering
//   - Line parser (grammar, whitespace, blank-line diagnostics, errors)
//   - Normalizer (OR expansion shape, nodeless/dangling/cyclic/deep trees)
//   - Path enumeration and contradiction filtering (pairwise and Z3)
//   - End-to-end file conversion and batch conversion
//   - Generated trees: strategies agree with direct tree evaluation, both
//     solvers agree, parallel and sequential batches agree
//
// ============================================================================

#include "treestrat/test.hpp"
#include "treestrat/cli.hpp"
#include "treestrat/contradiction.hpp"
#include "treestrat/converter.hpp"
#include "treestrat/enumeration.hpp"
#include "treestrat/errors.hpp"
#include "treestrat/model.hpp"
#include "treestrat/normalization.hpp"
#include "treestrat/parser.hpp"
#include "treestrat/utils.hpp"
#include "treestrat/z3_solver.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace treestrat {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_throws(const std::function<void()>& fn, ErrorKind kind,
                               const std::string& description) {
    ++total_;
    try {
        fn();
    } catch (const ConversionError& e) {
        if (e.kind() == kind) return;
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << error_kind_name(kind) << "\n"
                  << "    actual:   " << e.what() << "\n";
        return;
    }
    ++failed_;
    std::cerr << "  FAIL: " << description << "\n"
              << "    expected: " << error_kind_name(kind) << "\n"
              << "    actual:   no error\n";
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static std::string join(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        out += l;
        out += "\n";
    }
    return out;
}

// Convert and render sorted, one strategy per line.
static std::string convert(const std::string& text,
                           const ConversionOptions& opts = {}) {
    return join(render_sorted(convert_tree_to_strategies(text, opts).strategies));
}

static bool fails_with(const std::string& text, ErrorKind kind,
                       const ConversionOptions& opts = {}) {
    try {
        convert_tree_to_strategies(text, opts);
        return false;
    } catch (const ConversionError& e) {
        return e.kind() == kind;
    }
}

static bool parse_fails_with(const std::string& text, ErrorKind kind) {
    try {
        Diagnostics d;
        parse_tree(text, d);
        return false;
    } catch (const ConversionError& e) {
        return e.kind() == kind;
    }
}

static std::string normalized(const std::string& text) {
    Diagnostics d;
    ParsedTree tree = parse_tree(text, d);
    return to_string(normalize(tree, ConversionOptions{}));
}

static bool has_diagnostic(const Diagnostics& diags, const std::string& msg) {
    for (const auto& d : diags) {
        if (d.message == msg) return true;
    }
    return false;
}

static std::string read_back(const std::filesystem::path& p) {
    return read_file(p.string());
}

static void write_text(const std::filesystem::path& p, const std::string& text) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
}

// Fresh directory under the system temp dir, removed by the caller.
static std::filesystem::path make_temp_dir(const std::string& tag) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        ("treestrat_" + tag + "_" + std::to_string(stamp));
    std::filesystem::create_directories(dir);
    return dir;
}

static const char* kSingleNode =
    "0:[device_type=pc] yes=1,no=2\n"
    "   1:leaf=0.1\n"
    "   2:leaf=0.2\n";

static const char* kNested =
    "0:[device_type=pc] yes=1,no=2\n"
    "   1:[country=argentina] yes=3,no=4\n"
    "       3:leaf=0.3\n"
    "       4:leaf=0.4\n"
    "   2:leaf=0.2\n";

static const char* kOrNode =
    "0:[device_type=pc||or||support=mobile] yes=1,no=2\n"
    "   1:leaf=0.1\n"
    "   2:leaf=0.2\n";

static const char* kSameFeatureEqualities =
    "0:[device_type=pc] yes=1,no=2\n"
    "   1:[device_type=mobile] yes=3,no=4\n"
    "       3:leaf=0.3\n"
    "       4:leaf=0.4\n"
    "   2:leaf=0.2\n";

static const char* kSameFeatureInequalities =
    "0:[device_type!=pc] yes=1,no=2\n"
    "   1:[device_type!=gameboy] yes=3,no=4\n"
    "       3:leaf=0.3\n"
    "       4:leaf=0.4\n"
    "   2:leaf=0.2\n";

// ============================================================================
// Model Tests
// ============================================================================

static void test_condition_render_negate(TestContext& ctx) {
    Condition eq{"device_type", "pc", true};
    Condition ne = eq.negated();
    ctx.check_eq(eq.to_string(), "device_type=pc", "equality renders with =");
    ctx.check_eq(ne.to_string(), "device_type!=pc", "inequality renders with !=");
    ctx.check(!ne.is_equal && ne.feature == "device_type" && ne.value == "pc",
              "negation keeps feature and value");
    ctx.check(ne.negated() == eq, "double negation is identity");
    ctx.check(ConditionHash{}(eq) == ConditionHash{}(Condition{"device_type", "pc", true}),
              "equal conditions hash alike");
}

static void test_leaf_range(TestContext& ctx) {
    ctx.check(Leaf(0.0).value() == 0.0, "0.0 accepted");
    ctx.check(Leaf(1.0).value() == 1.0, "1.0 accepted");
    ctx.check(Leaf(0.5).value() == 0.5, "0.5 accepted");
    ctx.check_throws([] { Leaf l(-0.000000000001); (void)l; },
                     ErrorKind::InvalidLeafValue, "-1e-12 rejected");
    ctx.check_throws([] { Leaf l(1.000000000001); (void)l; },
                     ErrorKind::InvalidLeafValue, "1+1e-12 rejected");
    ctx.check_throws([] { Leaf l(std::numeric_limits<double>::quiet_NaN()); (void)l; },
                     ErrorKind::InvalidLeafValue, "NaN rejected");
    ctx.check_throws([] { Leaf l(std::numeric_limits<double>::infinity()); (void)l; },
                     ErrorKind::InvalidLeafValue, "inf rejected");

    ctx.check(parse_fails_with("0:leaf=-0.000000000001", ErrorKind::InvalidLeafValue),
              "parser rejects leaf below 0");
    ctx.check(parse_fails_with("0:leaf=1.000000000001", ErrorKind::InvalidLeafValue),
              "parser rejects leaf above 1");
}

static void test_strategy_set_semantics(TestContext& ctx) {
    Condition a{"f", "a", true};
    Condition b{"g", "b", false};
    StrategySet set;
    set.insert(Strategy{{a, b}, Leaf(0.1)});
    set.insert(Strategy{{a, b}, Leaf(0.1)});
    ctx.check(set.size() == 1, "identical strategies collapse");
    set.insert(Strategy{{b, a}, Leaf(0.1)});
    ctx.check(set.size() == 2, "condition order matters for equality");
    set.insert(Strategy{{a, b}, Leaf(0.2)});
    ctx.check(set.size() == 3, "different leaf values stay distinct");

    ctx.check_eq(Strategy{{a, b}, Leaf(1.0)}.to_string(), "f=a & g!=b : 1.0",
                 "strategy rendering");
}

static void test_format_float(TestContext& ctx) {
    ctx.check_eq(format_float(0.1), "0.1", "0.1");
    ctx.check_eq(format_float(0.0), "0.0", "0.0");
    ctx.check_eq(format_float(1.0), "1.0", "1.0");
    ctx.check_eq(format_float(0.25), "0.25", "0.25");
    ctx.check_eq(format_float(0.123456789), "0.123456789", "long fraction");
    ctx.check_eq(format_float(0.0001), "0.0001", "1e-4 stays fixed");
    ctx.check_eq(format_float(0.00015), "0.00015", "1.5e-4 stays fixed");
    ctx.check_eq(format_float(0.00001), "1e-05", "1e-5 goes scientific");
    ctx.check_eq(format_float(1.5e-7), "1.5e-07", "1.5e-7 scientific");
    ctx.check_eq(format_float(123.0), "123.0", "integral value keeps .0");
    ctx.check_eq(format_float(12345.678), "12345.678", "mixed value");
    ctx.check_eq(format_float(1e16), "1e+16", "large value scientific");
}

// ============================================================================
// Parser Tests
// ============================================================================

static void test_parse_leaf_and_node(TestContext& ctx) {
    Diagnostics d;
    ParsedTree t = parse_tree("0:[device_type=pc] yes=1,no=2\n1:leaf=0.0\n2:leaf=1.0\n", d);
    ctx.check(t.size() == 3, "three entries");
    ctx.check_eq(t.root_id, "0", "root is first entry");
    const TreeEntry* root = t.find("0");
    ctx.check(root != nullptr && root->kind == EntryKind::Node, "0 is a node");
    if (root != nullptr && root->kind == EntryKind::Node) {
        ctx.check(root->node == Node{{Condition{"device_type", "pc", true}}, "1", "2"},
                  "node fields");
    }
    const TreeEntry* one = t.find("1");
    ctx.check(one != nullptr && one->kind == EntryKind::Leaf && one->leaf == Leaf(0.0),
              "leaf 1 = 0.0");
    ctx.check(t.find("9") == nullptr, "unknown id");
}

static void test_parse_inequality_and_or(TestContext& ctx) {
    Diagnostics d;
    ParsedTree t = parse_tree(
        "0:[device_type!=pc] yes=1,no=2\n"
        "1:[device_type=pc||or||os!=linux] yes=3,no=4\n", d);
    const TreeEntry* n0 = t.find("0");
    const TreeEntry* n1 = t.find("1");
    ctx.check(n0 != nullptr && n0->kind == EntryKind::Node &&
              n0->node.eligible_conditions.size() == 1 &&
              !n0->node.eligible_conditions[0].is_equal,
              "!= is an inequality");
    ctx.check(n1 != nullptr && n1->kind == EntryKind::Node && n1->node.is_or(),
              "||or|| yields two conditions");
    if (n1 != nullptr && n1->node.is_or()) {
        ctx.check(n1->node.eligible_conditions[0] == Condition{"device_type", "pc", true},
                  "first operand");
        ctx.check(n1->node.eligible_conditions[1] == Condition{"os", "linux", false},
                  "second operand");
    }
}

static void test_parse_whitespace_and_root(TestContext& ctx) {
    Diagnostics d;
    ParsedTree t = parse_tree("\n\t  7:[a=b] yes=3,no=4  \r\n  3:leaf=0.1\n4:leaf=+0.2\n   \n", d);
    ctx.check_eq(t.root_id, "7", "root is first non-blank line, not id 0");
    ctx.check(t.order == std::vector<std::string>{"7", "3", "4"}, "input order kept");
    ctx.check(t.blank_lines == 2, "two blank lines");
    ctx.check(has_diagnostic(d, "Skipping empty line: 0"), "blank line 0 reported");
    ctx.check(has_diagnostic(d, "Skipping empty line: 4"), "blank line 4 reported");
    ctx.check(d.size() == 2 && d[0].severity == Severity::Debug,
              "blank lines are debug diagnostics");
}

static void test_parse_blank_line_indices(TestContext& ctx) {
    Diagnostics d;
    parse_tree("\n        1:leaf=0.0\n\n    ", d);
    ctx.check(has_diagnostic(d, "Skipping empty line: 0"), "line 0");
    ctx.check(has_diagnostic(d, "Skipping empty line: 2"), "line 2");
    ctx.check(has_diagnostic(d, "Skipping empty line: 3"), "whitespace-only line 3");
    ctx.check(!has_diagnostic(d, "Skipping empty line: 1"), "line 1 is not blank");
}

static void test_parse_errors(TestContext& ctx) {
    const std::vector<std::string> unparsable = {
        "hello",
        "0:foo",
        ":leaf=0.1",
        "0 1:leaf=0.1",
        "0:leaf=abc",
        "0:leaf=",
        "0:leaf=0.1x",
        "0:[a=b]yes=1,no=2",
        "0:[a] yes=1,no=2",
        "0:[=b] yes=1,no=2",
        "0:[a=] yes=1,no=2",
        "0:[a=b=c] yes=1,no=2",
        "0:[a!=b=c] yes=1,no=2",
        "0:[a b=c] yes=1,no=2",
        "0:[a=b] yes=1",
        "0:[a=b] 1,2",
        "0:[a=b] yes=1,no=2,missing=1",
        "0:[a=b] yes=,no=2",
        "0:[a=b||or||] yes=1,no=2",
    };
    for (const auto& line : unparsable) {
        ctx.check(parse_fails_with(line, ErrorKind::UnparsableLine),
                  "unparsable: " + line);
    }

    ctx.check(parse_fails_with("0:[a=b||or||c=d||or||e=f] yes=1,no=2",
                               ErrorKind::UnsupportedCombinator),
              "three OR operands rejected");

    try {
        Diagnostics d;
        parse_tree("0:[a=b] yes=1,no=2\n1:oops", d);
        ctx.check(false, "error expected");
    } catch (const ConversionError& e) {
        ctx.check(std::string(e.what()).find("'1:oops'") != std::string::npos,
                  "message names the raw line");
    }
}

static void test_parse_duplicate_ids(TestContext& ctx) {
    ctx.check(parse_fails_with("0:leaf=0.1\n0:leaf=0.2", ErrorKind::DuplicateIdentifier),
              "leaf / leaf");
    ctx.check(parse_fails_with("0:[a=b] yes=1,no=2\n0:[c=d] yes=1,no=2",
                               ErrorKind::DuplicateIdentifier),
              "node / node");
    ctx.check(parse_fails_with("0:[a=b] yes=1,no=2\n0:leaf=0.1",
                               ErrorKind::DuplicateIdentifier),
              "node / leaf");
    ctx.check(parse_fails_with("1:leaf=0.1\n  1:[a=b] yes=1,no=2",
                               ErrorKind::DuplicateIdentifier),
              "leaf / node");
    try {
        Diagnostics d;
        parse_tree("42:leaf=0.1\n42:leaf=0.1", d);
        ctx.check(false, "duplicate id expected");
    } catch (const ConversionError& e) {
        ctx.check(std::string(e.what()).find("'42'") != std::string::npos,
                  "message names the id");
    }
}

// ============================================================================
// Normalizer Tests
// ============================================================================

static void test_normalize_single_and_nested(TestContext& ctx) {
    ctx.check_eq(normalized(kSingleNode), "{device_type=pc ? 0.1 : 0.2}", "single split");
    ctx.check_eq(normalized(kNested),
                 "{device_type=pc ? {country=argentina ? 0.3 : 0.4} : 0.2}",
                 "nested split");
}

static void test_normalize_or_expansion(TestContext& ctx) {
    ctx.check_eq(normalized(kOrNode),
                 "{device_type=pc ? 0.1 : {support=mobile ? ~ : 0.2}"
                 " | support=mobile ? 0.1 : ~}",
                 "OR node expands into two top-level splits");

    Diagnostics d;
    ParsedTree t = parse_tree(
        "0:[a=x||or||b=y] yes=1,no=2\n"
        "1:[c=z] yes=3,no=4\n"
        "2:leaf=0.2\n3:leaf=0.3\n4:leaf=0.4\n", d);
    BinaryTree bt = normalize(t, ConversionOptions{});
    ctx.check(bt->splits.size() == 2, "two splits at the OR node");
    ctx.check(bt->splits[0].when_true.node == bt->splits[1].when_true.node,
              "yes subtree is shared between both operands");
}

static void test_normalize_errors(TestContext& ctx) {
    ctx.check(fails_with("0:leaf=0.0", ErrorKind::NodelessTree), "single leaf");
    ctx.check(fails_with("0:leaf=0.5\n1:[a=b] yes=2,no=3\n2:leaf=0.1\n3:leaf=0.2",
                         ErrorKind::NodelessTree),
              "root leaf followed by nodes");
    ctx.check(fails_with("", ErrorKind::NodelessTree), "empty input");
    ctx.check(fails_with("\n   \n", ErrorKind::NodelessTree), "blank input");

    ctx.check(fails_with("0:[a=b] yes=1,no=9\n1:leaf=0.1", ErrorKind::DanglingReference),
              "dangling no");
    ctx.check(fails_with("0:[a=b] yes=1,no=2\n2:leaf=0.1", ErrorKind::DanglingReference),
              "dangling yes");
    ctx.check(fails_with("0:[a=b] yes=1,no=2\n1:[c=d] yes=0,no=2\n2:leaf=0.2",
                         ErrorKind::CyclicReference),
              "cycle back to root");
    ctx.check(fails_with("0:[a=b] yes=0,no=0", ErrorKind::CyclicReference),
              "self reference");

    ctx.check_eq(convert("0:[a=b] yes=1,no=2\n1:leaf=0.1\n2:leaf=0.2\n"
                         "5:[c=d] yes=7,no=8\n"),
                 "a!=b : 0.2\na=b : 0.1\n",
                 "unreachable dangling entries are not dereferenced");
    ctx.check_eq(convert("0:[a=b] yes=1,no=1\n1:[c=d] yes=2,no=3\n2:leaf=0.2\n3:leaf=0.3\n"),
                 "a!=b & c!=d : 0.3\na!=b & c=d : 0.2\n"
                 "a=b & c!=d : 0.3\na=b & c=d : 0.2\n",
                 "shared subtrees are not cycles");
}

static std::string make_chain(int nodes, bool with_or = false) {
    std::string text;
    for (int i = 0; i < nodes; ++i) {
        std::string n = std::to_string(i);
        text += "n" + n + ":[f" + n + "=v" + (with_or ? "||or||g" + n + "=w" : "") +
                "] yes=leaf,no=n" + std::to_string(i + 1) + "\n";
    }
    text += "n" + std::to_string(nodes) + ":leaf=0.5\n";
    text += "leaf:leaf=0.1\n";
    return text;
}

static void test_normalize_depth_limit(TestContext& ctx) {
    ConversionOptions shallow;
    shallow.max_depth = 3;
    ctx.check_throws([&] { convert_tree_to_strategies(make_chain(5), shallow); },
                     ErrorKind::DepthLimitExceeded, "5-deep chain over a limit of 3");
    ConversionOptions deep;
    deep.max_depth = 5;
    ConversionResult r = convert_tree_to_strategies(make_chain(5), deep);
    ctx.check(r.strategies.size() == 6, "5-deep chain within a limit of 5");
}

// Depth only costs heap: a chain just under the default limit builds,
// renders and is released without deep call chains.
static void test_normalize_deep_chain(TestContext& ctx) {
    const ConversionOptions defaults;
    const int under = static_cast<int>(defaults.max_depth) - 1;

    for (bool with_or : {false, true}) {
        const std::string kind = with_or ? "OR chain" : "chain";
        Diagnostics d;
        ParsedTree tree = parse_tree(make_chain(under, with_or), d);
        {
            BinaryTree bt = normalize(tree, defaults);
            ctx.check(bt != nullptr && bt->splits.size() == (with_or ? 2u : 1u),
                      kind + " just under the default limit normalizes");
            std::string shape = to_string(bt);
            ctx.check(shape.starts_with(with_or ? "{f0=v ? 0.1 : {g0=w ? ~ : {f1=v"
                                                : "{f0=v ? 0.1 : {f1=v ? 0.1 : "),
                      kind + " renders from the root");
            const std::string last = "f" + std::to_string(under - 1) + "=v ? 0.1 : ";
            ctx.check(shape.find(with_or
                                     ? "{" + last + "{g" + std::to_string(under - 1) +
                                           "=w ? ~ : 0.5} | g" +
                                           std::to_string(under - 1) + "=w ? 0.1 : ~}"
                                     : "{" + last + "0.5}") != std::string::npos,
                      kind + " renders down to the last leaf");
            ctx.check(shape.ends_with(with_or ? " | g0=w ? 0.1 : ~}" : "0.5}}"),
                      kind + " rendering is closed");
        }

        Diagnostics d2;
        ParsedTree over = parse_tree(make_chain(under + 2, with_or), d2);
        ctx.check_throws([&] { normalize(over, defaults); },
                         ErrorKind::DepthLimitExceeded,
                         kind + " just over the default limit");
    }
}

// ============================================================================
// Enumeration Tests
// ============================================================================

static void test_enumerate_single_node(TestContext& ctx) {
    ctx.check_eq(convert(kSingleNode),
                 "device_type!=pc : 0.2\n"
                 "device_type=pc : 0.1\n",
                 "single node strategies");
}

static void test_enumerate_nested(TestContext& ctx) {
    ctx.check_eq(convert(kNested),
                 "device_type!=pc : 0.2\n"
                 "device_type=pc & country!=argentina : 0.4\n"
                 "device_type=pc & country=argentina : 0.3\n",
                 "nested strategies");
}

static void test_enumerate_or_node(TestContext& ctx) {
    ConversionResult r = convert_tree_to_strategies(kOrNode, ConversionOptions{});
    ctx.check_eq(join(render_sorted(r.strategies)),
                 "device_type!=pc & support!=mobile : 0.2\n"
                 "device_type=pc : 0.1\n"
                 "support=mobile : 0.1\n",
                 "three strategies, not four");
    ctx.check(r.stats.paths == 3, "three leaves reached");
    ctx.check(r.stats.redundant_pruned == 2, "two redundant branches pruned");
    ctx.check(r.stats.nodes == 1 && r.stats.or_nodes == 1 && r.stats.leaves == 2,
              "entry statistics");
}

static void test_enumerate_traversal_order(TestContext& ctx) {
    // Diagnostics follow traversal order: splits in order, true side first.
    ConversionOptions opts;
    Diagnostics d;
    ConversionStats stats;
    ParsedTree t = parse_tree(
        "0:[x=a||or||y=b] yes=1,no=2\n"
        "1:[x=c] yes=3,no=4\n"
        "2:leaf=0.2\n3:leaf=0.3\n4:leaf=0.4\n", d);
    enumerate_strategies(normalize(t, opts), opts, d, stats);
    std::vector<std::string> dropped;
    for (const auto& diag : d) {
        if (diag.message.starts_with("Always false")) dropped.push_back(diag.message);
    }
    ctx.check(dropped.size() == 1, "one always-false path");
    if (dropped.size() == 1) {
        ctx.check_eq(dropped[0],
                     "Always false strategy: x=a & x=c : 0.3 for x=a and x=c",
                     "diagnostic names the strategy and the pair");
    }
}

static void test_enumerate_duplicates_collapse(TestContext& ctx) {
    ConversionResult r = convert_tree_to_strategies(
        "0:[a=x||or||a=x] yes=1,no=2\n1:leaf=0.1\n2:leaf=0.2\n", ConversionOptions{});
    ctx.check_eq(join(render_sorted(r.strategies)),
                 "a!=x & a!=x : 0.2\na=x : 0.1\n",
                 "repeated OR operand");
    ctx.check(r.stats.duplicates == 1, "one duplicate collapsed");
    ctx.check(r.stats.strategies == 2, "two strategies kept");
}

static void test_determinism(TestContext& ctx) {
    std::string first = convert(kNested);
    std::string second = convert(kNested);
    ctx.check_eq(second, first, "same input, same output");
}

// ============================================================================
// Contradiction Filter Tests
// ============================================================================

static void test_conflicts_pairs(TestContext& ctx) {
    Condition pc{"device_type", "pc", true};
    Condition mobile{"device_type", "mobile", true};
    Condition not_pc{"device_type", "pc", false};
    Condition not_gameboy{"device_type", "gameboy", false};
    Condition os_pc{"os", "pc", true};

    ctx.check(conflicts(pc, mobile), "two equalities on different values");
    ctx.check(conflicts(pc, not_pc), "equality and its negation");
    ctx.check(conflicts(not_pc, pc), "negation and equality");
    ctx.check(!conflicts(not_pc, not_gameboy), "two distinct inequalities");
    ctx.check(!conflicts(pc, not_gameboy), "equality and unrelated inequality");
    ctx.check(!conflicts(pc, pc), "same equality twice");
    ctx.check(!conflicts(pc, os_pc), "different features");

    auto found = find_contradiction({os_pc, not_pc, not_gameboy, pc});
    ctx.check(found.has_value(), "conflict found across non-adjacent conditions");
    if (found) {
        ctx.check_eq(found->to_string(), "device_type!=pc and device_type=pc",
                     "conflicting pair");
    }
    ctx.check(!find_contradiction({pc, os_pc, not_gameboy}).has_value(),
              "satisfiable conjunction");
}

static void test_filter_enabled_and_disabled(TestContext& ctx) {
    ctx.check_eq(convert(kSameFeatureEqualities),
                 "device_type!=pc : 0.2\n"
                 "device_type=pc & device_type!=mobile : 0.4\n",
                 "pc & mobile dropped when filtering");

    ConversionOptions keep;
    keep.ignore_always_false = false;
    ctx.check_eq(convert(kSameFeatureEqualities, keep),
                 "device_type!=pc : 0.2\n"
                 "device_type=pc & device_type!=mobile : 0.4\n"
                 "device_type=pc & device_type=mobile : 0.3\n",
                 "pc & mobile kept when filtering is off");

    ctx.check_eq(convert(kSameFeatureInequalities),
                 "device_type!=pc & device_type!=gameboy : 0.3\n"
                 "device_type!=pc & device_type=gameboy : 0.4\n"
                 "device_type=pc : 0.2\n",
                 "distinct inequalities kept");

    ConversionResult r = convert_tree_to_strategies(kSameFeatureEqualities,
                                                    ConversionOptions{});
    ctx.check(r.stats.always_false == 1, "one strategy dropped");
    ctx.check(has_diagnostic(r.diagnostics,
                             "Always false strategy: device_type=pc & device_type=mobile"
                             " : 0.3 for device_type=pc and device_type=mobile"),
              "drop is reported");
}

static void test_filter_checks_leaf_first(TestContext& ctx) {
    ConversionOptions keep;
    keep.ignore_always_false = false;
    ctx.check(fails_with("0:[a=b] yes=1,no=2\n1:leaf=2.0\n2:leaf=0.1",
                         ErrorKind::InvalidLeafValue, keep),
              "leaf validation does not depend on the filter");
}

// ============================================================================
// Z3 Backend Tests
// ============================================================================

static void test_z3_checker(TestContext& ctx) {
    Z3Checker z3;
    Condition pc{"device_type", "pc", true};
    Condition mobile{"device_type", "mobile", true};
    Condition not_pc{"device_type", "pc", false};
    Condition not_gameboy{"device_type", "gameboy", false};
    Condition os_pc{"os", "pc", true};

    ctx.check(z3.check_conditions({pc, mobile}) == Z3Result::UNSAT, "pc & mobile unsat");
    ctx.check(z3.check_conditions({pc, not_pc}) == Z3Result::UNSAT, "pc & !pc unsat");
    ctx.check(z3.check_conditions({not_pc, not_gameboy}) == Z3Result::SAT,
              "!pc & !gameboy sat");
    ctx.check(z3.check_conditions({pc, os_pc}) == Z3Result::SAT,
              "same value on two features sat");
    ctx.check(z3.check_conditions({}) == Z3Result::SAT, "empty conjunction sat");
    ctx.check(z3.check() == Z3Result::SAT, "scopes are popped after each query");

    z3.add_condition(pc);
    z3.add_condition(not_pc);
    ctx.check(z3.check() == Z3Result::UNSAT, "incremental assertions");
    z3.reset();
    ctx.check(z3.check() == Z3Result::SAT, "reset clears assertions");
}

static void test_z3_backend_conversion(TestContext& ctx) {
    ConversionOptions z3;
    z3.backend = SatBackend::Z3;
    ctx.check_eq(convert(kSameFeatureEqualities, z3), convert(kSameFeatureEqualities),
                 "equalities: z3 matches pairwise");
    ctx.check_eq(convert(kSameFeatureInequalities, z3), convert(kSameFeatureInequalities),
                 "inequalities: z3 matches pairwise");

    ConversionResult r = convert_tree_to_strategies(kSameFeatureEqualities, z3);
    ctx.check(has_diagnostic(r.diagnostics,
                             "Always false strategy: device_type=pc & device_type=mobile"
                             " : 0.3 for device_type=pc and device_type=mobile"),
              "z3 drop names the pair");
}

// ============================================================================
// File Conversion Tests
// ============================================================================

static void test_convert_file(TestContext& ctx) {
    auto dir = make_temp_dir("file");
    auto in = dir / "tree.txt";
    auto out = dir / "strategies.txt";
    write_text(in, kOrNode);

    convert_file(in.string(), out.string(), ConversionOptions{});
    ctx.check_eq(read_back(out),
                 "device_type!=pc & support!=mobile : 0.2\n"
                 "device_type=pc : 0.1\n"
                 "support=mobile : 0.1\n",
                 "output file content");
    ctx.check(!std::filesystem::exists(dir / "strategies.txt.tmp"),
              "temporary file renamed away");

    std::filesystem::remove_all(dir);
}

static void test_convert_file_failure_keeps_output(TestContext& ctx) {
    auto dir = make_temp_dir("fail");
    auto in = dir / "tree.txt";
    auto out = dir / "strategies.txt";
    auto fresh = dir / "fresh.txt";
    write_text(in, "0:leaf=0.0\n");
    write_text(out, "previous\n");

    bool threw = false;
    try {
        convert_file(in.string(), out.string(), ConversionOptions{});
    } catch (const ConversionError& e) {
        threw = e.kind() == ErrorKind::NodelessTree;
    }
    ctx.check(threw, "nodeless tree aborts");
    ctx.check_eq(read_back(out), "previous\n", "existing output untouched");

    try {
        convert_file(in.string(), fresh.string(), ConversionOptions{});
    } catch (const ConversionError&) {
    }
    ctx.check(!std::filesystem::exists(fresh), "no output created on failure");

    bool io_error = false;
    try {
        convert_file((dir / "missing.txt").string(), fresh.string(), ConversionOptions{});
    } catch (const ConversionError&) {
    } catch (const std::runtime_error&) {
        io_error = true;
    }
    ctx.check(io_error, "missing input is an I/O error");

    std::filesystem::remove_all(dir);
}

// ============================================================================
// CLI Tests
// ============================================================================

static Options parse_cli(std::vector<std::string> args) {
    std::vector<char*> argv;
    static std::string prog = "treestrat";
    argv.push_back(prog.data());
    for (auto& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static void test_cli_parse_args(TestContext& ctx) {
    Options o = parse_cli({"in.txt", "out.txt"});
    ctx.check(o.input == "in.txt" && o.output == "out.txt", "positional files");
    ctx.check(o.conversion.ignore_always_false, "filter on by default");
    ctx.check(o.conversion.backend == SatBackend::Pairwise, "pairwise by default");

    o = parse_cli({"--keep-always-false", "--solver", "z3", "--max-depth", "50",
                   "in.txt", "out.txt"});
    ctx.check(!o.conversion.ignore_always_false, "--keep-always-false");
    ctx.check(o.conversion.backend == SatBackend::Z3, "--solver z3");
    ctx.check(o.conversion.max_depth == 50, "--max-depth");

    o = parse_cli({"--batch", "outdir", "-j", "4", "a.txt", "b.txt"});
    ctx.check(o.batch && o.batch_dir == "outdir", "--batch dir");
    ctx.check(o.batch_inputs.size() == 2 && o.num_threads == 4, "batch inputs, threads");

    auto rejects = [](std::vector<std::string> args) {
        try {
            parse_cli(std::move(args));
            return false;
        } catch (const std::exception&) {
            return true;
        }
    };
    ctx.check(rejects({"in.txt"}), "missing output");
    ctx.check(rejects({"a", "b", "c"}), "too many files");
    ctx.check(rejects({"--solver", "minisat", "a", "b"}), "unknown solver");
    ctx.check(rejects({"--bogus", "a", "b"}), "unknown option");
    ctx.check(rejects({"--batch", "dir"}), "batch without inputs");
    ctx.check(!rejects({"--selftest"}), "selftest alone");
}

// ============================================================================
// Generated Tree Tests
// ============================================================================
//
// Random trees over a tiny alphabet (3 features x 3 values) so that
// contradictions and OR nodes are frequent.

static const std::vector<std::string> kFeatures = {"f0", "f1", "f2"};
static const std::vector<std::string> kValues = {"v0", "v1", "v2"};

static std::string random_condition(std::mt19937& rng) {
    std::string c = kFeatures[rng() % kFeatures.size()];
    c += (rng() % 10 < 7) ? "=" : "!=";
    c += kValues[rng() % kValues.size()];
    return c;
}

static std::string generate_tree(std::mt19937& rng, int max_depth) {
    std::vector<std::string> lines;
    int next_id = 0;

    std::function<void(int, int)> gen = [&](int id, int depth) {
        if (depth == max_depth || (depth > 0 && rng() % 4 == 0)) {
            lines.push_back(std::to_string(id) + ":leaf=" +
                            format_float(static_cast<double>(rng() % 11) / 10.0));
            return;
        }
        std::string expr = random_condition(rng);
        if (rng() % 4 == 0) expr += "||or||" + random_condition(rng);
        int yes = next_id++;
        int no = next_id++;
        lines.push_back(std::to_string(id) + ":[" + expr + "] yes=" +
                        std::to_string(yes) + ",no=" + std::to_string(no));
        gen(yes, depth + 1);
        gen(no, depth + 1);
    };

    gen(next_id++, 0);
    return join(lines);
}

static bool holds(const Condition& c, const std::map<std::string, std::string>& row) {
    return (row.at(c.feature) == c.value) == c.is_equal;
}

static double evaluate(const ParsedTree& tree, const std::map<std::string, std::string>& row) {
    const TreeEntry* e = tree.find(tree.root_id);
    while (e->kind == EntryKind::Node) {
        bool taken = false;
        for (const auto& c : e->node.eligible_conditions) {
            taken = taken || holds(c, row);
        }
        e = tree.find(taken ? e->node.yes : e->node.no);
    }
    return e->leaf.value();
}

static void test_generated_agree_with_evaluation(TestContext& ctx) {
    std::mt19937 rng(1337);
    std::vector<std::string> domain = kValues;
    domain.push_back("other");

    for (int round = 0; round < 40; ++round) {
        std::string text = generate_tree(rng, 4);
        Diagnostics d;
        ParsedTree tree = parse_tree(text, d);
        StrategySet strategies = convert_tree_to_strategies(text, ConversionOptions{}).strategies;

        bool all_ok = true;
        for (const auto& a : domain) {
            for (const auto& b : domain) {
                for (const auto& c : domain) {
                    std::map<std::string, std::string> row{{"f0", a}, {"f1", b}, {"f2", c}};
                    double expected = evaluate(tree, row);
                    int matched = 0;
                    for (const auto& s : strategies) {
                        bool all = true;
                        for (const auto& cond : s.conditions) all = all && holds(cond, row);
                        if (!all) continue;
                        ++matched;
                        if (s.value.value() != expected) all_ok = false;
                    }
                    if (matched == 0) all_ok = false;
                }
            }
        }
        ctx.check(all_ok, "round " + std::to_string(round) +
                          ": every row matches strategies with the tree's value");

        for (const auto& s : strategies) {
            if (find_contradiction(s.conditions)) {
                ctx.check(false, "always-false strategy survived: " + s.to_string());
            }
        }
    }
}

static void test_generated_backends_agree(TestContext& ctx) {
    std::mt19937 rng(4242);
    ConversionOptions z3;
    z3.backend = SatBackend::Z3;
    ConversionOptions keep;
    keep.ignore_always_false = false;

    for (int round = 0; round < 30; ++round) {
        std::string text = generate_tree(rng, 4);
        ConversionResult pairwise = convert_tree_to_strategies(text, ConversionOptions{});
        ConversionResult solver = convert_tree_to_strategies(text, z3);
        ConversionResult all = convert_tree_to_strategies(text, keep);

        ctx.check_eq(join(render_sorted(solver.strategies)),
                     join(render_sorted(pairwise.strategies)),
                     "round " + std::to_string(round) + ": z3 matches pairwise");

        std::size_t satisfiable = 0;
        for (const auto& s : all.strategies) {
            if (!find_contradiction(s.conditions)) {
                ++satisfiable;
                ctx.check(pairwise.strategies.count(s) == 1,
                          "satisfiable strategy kept: " + s.to_string());
            }
        }
        ctx.check(satisfiable == pairwise.strategies.size(),
                  "round " + std::to_string(round) +
                  ": filtered set is the satisfiable part of the full set");
    }
}

static void test_batch_shared_stem(TestContext& ctx) {
    auto dir = make_temp_dir("stem");
    std::filesystem::create_directories(dir / "a");
    std::filesystem::create_directories(dir / "b");
    write_text(dir / "a" / "tree.txt", "0:[x=1] yes=1,no=2\n1:leaf=0.1\n2:leaf=0.2\n");
    write_text(dir / "b" / "tree.txt", "0:[y=9] yes=1,no=2\n1:leaf=0.7\n2:leaf=0.8\n");

    const std::vector<std::string> inputs = {(dir / "a" / "tree.txt").string(),
                                             (dir / "b" / "tree.txt").string()};
    auto out_dir = dir / "out";
    std::vector<BatchJob> jobs = make_batch_jobs(out_dir.string(), inputs);
    ctx.check(jobs.size() == 2 && jobs[0].output == jobs[1].output,
              "same stem maps to the same output name");

    bool rejected = false;
    try {
        convert_batch(jobs, ConversionOptions{}, 2);
    } catch (const std::runtime_error& e) {
        const std::string msg = e.what();
        rejected = msg.find(inputs[0]) != std::string::npos &&
                   msg.find(inputs[1]) != std::string::npos;
    }
    ctx.check(rejected, "colliding outputs rejected naming both inputs");

    Options opts;
    opts.batch = true;
    opts.batch_dir = out_dir.string();
    opts.batch_inputs = inputs;
    opts.num_threads = 2;
    ctx.check(run(opts) == 1, "batch run with colliding outputs fails");
    ctx.check(!std::filesystem::exists(out_dir / "tree.strategies.txt"),
              "nothing written for colliding outputs");

    std::vector<BatchJob> aliased = {{inputs[0], (out_dir / "x.txt").string()},
                                     {inputs[1], (out_dir / "." / "x.txt").string()}};
    bool aliased_rejected = false;
    try {
        convert_batch(aliased, ConversionOptions{}, 1);
    } catch (const std::runtime_error&) {
        aliased_rejected = true;
    }
    ctx.check(aliased_rejected, "spellings of one path collide too");

    std::filesystem::remove_all(dir);
}

static void test_batch_parallel_equivalence(TestContext& ctx) {
    auto dir = make_temp_dir("batch");
    std::mt19937 rng(99);

    std::vector<BatchJob> seq_jobs;
    std::vector<BatchJob> par_jobs;
    std::filesystem::create_directories(dir / "seq");
    std::filesystem::create_directories(dir / "par");
    for (int i = 0; i < 8; ++i) {
        std::string name = "tree" + std::to_string(i);
        auto in = dir / (name + ".txt");
        write_text(in, generate_tree(rng, 5));
        seq_jobs.push_back({in.string(), (dir / "seq" / (name + ".out")).string()});
        par_jobs.push_back({in.string(), (dir / "par" / (name + ".out")).string()});
    }
    auto bad = dir / "bad.txt";
    write_text(bad, "0:leaf=0.0\n");
    seq_jobs.push_back({bad.string(), (dir / "seq" / "bad.out").string()});
    par_jobs.push_back({bad.string(), (dir / "par" / "bad.out").string()});

    auto seq = convert_batch(seq_jobs, ConversionOptions{}, 1);
    auto par = convert_batch(par_jobs, ConversionOptions{}, 4);

    ctx.check(seq.size() == seq_jobs.size() && par.size() == par_jobs.size(),
              "one outcome per job");
    for (std::size_t i = 0; i + 1 < seq_jobs.size(); ++i) {
        ctx.check(seq[i].ok && par[i].ok, "job " + std::to_string(i) + " succeeded");
        if (seq[i].ok && par[i].ok) {
            ctx.check_eq(read_back(par_jobs[i].output), read_back(seq_jobs[i].output),
                         "job " + std::to_string(i) + ": parallel matches sequential");
        }
    }
    ctx.check(!seq.back().ok && !par.back().ok, "bad tree reported as failed");
    ctx.check(seq.back().error.find("NodelessTree") != std::string::npos,
              "failure carries the error kind");
    ctx.check(!std::filesystem::exists(seq_jobs.back().output), "no output for bad tree");

    std::filesystem::remove_all(dir);
}

// ============================================================================
// Test Entry Point
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Model tests
    runner.run("condition_render_negate",      test_condition_render_negate);
    runner.run("leaf_range",                   test_leaf_range);
    runner.run("strategy_set_semantics",       test_strategy_set_semantics);
    runner.run("format_float",                 test_format_float);

    // Parser tests
    runner.run("parse_leaf_and_node",          test_parse_leaf_and_node);
    runner.run("parse_inequality_and_or",      test_parse_inequality_and_or);
    runner.run("parse_whitespace_and_root",    test_parse_whitespace_and_root);
    runner.run("parse_blank_line_indices",     test_parse_blank_line_indices);
    runner.run("parse_errors",                 test_parse_errors);
    runner.run("parse_duplicate_ids",          test_parse_duplicate_ids);

    // Normalizer tests
    runner.run("normalize_single_and_nested",  test_normalize_single_and_nested);
    runner.run("normalize_or_expansion",       test_normalize_or_expansion);
    runner.run("normalize_errors",             test_normalize_errors);
    runner.run("normalize_depth_limit",        test_normalize_depth_limit);
    runner.run("normalize_deep_chain",         test_normalize_deep_chain);

    // Enumeration tests
    runner.run("enumerate_single_node",        test_enumerate_single_node);
    runner.run("enumerate_nested",             test_enumerate_nested);
    runner.run("enumerate_or_node",            test_enumerate_or_node);
    runner.run("enumerate_traversal_order",    test_enumerate_traversal_order);
    runner.run("enumerate_duplicates_collapse", test_enumerate_duplicates_collapse);
    runner.run("determinism",                  test_determinism);

    // Contradiction filter tests
    runner.run("conflicts_pairs",              test_conflicts_pairs);
    runner.run("filter_enabled_and_disabled",  test_filter_enabled_and_disabled);
    runner.run("filter_checks_leaf_first",     test_filter_checks_leaf_first);

    // Z3 backend tests
    runner.run("z3_checker",                   test_z3_checker);
    runner.run("z3_backend_conversion",        test_z3_backend_conversion);

    // File conversion and CLI tests
    runner.run("convert_file",                 test_convert_file);
    runner.run("convert_file_failure",         test_convert_file_failure_keeps_output);
    runner.run("cli_parse_args",               test_cli_parse_args);

    // Generated trees
    runner.run("generated_agree_with_evaluation", test_generated_agree_with_evaluation);
    runner.run("generated_backends_agree",     test_generated_backends_agree);
    runner.run("batch_shared_stem",            test_batch_shared_stem);
    runner.run("batch_parallel_equivalence",   test_batch_parallel_equivalence);

    return runner.summarise();
}

}  // namespace treestrat
