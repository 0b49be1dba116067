// ============================================================================
// treestrat/test.hpp — Lightweight selftest framework
// ============================================================================
//
// Test harness behind `treestrat --selftest`: each test gets a
// TestContext, records checks, and the runner tallies them.
//
// Usage:
//   void test_single_node(TestContext& ctx) {
//       ctx.check_eq(rendered, "device_type=pc : 0.1\n", "single node");
//       ctx.check_throws([] { parse_tree("0:foo", diags); },
//                        ErrorKind::UnparsableLine, "bad line");
//   }
//   // in run_selftests():  runner.run("single_node", test_single_node);
//
// ============================================================================

#ifndef TREESTRAT_TEST_HPP
#define TREESTRAT_TEST_HPP

#include "treestrat/errors.hpp"

#include <functional>
#include <string>

namespace treestrat {

// ── TestContext ──────────────────────────────────────────────────────────────

class TestContext {
public:
    /// Record a check.  If `condition` is false, logs a failure.
    void check(bool condition, const std::string& description);

    /// Record a string-equality check with nice diff output.
    void check_eq(const std::string& actual, const std::string& expected,
                  const std::string& description);

    /// Record a check that `fn` throws a ConversionError of `kind`.
    void check_throws(const std::function<void()>& fn, ErrorKind kind,
                      const std::string& description);

    /// Total checks so far.
    int total() const noexcept { return total_; }

    /// Failed checks so far.
    int failed() const noexcept { return failed_; }

private:
    int total_  = 0;
    int failed_ = 0;
    std::string current_test_;

    friend class TestRunner;
};

// ── TestRunner ──────────────────────────────────────────────────────────────

class TestRunner {
public:
    using TestFunc = std::function<void(TestContext&)>;

    /// Register and immediately run a named test.
    void run(const std::string& name, TestFunc func);

    /// Print summary and return exit code (0 = all pass, 1 = failures).
    int summarise() const;

private:
    int tests_run_    = 0;
    int tests_failed_ = 0;
    int checks_total_ = 0;
    int checks_failed_ = 0;
};

/// Entry point: run all built-in self-tests.
/// Returns 0 on success, 1 on failure.
int run_selftests();

}  // namespace treestrat

#endif  // TREESTRAT_TEST_HPP
