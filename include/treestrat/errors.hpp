// ============================================================================
// treestrat/errors.hpp — Error taxonomy for tree-to-strategies conversion
// ============================================================================
//
// Every structural problem with an input tree aborts the whole conversion.
// They are reported by throwing ConversionError, a std::runtime_error that
// also carries an ErrorKind so callers (and the self-tests) can tell the
// failure classes apart without matching on message text.
//
//   UnparsableLine         line matches neither the leaf nor node grammar
//   DuplicateIdentifier    the same id appears on two lines
//   InvalidLeafValue       leaf value outside [0, 1] (or NaN)
//   UnsupportedCombinator  more than one ||or|| in a condition expression
//   NodelessTree           root entry is a leaf, or the input is empty
//   DanglingReference      yes/no branch id with no matching entry
//   CyclicReference        yes/no branch id pointing back to an ancestor
//   DepthLimitExceeded     tree deeper than ConversionOptions::max_depth
//
// File-system failures are not ConversionErrors; they are plain
// std::runtime_error from utils.
//
// ============================================================================

#ifndef TREESTRAT_ERRORS_HPP
#define TREESTRAT_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace treestrat {

// ── ErrorKind ───────────────────────────────────────────────────────────────

enum class ErrorKind : std::uint8_t {
    UnparsableLine,
    DuplicateIdentifier,
    InvalidLeafValue,
    UnsupportedCombinator,
    NodelessTree,
    DanglingReference,
    CyclicReference,
    DepthLimitExceeded
};

/// Human-readable name for an ErrorKind ("UnparsableLine", ...).
const char* error_kind_name(ErrorKind k) noexcept;

// ── ConversionError ─────────────────────────────────────────────────────────
// what() is formatted as "<KindName>: <detail>".

class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace treestrat

#endif  // TREESTRAT_ERRORS_HPP
