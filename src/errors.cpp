// ============================================================================
// errors.cpp — ErrorKind names and ConversionError
// ============================================================================

#include "treestrat/errors.hpp"

namespace treestrat {

// ── error_kind_name ─────────────────────────────────────────────────────────

const char* error_kind_name(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::UnparsableLine:        return "UnparsableLine";
        case ErrorKind::DuplicateIdentifier:   return "DuplicateIdentifier";
        case ErrorKind::InvalidLeafValue:      return "InvalidLeafValue";
        case ErrorKind::UnsupportedCombinator: return "UnsupportedCombinator";
        case ErrorKind::NodelessTree:          return "NodelessTree";
        case ErrorKind::DanglingReference:     return "DanglingReference";
        case ErrorKind::CyclicReference:       return "CyclicReference";
        case ErrorKind::DepthLimitExceeded:    return "DepthLimitExceeded";
    }
    return "?";
}

// ── ConversionError ─────────────────────────────────────────────────────────

ConversionError::ConversionError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + detail),
      kind_(kind) {}

}  // namespace treestrat
