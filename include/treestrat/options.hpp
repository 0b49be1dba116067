// ============================================================================
// treestrat/options.hpp — Conversion options, diagnostics and statistics
// ============================================================================
//
// Configuration is passed explicitly into every stage that needs it; there is
// no process-wide switch.  Stages report non-fatal events (skipped blank
// lines, discarded always-false strategies) as Diagnostic values instead of
// writing to a stream, and the CLI decides what to print.
//
// ============================================================================

#ifndef TREESTRAT_OPTIONS_HPP
#define TREESTRAT_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace treestrat {

// ── SatBackend ──────────────────────────────────────────────────────────────
// Decision procedure used by the contradiction filter.

enum class SatBackend : std::uint8_t {
    Pairwise,   // per-feature pairwise conflict search
    Z3          // Z3, uninterpreted sort with distinct value constants
};

const char* sat_backend_name(SatBackend b) noexcept;

/// "pairwise" / "z3".  Throws std::runtime_error on anything else.
SatBackend parse_sat_backend(const std::string& name);

// ── ConversionOptions ───────────────────────────────────────────────────────

struct ConversionOptions {
    bool        ignore_always_false = true;
    SatBackend  backend             = SatBackend::Pairwise;
    std::size_t max_depth           = 10000;   // nested node bound
};

// ── Diagnostic ──────────────────────────────────────────────────────────────

enum class Severity : std::uint8_t {
    Debug,
    Warning
};

const char* severity_name(Severity s) noexcept;

struct Diagnostic {
    Severity    severity = Severity::Debug;
    std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

// ── ConversionStats ─────────────────────────────────────────────────────────

struct ConversionStats {
    std::uint32_t entries             = 0;
    std::uint32_t nodes               = 0;
    std::uint32_t or_nodes            = 0;
    std::uint32_t leaves              = 0;
    std::uint32_t blank_lines         = 0;
    std::uint32_t paths               = 0;   // leaves reached by the enumerator
    std::uint32_t redundant_pruned    = 0;
    std::uint32_t always_false        = 0;   // dropped by the filter
    std::uint32_t duplicates          = 0;   // collapsed by set semantics
    std::uint32_t strategies          = 0;

    std::string to_string() const;
};

}  // namespace treestrat

#endif  // TREESTRAT_OPTIONS_HPP
