// ============================================================================
// options.cpp — Names for option enums and statistics formatting
// ============================================================================

#include "treestrat/options.hpp"

#include <sstream>
#include <stdexcept>

namespace treestrat {

const char* sat_backend_name(SatBackend b) noexcept {
    switch (b) {
        case SatBackend::Pairwise: return "pairwise";
        case SatBackend::Z3:       return "z3";
    }
    return "?";
}

SatBackend parse_sat_backend(const std::string& name) {
    if (name == "pairwise") return SatBackend::Pairwise;
    if (name == "z3")       return SatBackend::Z3;
    throw std::runtime_error("unknown solver '" + name +
                             "' (expected pairwise or z3)");
}

const char* severity_name(Severity s) noexcept {
    switch (s) {
        case Severity::Debug:   return "DEBUG";
        case Severity::Warning: return "WARNING";
    }
    return "?";
}

// ── ConversionStats ─────────────────────────────────────────────────────────

std::string ConversionStats::to_string() const {
    std::ostringstream oss;
    oss << "entries=" << entries
        << " nodes=" << nodes
        << " or_nodes=" << or_nodes
        << " leaves=" << leaves
        << " blank_lines=" << blank_lines
        << " paths=" << paths
        << " redundant_pruned=" << redundant_pruned
        << " always_false=" << always_false
        << " duplicates=" << duplicates
        << " strategies=" << strategies;
    return oss.str();
}

}  // namespace treestrat
