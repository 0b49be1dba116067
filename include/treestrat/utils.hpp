// ============================================================================
// treestrat/utils.hpp — Utility functions
// ============================================================================

#ifndef TREESTRAT_UTILS_HPP
#define TREESTRAT_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace treestrat {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a whole text file.
/// Throws std::runtime_error if the file cannot be opened.
std::string read_file(const std::string& path);

/// Write lines to `path`, each followed by '\n'.  The content goes to a
/// sibling temporary file that is renamed over `path` only once everything
/// has been written, so a failed write never leaves a truncated file.
/// Throws std::runtime_error on any I/O failure.
void write_lines_atomic(const std::string& path,
                        const std::vector<std::string>& lines);

// ── String helpers ──────────────────────────────────────────────────────────

/// Split text on '\n'.  A trailing newline does not produce an extra line.
std::vector<std::string> split_lines(std::string_view text);

/// Trim leading and trailing whitespace from a string.
std::string trim(std::string_view s);

/// Shortest decimal representation that round-trips to the same double,
/// laid out the way Python's repr(float) does: fixed notation for decimal
/// exponents in [-4, 16) with a trailing ".0" for integral values, and
/// "1e-05" style scientific notation otherwise.
std::string format_float(double v);

}  // namespace treestrat

#endif  // TREESTRAT_UTILS_HPP
