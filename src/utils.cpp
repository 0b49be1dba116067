// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "treestrat/utils.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace treestrat {

// ── read_file ───────────────────────────────────────────────────────────────

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("error while reading file: " + path);
    }
    return oss.str();
}

// ── write_lines_atomic ──────────────────────────────────────────────────────

void write_lines_atomic(const std::string& path,
                        const std::vector<std::string>& lines) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open file for writing: " + tmp_path);
        }
        for (const auto& line : lines) {
            file << line << '\n';
        }
        file.close();
        if (file.fail()) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            throw std::runtime_error("error while writing file: " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw std::runtime_error("cannot move " + tmp_path + " to " + path +
                                 ": " + ec.message());
    }
}

// ── split_lines ─────────────────────────────────────────────────────────────

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return std::string(s.substr(start, end - start + 1));
}

// ── format_float ────────────────────────────────────────────────────────────
// std::to_chars in scientific mode without a precision yields the shortest
// round-trip digits ("1.5e-07").  Those digits are then re-laid out.

std::string format_float(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v < 0 ? "-inf" : "inf";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v,
                             std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    std::string sign;
    std::size_t pos = 0;
    if (sci[0] == '-') {
        sign = "-";
        pos = 1;
    }

    const std::size_t e_pos = sci.find('e');
    std::string digits;
    for (std::size_t i = pos; i < e_pos; ++i) {
        if (sci[i] != '.') digits += sci[i];
    }
    const int exponent = std::atoi(sci.c_str() + e_pos + 1);
    const int n = static_cast<int>(digits.size());

    std::string out = sign;
    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            if (n <= exponent + 1) {
                out += digits + std::string(exponent + 1 - n, '0') + ".0";
            } else {
                out += digits.substr(0, exponent + 1) + "." +
                       digits.substr(exponent + 1);
            }
        } else {
            out += "0." + std::string(-exponent - 1, '0') + digits;
        }
        return out;
    }

    out += digits.substr(0, 1);
    if (n > 1) out += "." + digits.substr(1);
    const int abs_exp = exponent < 0 ? -exponent : exponent;
    out += exponent < 0 ? "e-" : "e+";
    if (abs_exp < 10) out += "0";
    out += std::to_string(abs_exp);
    return out;
}

}  // namespace treestrat
