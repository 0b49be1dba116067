// ============================================================================
// model.cpp — Condition / Leaf / Strategy behaviour and hashing
// ============================================================================

#include "treestrat/model.hpp"
#include "treestrat/errors.hpp"
#include "treestrat/utils.hpp"

#include <functional>

namespace treestrat {

namespace {

inline void hash_mix(std::size_t& h, std::size_t v) noexcept {
    h ^= v + 0x9e3779b9 + (h << 6) + (h >> 2);
}

}  // namespace

// ── Condition ───────────────────────────────────────────────────────────────

Condition Condition::negated() const {
    return Condition{feature, value, !is_equal};
}

std::string Condition::to_string() const {
    return feature + (is_equal ? "=" : "!=") + value;
}

std::size_t ConditionHash::operator()(const Condition& c) const noexcept {
    std::size_t h = std::hash<bool>{}(c.is_equal);
    hash_mix(h, std::hash<std::string>{}(c.feature));
    hash_mix(h, std::hash<std::string>{}(c.value));
    return h;
}

// ── Leaf ────────────────────────────────────────────────────────────────────
// The negated comparison also rejects NaN.

Leaf::Leaf(double value) : value_(value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConversionError(ErrorKind::InvalidLeafValue,
                              "leaf value " + format_float(value) +
                              " must be in [0, 1]");
    }
}

std::string Leaf::to_string() const {
    return format_float(value_);
}

// ── Strategy ────────────────────────────────────────────────────────────────

std::string Strategy::to_string() const {
    std::string out;
    for (std::size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) out += " & ";
        out += conditions[i].to_string();
    }
    out += " : ";
    out += value.to_string();
    return out;
}

std::size_t StrategyHash::operator()(const Strategy& s) const noexcept {
    // 0.0 == -0.0 must hash alike.
    double v = s.value.value() == 0.0 ? 0.0 : s.value.value();
    std::size_t h = std::hash<double>{}(v);
    ConditionHash ch;
    for (const auto& c : s.conditions) {
        hash_mix(h, ch(c));
    }
    return h;
}

}  // namespace treestrat
