#pragma once
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "util/strings.hpp"

namespace csvsa {

enum class column_kind { integer, floating, boolean, categorical, text };

inline const char* to_string(column_kind k) {
    switch (k) {
        case column_kind::integer:     return "integer";
        case column_kind::floating:    return "float";
        case column_kind::boolean:     return "boolean";
        case column_kind::categorical: return "categorical";
        default:                       return "text";
    }
}

// Optional sign followed by digits, within int64 range. Surrounding whitespace is ignored.
inline std::optional<std::int64_t> parse_int64(std::string_view raw) {
    std::string_view s = trim_view(raw);
    const bool plus = !s.empty() && s[0] == '+';
    if (plus) s.remove_prefix(1);
    if (s.empty() || (plus && s[0] == '-')) return std::nullopt;
    std::int64_t v = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return v;
}

// Plain decimal notation with optional fraction and exponent; rejects inf, nan and hex.
inline bool is_float64(std::string_view raw) {
    std::string_view s = trim_view(raw);
    if (s.empty()) return false;
    bool dot = false, exp = false, digit = false, exp_digit = false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (exp) exp_digit = true; else digit = true;
            continue;
        }
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            continue;
        }
        return false;
    }
    return digit && (!exp || exp_digit);
}

inline std::optional<double> parse_float64(std::string_view raw) {
    if (!is_float64(raw)) return std::nullopt;
    const std::string t(trim_view(raw));
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return std::nullopt;
    // out-of-range literals ("1e400") come back as inf
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

// Digits after the decimal point, or -1 when the value uses exponent notation.
inline int float_decimals(std::string_view raw) {
    std::string_view s = trim_view(raw);
    if (s.find_first_of("eE") != std::string_view::npos) return -1;
    const auto dot = s.find('.');
    if (dot == std::string_view::npos) return 0;
    return static_cast<int>(s.size() - dot - 1);
}

enum class bool_literal { none, true_, false_ };

inline bool_literal classify_bool(std::string_view raw) {
    std::string_view s = trim_view(raw);
    if (ieq(s, "true") || ieq(s, "yes"))  return bool_literal::true_;
    if (ieq(s, "false") || ieq(s, "no"))  return bool_literal::false_;
    return bool_literal::none;
}

}
