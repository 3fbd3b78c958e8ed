#pragma once
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "profile/profile.hpp"
#include "types/infer.hpp"
#include "util/nulls.hpp"
#include "util/strings.hpp"

namespace csvsa {

struct profiler_options {
    std::vector<std::string> null_tokens = default_null_tokens();
    double      categorical_ratio = 0.5;   // distinct / non-null
    std::size_t categorical_max   = 50;
};

// "yes" -> "no", "TRUE" -> "FALSE", "True" -> "False"
inline std::string bool_counterpart(std::string_view seen) {
    const std::string lower = to_lower(seen);
    std::string other;
    if (lower == "true")       other = "false";
    else if (lower == "false") other = "true";
    else if (lower == "yes")   other = "no";
    else                       other = "yes";

    const bool all_upper = std::all_of(seen.begin(), seen.end(), [](unsigned char c) {
        return !std::isalpha(c) || std::isupper(c);
    });
    if (all_upper) {
        for (auto& c : other) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    } else if (!seen.empty() && std::isupper(static_cast<unsigned char>(seen[0]))) {
        other[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(other[0])));
    }
    return other;
}

// Pure: derives the statistical shape of one column from its raw cells.
inline column_profile profile_column(const std::vector<std::string_view>& values,
                                     const profiler_options& opt = {}) {
    // type trackers
    struct {
        bool all_int   = true;
        bool all_float = true;
        bool all_bool  = true;
    } ts;

    std::int64_t imin = std::numeric_limits<std::int64_t>::max();
    std::int64_t imax = std::numeric_limits<std::int64_t>::min();
    double fmin = std::numeric_limits<double>::infinity();
    double fmax = -std::numeric_limits<double>::infinity();
    int decimals = 0;
    std::size_t min_len = std::numeric_limits<std::size_t>::max();
    std::size_t max_len = 0;
    std::optional<std::string> true_lit, false_lit, null_tok;

    std::set<std::string_view> distinct;
    std::size_t nulls = 0, non_nulls = 0;

    for (std::string_view raw : values) {
        if (is_null_like(raw, opt.null_tokens)) {
            ++nulls;
            if (!null_tok) null_tok = std::string(raw);
            continue;
        }
        ++non_nulls;
        distinct.insert(raw);

        const std::size_t len = utf8_length(raw);
        min_len = std::min(min_len, len);
        max_len = std::max(max_len, len);

        if (ts.all_int) {
            if (auto v = parse_int64(raw)) {
                imin = std::min(imin, *v);
                imax = std::max(imax, *v);
            } else {
                ts.all_int = false;
            }
        }
        if (ts.all_float) {
            if (auto v = parse_float64(raw)) {
                fmin = std::min(fmin, *v);
                fmax = std::max(fmax, *v);
                const int d = float_decimals(raw);
                decimals = (d < 0 || decimals < 0) ? -1 : std::max(decimals, d);
            } else {
                ts.all_float = false;
            }
        }
        if (ts.all_bool) {
            switch (classify_bool(raw)) {
                case bool_literal::true_:
                    if (!true_lit) true_lit = std::string(trim_view(raw));
                    break;
                case bool_literal::false_:
                    if (!false_lit) false_lit = std::string(trim_view(raw));
                    break;
                default:
                    ts.all_bool = false;
            }
        }
    }

    column_profile p;
    p.total_count    = values.size();
    p.distinct_count = distinct.size();
    p.null_token     = null_tok ? *null_tok : std::string{};
    p.null_fraction  = (non_nulls == 0 || values.empty())
                           ? 1.0
                           : static_cast<double>(nulls) / static_cast<double>(values.size());

    if (non_nulls == 0) {
        p.shape = text_column{0, 0};
        return p;
    }

    const double ratio = static_cast<double>(distinct.size()) / static_cast<double>(non_nulls);

    if (ts.all_int) {
        p.shape = integer_column{imin, imax};
    } else if (ts.all_float) {
        p.shape = float_column{fmin, fmax, decimals};
    } else if (ts.all_bool) {
        boolean_column b;
        if (true_lit && false_lit) {
            b.true_literal = *true_lit;
            b.false_literal = *false_lit;
        } else if (true_lit) {
            b.true_literal = *true_lit;
            b.false_literal = bool_counterpart(*true_lit);
        } else {
            b.false_literal = *false_lit;
            b.true_literal = bool_counterpart(*false_lit);
        }
        p.shape = std::move(b);
    } else if (ratio <= opt.categorical_ratio && distinct.size() <= opt.categorical_max) {
        categorical_column c;
        c.categories.assign(distinct.begin(), distinct.end());
        p.shape = std::move(c);
    } else {
        p.shape = text_column{min_len, max_len};
    }
    return p;
}

}
