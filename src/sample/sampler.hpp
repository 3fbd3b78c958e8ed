#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "synth/synthesizer.hpp"
#include "table/table.hpp"
#include "util/errors.hpp"

namespace csvsa {

// At most one of row_count / row_fraction; neither keeps every row.
struct sample_spec {
    std::optional<std::size_t>              row_count;
    std::optional<double>                   row_fraction;
    std::optional<std::vector<std::string>> columns_to_keep;
};

inline void validate_sample_spec(const sample_spec& spec) {
    if (spec.row_count && spec.row_fraction)
        throw specification_error("give either a row count or a row fraction, not both");
    if (spec.row_fraction) {
        const double f = *spec.row_fraction;
        if (!(f > 0.0 && f <= 1.0))
            throw specification_error(fmt::format("row fraction {} must be in (0, 1]", f));
    }
}

inline std::size_t target_row_count(const sample_spec& spec, std::size_t total_rows) {
    if (spec.row_count) return std::min(*spec.row_count, total_rows);
    if (spec.row_fraction) {
        const double want = std::round(static_cast<double>(total_rows) * *spec.row_fraction);
        return std::min(static_cast<std::size_t>(want), total_rows);
    }
    return total_rows;
}

// k distinct indices out of [0, n), ascending. Partial Fisher-Yates over the index range.
inline std::vector<std::size_t> choose_indices(std::size_t n, std::size_t k, rng_type& rng) {
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    if (k >= n) return idx;

    for (std::size_t i = 0; i < k; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, n - 1);
        std::swap(idx[i], idx[pick(rng)]);
    }
    idx.resize(k);
    std::sort(idx.begin(), idx.end());
    return idx;
}

// Selected rows keep their original relative order; kept columns keep header order.
inline table sample_table(const table& in, const sample_spec& spec, rng_type& rng) {
    validate_sample_spec(spec);

    std::vector<std::size_t> cols;
    if (spec.columns_to_keep) {
        cols = resolve_columns(in, *spec.columns_to_keep, "retained");
        std::sort(cols.begin(), cols.end());
    } else {
        cols.resize(in.column_count());
        std::iota(cols.begin(), cols.end(), std::size_t{0});
    }

    const std::size_t k = target_row_count(spec, in.row_count());
    const std::vector<std::size_t> rows = choose_indices(in.row_count(), k, rng);

    table out;
    out.has_header = in.has_header;
    out.header.reserve(cols.size());
    // headerless tables keep their original positional names (column_3 stays column_3)
    for (std::size_t c : cols) out.header.push_back(in.header[c]);

    out.rows.reserve(rows.size());
    for (std::size_t r : rows) {
        std::vector<std::string> row;
        row.reserve(cols.size());
        for (std::size_t c : cols) row.push_back(in.rows[r][c]);
        out.rows.push_back(std::move(row));
    }
    return out;
}

}
