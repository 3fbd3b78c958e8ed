// src/table/table.hpp
#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types/infer.hpp"
#include "util/errors.hpp"

namespace csvsa {

// ---------- data model ----------
// Row-major, every row has header.size() cells. Headerless tables carry
// positional names (column_0, column_1, ...) that are never written out.
struct table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    bool has_header = true;

    std::size_t row_count() const noexcept { return rows.size(); }
    std::size_t column_count() const noexcept { return header.size(); }
};

inline std::string positional_name(std::size_t i) {
    return fmt::format("column_{}", i);
}

inline std::vector<std::string> positional_header(std::size_t columns) {
    std::vector<std::string> names;
    names.reserve(columns);
    for (std::size_t i = 0; i < columns; ++i) names.push_back(positional_name(i));
    return names;
}

// ---------- column lookup ----------
// Headerless tables also accept a bare decimal index ("0", "1", ...).
inline std::size_t resolve_column(const table& t, std::string_view name, const char* role) {
    std::optional<std::size_t> found;
    std::size_t matches = 0;
    for (std::size_t i = 0; i < t.header.size(); ++i) {
        if (t.header[i] == name) {
            if (!found) found = i;
            ++matches;
        }
    }
    if (matches > 1)
        throw specification_error(fmt::format("{} column '{}' is ambiguous: the header names it {} times",
                                              role, name, matches));
    if (found) return *found;

    if (!t.has_header) {
        if (auto idx = parse_int64(name); idx && *idx >= 0 &&
            static_cast<std::size_t>(*idx) < t.column_count()) {
            return static_cast<std::size_t>(*idx);
        }
    }
    throw specification_error(fmt::format("{} column '{}' not found in the input header", role, name));
}

// Resolves names in the order given; repeated names collapse to one index.
inline std::vector<std::size_t> resolve_columns(const table& t,
                                                const std::vector<std::string>& names,
                                                const char* role) {
    std::vector<std::size_t> out;
    out.reserve(names.size());
    for (const auto& n : names) {
        const std::size_t idx = resolve_column(t, n, role);
        bool seen = false;
        for (std::size_t o : out) seen = seen || (o == idx);
        if (!seen) out.push_back(idx);
    }
    return out;
}

inline std::vector<std::string_view> column_view(const table& t, std::size_t col) {
    std::vector<std::string_view> out;
    out.reserve(t.rows.size());
    for (const auto& row : t.rows) out.emplace_back(row[col]);
    return out;
}

}
