// src/profile/profile.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "types/infer.hpp"

namespace csvsa {

// ---------- data model ----------
struct integer_column {
    std::int64_t min = 0;
    std::int64_t max = 0;
};

struct float_column {
    double min = 0.0;
    double max = 0.0;
    int decimals = 0;               // -1: print shortest round-trip form
};

struct categorical_column {
    std::vector<std::string> categories;   // sorted, original spelling
};

struct text_column {
    std::size_t min_length = 0;     // code points
    std::size_t max_length = 0;
};

struct boolean_column {
    std::string true_literal  = "true";
    std::string false_literal = "false";
};

using column_shape = std::variant<integer_column, float_column, categorical_column,
                                  text_column, boolean_column>;

struct column_profile {
    column_shape  shape = text_column{};
    double        null_fraction = 0.0;
    std::size_t   distinct_count = 0;      // over non-null values
    std::size_t   total_count = 0;
    std::string   null_token;              // emitted for synthesized nulls
};

inline column_kind kind_of(const column_profile& p) {
    struct visitor {
        column_kind operator()(const integer_column&) const     { return column_kind::integer; }
        column_kind operator()(const float_column&) const       { return column_kind::floating; }
        column_kind operator()(const categorical_column&) const { return column_kind::categorical; }
        column_kind operator()(const text_column&) const        { return column_kind::text; }
        column_kind operator()(const boolean_column&) const     { return column_kind::boolean; }
    };
    return std::visit(visitor{}, p.shape);
}

}
