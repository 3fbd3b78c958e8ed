#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "profile/profile.hpp"
#include "profile/profiler.hpp"
#include "synth/synthesizer.hpp"
#include "table/table.hpp"

namespace csvsa {

// What happened to one sensitive column; the profile itself is not kept.
struct anonymized_column {
    std::string name;
    column_kind kind = column_kind::text;
    double      null_fraction = 0.0;
    std::size_t distinct_count = 0;
    std::size_t cells = 0;
};

struct anonymize_result {
    table data;
    std::vector<anonymized_column> columns;
};

// Replaces every cell of the named columns with synthesized values.
// Names are resolved before anything is replaced; an unknown or ambiguous name throws
// specification_error. Profiles are taken from `in`, i.e. from the sampled rows.
inline anonymize_result anonymize_table(const table& in,
                                        const std::vector<std::string>& sensitive_columns,
                                        const profiler_options& popt,
                                        rng_type& rng) {
    const std::vector<std::size_t> targets = resolve_columns(in, sensitive_columns, "sensitive");

    anonymize_result res;
    res.data = in;
    res.columns.reserve(targets.size());

    value_synthesizer synth(rng, popt.null_tokens);
    for (std::size_t col : targets) {
        const column_profile profile = profile_column(column_view(in, col), popt);
        for (auto& row : res.data.rows) row[col] = synth.synthesize(profile);

        anonymized_column info;
        info.name = in.header[col];
        info.kind = kind_of(profile);
        info.null_fraction = profile.null_fraction;
        info.distinct_count = profile.distinct_count;
        info.cells = in.row_count();
        res.columns.push_back(std::move(info));
    }
    return res;
}

}
