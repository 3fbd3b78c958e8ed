#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "csv/tokenizer.hpp"

namespace csvsa {

// Quotes a field only when it would not survive a round trip otherwise.
inline void append_csv_field(std::string& out, std::string_view value, const csv_dialect& d,
                             bool force_quote = false) {
    const bool needs_quoting = force_quote ||
        value.find(d.delimiter) != std::string_view::npos ||
        value.find(d.quote) != std::string_view::npos ||
        value.find('\n') != std::string_view::npos ||
        value.find('\r') != std::string_view::npos;

    if (!needs_quoting) {
        out.append(value.data(), value.size());
        return;
    }
    out.push_back(d.quote);
    for (char c : value) {
        if (c == d.quote) out.push_back(d.quote);
        out.push_back(c);
    }
    out.push_back(d.quote);
}

// Appends one record terminated by '\n'. A lone empty field is quoted so the
// line is not mistaken for a blank line when read back.
inline void append_csv_record(std::string& out, const std::vector<std::string>& fields,
                              const csv_dialect& d) {
    const bool lone_empty = fields.size() == 1 && fields[0].empty();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out.push_back(d.delimiter);
        append_csv_field(out, fields[i], d, lone_empty);
    }
    out.push_back('\n');
}

}
