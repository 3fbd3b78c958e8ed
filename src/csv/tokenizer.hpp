#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "util/errors.hpp"

namespace csvsa {

struct csv_dialect {
    char delimiter = ',';
    char quote     = '"';
};

struct csv_record {
    std::vector<std::string> fields;
    std::size_t line = 0;       // 1-based physical line where the record starts
};

// Splits a decoded buffer into records.
// Handles RFC4180 quotes (doubled quote = literal), delimiters and line breaks inside
// quotes, and LF / CRLF / CR line endings. Lines with no characters at all are skipped.
inline std::vector<csv_record> tokenize_csv(std::string_view text, const csv_dialect& d) {
    std::vector<csv_record> out;

    bool in_quotes = false;
    bool at_line_start = true;
    bool prev_was_cr = false;
    std::size_t line = 1;
    std::size_t quote_line = 0;

    csv_record cur;
    std::string field;

    auto finish_field = [&]() {
        cur.fields.push_back(std::move(field));
        field.clear();
    };
    auto finish_row = [&]() {
        finish_field();
        out.push_back(std::move(cur));
        cur = csv_record{};
        at_line_start = true;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (prev_was_cr) {
            prev_was_cr = false;
            if (c == '\n') continue; // CRLF already ended the row on CR
        }

        if (at_line_start) {
            if (!in_quotes && (c == '\n' || c == '\r')) {
                // blank line
                if (c == '\r') prev_was_cr = true;
                ++line;
                continue;
            }
            cur.line = line;
            at_line_start = false;
        }

        if (in_quotes) {
            if (c == d.quote) {
                if (i + 1 < text.size() && text[i + 1] == d.quote) {
                    field.push_back(d.quote);
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n' || (c == '\r' && !(i + 1 < text.size() && text[i + 1] == '\n'))) ++line;
                field.push_back(c);
            }
            continue;
        }

        if (c == d.quote && field.empty()) {
            in_quotes = true;
            quote_line = line;
        } else if (c == d.delimiter) {
            finish_field();
        } else if (c == '\n' || c == '\r') {
            finish_row();
            ++line;
            if (c == '\r') prev_was_cr = true;
        } else {
            field.push_back(c);
        }
    }

    if (in_quotes)
        throw input_error(fmt::format("unterminated quoted field starting on line {}", quote_line));

    // last line without a trailing newline
    if (!at_line_start) finish_row();

    return out;
}

}
