// src/io/table_io.hpp
#pragma once
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "csv/tokenizer.hpp"
#include "csv/writer.hpp"
#include "io/chunk_reader.hpp"
#include "io/encoding.hpp"
#include "io/file_stats.hpp"
#include "table/table.hpp"
#include "util/errors.hpp"

namespace csvsa {

struct read_options {
    text_encoding encoding = text_encoding::utf8;
    csv_dialect   dialect{};
    bool          has_header = true;
    std::size_t   chunk_bytes = 262144;
};

struct write_options {
    text_encoding encoding = text_encoding::utf8;
    csv_dialect   dialect{};
};

// ---------- read ----------
inline table read_table(const std::filesystem::path& path, const read_options& opt) {
    if (!is_readable_file(path))
        throw input_error("input file not found: " + path.string());

    std::string text = decode_to_utf8(read_all_bytes(path, opt.chunk_bytes), opt.encoding);
    std::vector<csv_record> records = tokenize_csv(text, opt.dialect);

    table t;
    t.has_header = opt.has_header;
    if (records.empty()) return t;

    const std::size_t width = records.front().fields.size();
    for (const auto& r : records) {
        if (r.fields.size() != width)
            throw input_error(fmt::format("{}: line {} has {} fields, expected {}",
                                          path.string(), r.line, r.fields.size(), width));
    }

    std::size_t first_data = 0;
    if (opt.has_header) {
        t.header = std::move(records.front().fields);
        first_data = 1;
    } else {
        t.header = positional_header(width);
    }
    t.rows.reserve(records.size() - first_data);
    for (std::size_t i = first_data; i < records.size(); ++i)
        t.rows.push_back(std::move(records[i].fields));
    return t;
}

// ---------- write ----------
// Sibling temp file that is removed unless commit() renamed it over the destination.
class scoped_temp_file {
public:
    explicit scoped_temp_file(std::filesystem::path dest)
        : dest_(std::move(dest)),
          tmp_(dest_.parent_path() / (dest_.filename().string() + ".csvsa-tmp")) {}

    scoped_temp_file(const scoped_temp_file&) = delete;
    scoped_temp_file& operator=(const scoped_temp_file&) = delete;

    ~scoped_temp_file() {
        if (!committed_) {
            std::error_code ec;
            std::filesystem::remove(tmp_, ec);
        }
    }

    const std::filesystem::path& path() const { return tmp_; }

    void commit() {
        std::error_code ec;
        std::filesystem::rename(tmp_, dest_, ec);
        if (ec)
            throw output_error(fmt::format("cannot move {} into place: {}", dest_.string(), ec.message()));
        committed_ = true;
    }

private:
    std::filesystem::path dest_;
    std::filesystem::path tmp_;
    bool committed_ = false;
};

inline std::string format_table(const table& t, const csv_dialect& d) {
    std::string out;
    // an empty input has no header line to give back
    if (t.has_header && !t.header.empty()) append_csv_record(out, t.header, d);
    for (const auto& row : t.rows) append_csv_record(out, row, d);
    return out;
}

// Either the whole file lands at path or nothing there changes.
inline void write_table(const std::filesystem::path& path, const table& t, const write_options& opt) {
    const std::string bytes = encode_from_utf8(format_table(t, opt.dialect), opt.encoding);

    const auto parent = path.parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec))
        throw output_error("output directory does not exist: " + parent.string());

    scoped_temp_file tmp(path);
    {
        std::ofstream f(tmp.path(), std::ios::binary | std::ios::trunc);
        if (!f) throw output_error("cannot open for write: " + tmp.path().string());
        f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        f.flush();
        if (!f) throw output_error("write failed: " + tmp.path().string());
        f.close();
        if (f.fail()) throw output_error("close failed: " + tmp.path().string());
    }
    tmp.commit();
}

}
