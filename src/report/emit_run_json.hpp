#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pipeline/pipeline.hpp"
#include "util/errors.hpp"

namespace csvsa {

// Minimal JSON string escaper for paths and column names.
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 16);
    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

struct RunInfo {
    std::string started_iso;
    std::string ended_iso;
    double      wall_ms = 0.0;
    std::string input_path;
    std::string output_path;
    std::optional<std::uint64_t> seed;
};

// Writes the run summary (schema v1). Column profiles are not included, only the
// inferred type and null fraction of each anonymized column.
inline void emit_run_json(const std::filesystem::path& out_path,
                          const RunInfo& info,
                          const pipeline_result& r)
{
    std::string s;
    s += "{\n";
    s += R"(  "version":"1",)";
    s += "\n  " + fmt::format(R"("started_at":"{}",)", info.started_iso);
    s += "\n  " + fmt::format(R"("ended_at":"{}",)", info.ended_iso);
    s += "\n  " + fmt::format(R"("wall_time_ms":{:.3f},)", info.wall_ms);
    s += "\n  " + fmt::format(R"("input":{{"path":"{}","bytes":{},"rows":{},"columns":{}}},)",
                              json_escape(info.input_path), r.input_bytes, r.rows_in, r.columns_in);
    s += "\n  " + fmt::format(R"("output":{{"path":"{}","bytes":{},"rows":{},"columns":{}}},)",
                              json_escape(info.output_path), r.output_bytes, r.rows_out, r.columns_out);
    s += "\n  " + (info.seed ? fmt::format(R"("seed":{},)", *info.seed) : std::string(R"("seed":null,)"));

    s += "\n  \"stages\":[\n";
    for (std::size_t i = 0; i < r.stages.size(); ++i) {
        const auto& st = r.stages[i];
        s += fmt::format(R"(    {{"name":"{}","ms":{:.3f}}})", json_escape(st.name), st.ms);
        if (i + 1 < r.stages.size()) s += ",";
        s += "\n";
    }
    s += "  ],\n";

    s += "  \"anonymized_columns\":[\n";
    for (std::size_t i = 0; i < r.anonymized.size(); ++i) {
        const auto& c = r.anonymized[i];
        s += fmt::format(R"(    {{"name":"{}","type":"{}","cells":{},"null_fraction":{:.6f}}})",
                         json_escape(c.name), to_string(c.kind), c.cells, c.null_fraction);
        if (i + 1 < r.anonymized.size()) s += ",";
        s += "\n";
    }
    s += "  ]\n";
    s += "}\n";

    std::ofstream f(out_path, std::ios::binary | std::ios::trunc);
    if (!f) throw output_error("cannot open run summary for write: " + out_path.string());
    f << s;
    f.flush();
    if (!f) throw output_error("write failed: " + out_path.string());
}

}
