#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "io/encoding.hpp"
#include "pipeline/pipeline.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include "util/nulls.hpp"

namespace csvsa {

struct AppOptions {
    // Required/paths
    std::string input;
    std::string output;
    std::string run_summary;            // empty = no summary

    // Sampling
    double      sample_frac = 1.0;      // (0..1]
    std::size_t rows = 0;
    bool        has_sample_frac = false;
    bool        has_rows = false;
    std::vector<std::string> keep;
    bool        has_keep = false;

    // Anonymization
    std::vector<std::string> columns;
    std::vector<std::string> null_tokens = default_null_tokens();
    double      categorical_ratio = 0.5;
    std::size_t categorical_max = 50;
    std::uint64_t seed = 0;
    bool        has_seed = false;

    // CSV parsing
    std::string delimiter = ",";
    std::string output_delimiter;       // empty = same as input
    std::string quote     = "\"";
    bool        no_header = false;
    std::string encoding  = "utf-8";
    std::string output_encoding = "utf-8";

    // Logging
    bool verbose = false;
    bool quiet = false;
};

// "\t" and "tab" are accepted for a tab delimiter.
inline std::string unescape_delimiter(const std::string& s) {
    if (s == "\\t" || s == "tab" || s == "TAB") return "\t";
    return s;
}

inline void validate_cli(AppOptions& opt) {
    opt.delimiter = unescape_delimiter(opt.delimiter);
    opt.output_delimiter = unescape_delimiter(opt.output_delimiter);

    // --- Validation ---
    auto one_char = [](const std::string& s, const char* name){
        if (s.size() != 1)
            throw CLI::ValidationError{name, "must be a single character"};
    };
    one_char(opt.delimiter, "delimiter");
    one_char(opt.quote,     "quote");
    if (!opt.output_delimiter.empty()) one_char(opt.output_delimiter, "output-delimiter");

    if (opt.has_sample_frac && !(opt.sample_frac > 0.0 && opt.sample_frac <= 1.0))
        throw CLI::ValidationError{"sample-size", "must be in (0, 1]"};
}

// Thrown by parse_cli once CLI11 has printed help, version or a usage error.
struct cli_exit {
    int code = 0;
};

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"CSV sample anonymizer: sample rows/columns and synthesize sensitive values"};
    app.set_version_flag("--version", "0.1.0");
    app.set_config("--config", "", "Read options from a TOML/INI file");

    // Required/basic
    app.add_option("-i,--input",  opt.input,  "Path to input CSV")->required();
    app.add_option("-o,--output", opt.output, "Path to output CSV")->required();
    app.add_option("--run-summary", opt.run_summary, "Write a JSON run summary to this path");

    // Sampling
    auto* frac = app.add_option("-s,--sample-size", opt.sample_frac,
                                "Fraction of rows to keep, in (0, 1]");
    auto* rows = app.add_option("-n,--rows", opt.rows, "Number of rows to keep");
    frac->excludes(rows);
    auto* keep = app.add_option("-k,--keep", opt.keep, "Columns to retain (default: all)");

    // Anonymization
    app.add_option("-c,--columns", opt.columns, "Sensitive columns to anonymize");
    app.add_option("--null-token", opt.null_tokens,
                   "Cell values treated as null (replaces the default set)");
    app.add_option("--categorical-ratio", opt.categorical_ratio,
                   "Max distinct/non-null ratio for a categorical column")->default_val(0.5);
    app.add_option("--categorical-max", opt.categorical_max,
                   "Max distinct values for a categorical column")->default_val(50);
    auto* seed = app.add_option("--seed", opt.seed, "Random seed for reproducible output");

    // CSV parsing
    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("--output-delimiter", opt.output_delimiter,
                   "Output delimiter (default: same as input)");
    app.add_option("-q,--quote", opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_flag("--no_header,--no-header", opt.no_header, "Input has no header row");
    app.add_option("-e,--encoding", opt.encoding,
                   "Input encoding: utf-8, utf-8-sig, latin-1, ascii or auto")->default_val("utf-8");
    app.add_option("--output-encoding", opt.output_encoding,
                   "Output encoding: utf-8, utf-8-sig, latin-1 or ascii")->default_val("utf-8");

    // Logging
    auto* verbose = app.add_flag("-v,--verbose", opt.verbose, "Debug logging");
    auto* quiet = app.add_flag("--quiet", opt.quiet, "Errors only");
    verbose->excludes(quiet);

    try {
        app.parse(argc, argv);
        opt.has_sample_frac = frac->count() > 0;
        opt.has_rows = rows->count() > 0;
        opt.has_keep = keep->count() > 0;
        opt.has_seed = seed->count() > 0;
        validate_cli(opt);
    } catch (const CLI::ParseError& e) {
        throw cli_exit{app.exit(e)};
    }
    return opt;
}

inline log_level log_level_for(const AppOptions& opt) {
    if (opt.quiet) return log_level::error;
    if (opt.verbose) return log_level::debug;
    return log_level::info;
}

// Unknown input encodings are input errors, unknown output encodings specification errors.
inline pipeline_config to_pipeline_config(const AppOptions& opt) {
    pipeline_config cfg;
    cfg.input = opt.input;
    cfg.output = opt.output;

    if (!parse_encoding_name(opt.encoding, cfg.read.encoding))
        throw input_error("unsupported input encoding '" + opt.encoding + "'");
    if (!parse_encoding_name(opt.output_encoding, cfg.write.encoding))
        throw specification_error("unsupported output encoding '" + opt.output_encoding + "'");

    cfg.read.dialect.delimiter = opt.delimiter[0];
    cfg.read.dialect.quote = opt.quote[0];
    cfg.read.has_header = !opt.no_header;
    cfg.write.dialect.delimiter = opt.output_delimiter.empty() ? opt.delimiter[0] : opt.output_delimiter[0];
    cfg.write.dialect.quote = opt.quote[0];

    if (opt.has_rows) cfg.sample.row_count = opt.rows;
    if (opt.has_sample_frac) cfg.sample.row_fraction = opt.sample_frac;
    if (opt.has_keep) cfg.sample.columns_to_keep = opt.keep;

    cfg.sensitive_columns = opt.columns;
    cfg.profiler.null_tokens = opt.null_tokens;
    cfg.profiler.categorical_ratio = opt.categorical_ratio;
    cfg.profiler.categorical_max = opt.categorical_max;
    if (opt.has_seed) cfg.seed = opt.seed;
    return cfg;
}

}
