// src/pipeline/pipeline.hpp
#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "anonymize/anonymizer.hpp"
#include "io/file_stats.hpp"
#include "io/table_io.hpp"
#include "metrics/timers.hpp"
#include "profile/profiler.hpp"
#include "sample/sampler.hpp"
#include "synth/synthesizer.hpp"
#include "table/table.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

namespace csvsa {

struct pipeline_config {
    std::filesystem::path input;
    std::filesystem::path output;
    read_options  read{};
    write_options write{};
    sample_spec   sample{};
    std::vector<std::string> sensitive_columns;
    profiler_options profiler{};
    std::optional<std::uint64_t> seed;
};

enum class pipeline_state { created, loaded, sampled, anonymized, written };

inline const char* to_string(pipeline_state s) {
    switch (s) {
        case pipeline_state::created:    return "created";
        case pipeline_state::loaded:     return "loaded";
        case pipeline_state::sampled:    return "sampled";
        case pipeline_state::anonymized: return "anonymized";
        default:                         return "written";
    }
}

struct pipeline_result {
    std::size_t rows_in = 0;
    std::size_t columns_in = 0;
    std::size_t rows_out = 0;
    std::size_t columns_out = 0;
    std::uintmax_t input_bytes = 0;
    std::uintmax_t output_bytes = 0;
    std::vector<StageTiming> stages;
    std::vector<anonymized_column> anonymized;
};

inline void validate_dialect(const csv_dialect& d, const char* which) {
    auto bad = [](char c) { return c == '\n' || c == '\r' || c == '\0'; };
    if (bad(d.delimiter) || bad(d.quote))
        throw specification_error(fmt::format("{} delimiter and quote must be printable characters", which));
    if (d.delimiter == d.quote)
        throw specification_error(fmt::format("{} delimiter and quote must differ", which));
}

inline void validate_config(const pipeline_config& cfg) {
    if (cfg.input.empty())  throw specification_error("no input path given");
    if (cfg.output.empty()) throw specification_error("no output path given");
    validate_dialect(cfg.read.dialect, "input");
    validate_dialect(cfg.write.dialect, "output");
    if (cfg.write.encoding == text_encoding::auto_detect)
        throw specification_error("output encoding must be named explicitly ('auto' is input-only)");
    validate_sample_spec(cfg.sample);
    if (!(cfg.profiler.categorical_ratio >= 0.0 && cfg.profiler.categorical_ratio <= 1.0))
        throw specification_error(fmt::format("categorical ratio {} must be in [0, 1]",
                                              cfg.profiler.categorical_ratio));
}

/**
 * Load -> sample -> anonymize -> write, strictly in that order.
 *
 * Column names are checked right after loading, so a bad name stops the run before
 * any transformation. Nothing is written until write(), and write_table() only
 * renames a complete file into place.
 */
class pipeline {
public:
    explicit pipeline(pipeline_config cfg)
        : cfg_(std::move(cfg)), rng_(make_rng(cfg_.seed))
    {
        validate_config(cfg_);
    }

    pipeline_state state() const noexcept { return state_; }
    const table& data() const noexcept { return data_; }
    const pipeline_result& result() const noexcept { return result_; }

    void load() {
        expect(pipeline_state::created, "load");
        StageTimer st("load");

        data_ = read_table(cfg_.input, cfg_.read);
        result_.rows_in = data_.row_count();
        result_.columns_in = data_.column_count();
        result_.input_bytes = file_size_bytes(cfg_.input);
        log_info("loaded {} rows x {} columns from {}", data_.row_count(), data_.column_count(),
                 cfg_.input.string());

        resolve_names();

        result_.stages.push_back(st.stop());
        state_ = pipeline_state::loaded;
    }

    void sample() {
        expect(pipeline_state::loaded, "sample");
        StageTimer st("sample");

        if (cfg_.sample.row_count && *cfg_.sample.row_count > data_.row_count())
            log_warn("asked for {} rows but the input has {}; keeping all of them",
                     *cfg_.sample.row_count, data_.row_count());
        data_ = sample_table(data_, cfg_.sample, rng_);
        log_info("sampled {} of {} rows, {} columns kept", data_.row_count(), result_.rows_in,
                 data_.column_count());

        result_.stages.push_back(st.stop());
        state_ = pipeline_state::sampled;
    }

    void anonymize() {
        expect(pipeline_state::sampled, "anonymize");
        StageTimer st("anonymize");

        anonymize_result res = anonymize_table(data_, sensitive_, cfg_.profiler, rng_);
        data_ = std::move(res.data);
        for (const auto& c : res.columns) {
            log_info("anonymized column '{}' as {} ({} cells, null fraction {:.3f})",
                     c.name, to_string(c.kind), c.cells, c.null_fraction);
            log_debug("column '{}': {} distinct non-null values", c.name, c.distinct_count);
        }
        if (res.columns.empty()) log_info("no sensitive columns declared; values left as sampled");
        result_.anonymized = std::move(res.columns);

        result_.stages.push_back(st.stop());
        state_ = pipeline_state::anonymized;
    }

    void write() {
        expect(pipeline_state::anonymized, "write");
        StageTimer st("write");

        write_table(cfg_.output, data_, cfg_.write);
        result_.rows_out = data_.row_count();
        result_.columns_out = data_.column_count();
        result_.output_bytes = file_size_bytes(cfg_.output);

        result_.stages.push_back(st.stop());
        state_ = pipeline_state::written;
    }

    const pipeline_result& run() {
        load();
        sample();
        anonymize();
        write();
        return result_;
    }

private:
    void expect(pipeline_state s, const char* op) const {
        if (state_ != s)
            throw std::logic_error(fmt::format("pipeline: {}() called in state '{}', expected '{}'",
                                               op, to_string(state_), to_string(s)));
    }

    // Maps caller names to header names and checks every sensitive column survives sampling.
    void resolve_names() {
        std::vector<std::size_t> kept;
        if (cfg_.sample.columns_to_keep)
            kept = resolve_columns(data_, *cfg_.sample.columns_to_keep, "retained");

        const std::vector<std::size_t> sensitive =
            resolve_columns(data_, cfg_.sensitive_columns, "sensitive");

        sensitive_.clear();
        for (std::size_t idx : sensitive) {
            if (cfg_.sample.columns_to_keep &&
                std::find(kept.begin(), kept.end(), idx) == kept.end()) {
                throw specification_error(fmt::format(
                    "sensitive column '{}' is not among the retained columns", data_.header[idx]));
            }
            sensitive_.push_back(data_.header[idx]);
        }
    }

    pipeline_config cfg_;
    rng_type rng_;
    pipeline_state state_ = pipeline_state::created;
    table data_;
    std::vector<std::string> sensitive_;
    pipeline_result result_;
};

}
