#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "cli/cli_options.hpp"
#include "util/errors.hpp"

using namespace csvsa;

namespace {
AppOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "csvsa");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
    try {
        parse(std::move(args));
    } catch (const cli_exit& e) {
        return e.code;
    }
    return -1;
}
}

TEST(CliOptionsTest, MinimalInvocationUsesDefaults) {
    const AppOptions opt = parse({"-i", "in.csv", "-o", "out.csv"});
    EXPECT_EQ(opt.input, "in.csv");
    EXPECT_EQ(opt.output, "out.csv");
    EXPECT_FALSE(opt.has_rows);
    EXPECT_FALSE(opt.has_sample_frac);
    EXPECT_FALSE(opt.has_seed);
    EXPECT_EQ(opt.delimiter, ",");
    EXPECT_EQ(log_level_for(opt), log_level::info);

    const pipeline_config cfg = to_pipeline_config(opt);
    EXPECT_FALSE(cfg.sample.row_count);
    EXPECT_FALSE(cfg.sample.row_fraction);
    EXPECT_FALSE(cfg.sample.columns_to_keep);
    EXPECT_TRUE(cfg.sensitive_columns.empty());
    EXPECT_TRUE(cfg.read.has_header);
    EXPECT_EQ(cfg.read.encoding, text_encoding::utf8);
    EXPECT_FALSE(cfg.seed);
}

TEST(CliOptionsTest, MapsEveryOptionIntoTheConfig) {
    const AppOptions opt = parse({"-i", "in.csv", "-o", "out.csv", "-s", "0.25",
                                  "-c", "email", "phone", "-k", "id", "email", "phone",
                                  "--no_header", "-e", "latin-1", "--output-encoding", "utf-8-sig",
                                  "-d", ";", "--output-delimiter", "tab", "--seed", "42",
                                  "--categorical-max", "10", "--null-token", "-", "--null-token", "?",
                                  "-v"});
    EXPECT_EQ(log_level_for(opt), log_level::debug);

    const pipeline_config cfg = to_pipeline_config(opt);
    ASSERT_TRUE(cfg.sample.row_fraction);
    EXPECT_DOUBLE_EQ(*cfg.sample.row_fraction, 0.25);
    ASSERT_TRUE(cfg.sample.columns_to_keep);
    EXPECT_EQ(*cfg.sample.columns_to_keep, (std::vector<std::string>{"id", "email", "phone"}));
    EXPECT_EQ(cfg.sensitive_columns, (std::vector<std::string>{"email", "phone"}));
    EXPECT_FALSE(cfg.read.has_header);
    EXPECT_EQ(cfg.read.encoding, text_encoding::latin1);
    EXPECT_EQ(cfg.write.encoding, text_encoding::utf8_sig);
    EXPECT_EQ(cfg.read.dialect.delimiter, ';');
    EXPECT_EQ(cfg.write.dialect.delimiter, '\t');
    ASSERT_TRUE(cfg.seed);
    EXPECT_EQ(*cfg.seed, 42u);
    EXPECT_EQ(cfg.profiler.categorical_max, 10u);
    EXPECT_EQ(cfg.profiler.null_tokens, (std::vector<std::string>{"-", "?"}));
}

TEST(CliOptionsTest, RowCountOption) {
    const pipeline_config cfg = to_pipeline_config(parse({"-i", "a", "-o", "b", "-n", "100", "--quiet"}));
    ASSERT_TRUE(cfg.sample.row_count);
    EXPECT_EQ(*cfg.sample.row_count, 100u);
    EXPECT_FALSE(cfg.sample.row_fraction);
}

TEST(CliOptionsTest, OutputDelimiterDefaultsToInputDelimiter) {
    const pipeline_config cfg = to_pipeline_config(parse({"-i", "a", "-o", "b", "-d", "\\t"}));
    EXPECT_EQ(cfg.read.dialect.delimiter, '\t');
    EXPECT_EQ(cfg.write.dialect.delimiter, '\t');
}

TEST(CliOptionsTest, UsageErrorsExitNonZero) {
    EXPECT_NE(exit_code_of({"-o", "out.csv"}), 0);                                 // missing -i
    EXPECT_NE(exit_code_of({"-i", "a", "-o", "b", "-s", "0.5", "-n", "3"}), 0);    // both sizes
    EXPECT_NE(exit_code_of({"-i", "a", "-o", "b", "-s", "1.5"}), 0);
    EXPECT_NE(exit_code_of({"-i", "a", "-o", "b", "-d", ";;"}), 0);
    EXPECT_NE(exit_code_of({"-i", "a", "-o", "b", "-v", "--quiet"}), 0);
}

TEST(CliOptionsTest, VersionExitsWithZero) {
    EXPECT_EQ(exit_code_of({"--version"}), 0);
}

TEST(CliOptionsTest, UnknownEncodingsMapToTheirErrorKinds) {
    EXPECT_THROW(to_pipeline_config(parse({"-i", "a", "-o", "b", "-e", "ebcdic"})), input_error);
    EXPECT_THROW(to_pipeline_config(parse({"-i", "a", "-o", "b", "--output-encoding", "ebcdic"})),
                 specification_error);
}
