#include <gtest/gtest.h>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "anonymize/anonymizer.hpp"
#include "types/infer.hpp"
#include "util/errors.hpp"
#include "util/nulls.hpp"

using namespace csvsa;

namespace {
table people(std::size_t n) {
    table t;
    t.header = {"id", "email", "age", "city"};
    const char* cities[] = {"Oslo", "Lima", "Pune"};
    for (std::size_t i = 0; i < n; ++i) {
        t.rows.push_back({std::to_string(i + 1),
                          "user" + std::to_string(i) + "@example.com",
                          i % 5 == 0 ? "" : std::to_string(20 + i % 40),
                          cities[i % 3]});
    }
    return t;
}
}

TEST(AnonymizerTest, ShapeIsPreservedAndOtherColumnsPassThrough) {
    const table in = people(40);
    rng_type rng(11);
    const anonymize_result r = anonymize_table(in, {"email"}, profiler_options{}, rng);

    EXPECT_EQ(r.data.header, in.header);
    ASSERT_EQ(r.data.row_count(), in.row_count());
    for (std::size_t i = 0; i < in.row_count(); ++i) {
        ASSERT_EQ(r.data.rows[i].size(), in.rows[i].size());
        EXPECT_EQ(r.data.rows[i][0], in.rows[i][0]);
        EXPECT_EQ(r.data.rows[i][2], in.rows[i][2]);
        EXPECT_EQ(r.data.rows[i][3], in.rows[i][3]);
    }
    ASSERT_EQ(r.columns.size(), 1u);
    EXPECT_EQ(r.columns[0].name, "email");
    EXPECT_EQ(r.columns[0].kind, column_kind::text);
    EXPECT_EQ(r.columns[0].cells, 40u);
}

TEST(AnonymizerTest, TextValuesAreReplaced) {
    const table in = people(40);
    rng_type rng(12);
    const anonymize_result r = anonymize_table(in, {"email"}, profiler_options{}, rng);

    std::set<std::string> originals;
    for (const auto& row : in.rows) originals.insert(row[1]);
    for (const auto& row : r.data.rows) {
        EXPECT_EQ(originals.count(row[1]), 0u) << row[1];
        EXPECT_GE(row[1].size(), 17u);   // shortest original is user0@example.com
        EXPECT_LE(row[1].size(), 18u);
    }
}

TEST(AnonymizerTest, NumericValuesStayWithinObservedRange) {
    const table in = people(60);
    rng_type rng(13);
    const anonymize_result r = anonymize_table(in, {"age"}, profiler_options{}, rng);
    ASSERT_EQ(r.columns.size(), 1u);
    EXPECT_EQ(r.columns[0].kind, column_kind::integer);
    EXPECT_DOUBLE_EQ(r.columns[0].null_fraction, 0.2);

    for (const auto& row : r.data.rows) {
        if (row[2].empty()) continue;
        auto v = parse_int64(row[2]);
        ASSERT_TRUE(v) << row[2];
        EXPECT_GE(*v, 21);
        EXPECT_LE(*v, 59);
    }
}

TEST(AnonymizerTest, CategoricalValuesComeFromObservedSet) {
    const table in = people(30);
    rng_type rng(14);
    const anonymize_result r = anonymize_table(in, {"city"}, profiler_options{}, rng);
    EXPECT_EQ(r.columns[0].kind, column_kind::categorical);
    for (const auto& row : r.data.rows) {
        EXPECT_TRUE(row[3] == "Oslo" || row[3] == "Lima" || row[3] == "Pune") << row[3];
    }
}

TEST(AnonymizerTest, NullRateIsRoughlyPreserved) {
    const table in = people(2000);
    rng_type rng(15);
    const anonymize_result r = anonymize_table(in, {"age"}, profiler_options{}, rng);
    std::size_t nulls = 0;
    for (const auto& row : r.data.rows) nulls += row[2].empty() ? 1 : 0;
    EXPECT_NEAR(static_cast<double>(nulls) / in.row_count(), 0.2, 0.04);
}

TEST(AnonymizerTest, UnknownColumnFailsBeforeAnyChange) {
    const table in = people(5);
    rng_type rng(16);
    rng_type untouched(16);
    EXPECT_THROW(anonymize_table(in, {"email", "ssn"}, profiler_options{}, rng), specification_error);
    // nothing was drawn from the generator
    EXPECT_EQ(rng(), untouched());
}

TEST(AnonymizerTest, AmbiguousColumnIsASpecificationError) {
    table in = people(3);
    in.header[3] = "email";
    rng_type rng(17);
    try {
        anonymize_table(in, {"email"}, profiler_options{}, rng);
        FAIL() << "expected specification_error";
    } catch (const specification_error& e) {
        EXPECT_NE(std::string(e.what()).find("ambiguous"), std::string::npos);
    }
}

TEST(AnonymizerTest, EmptySensitiveListIsIdentity) {
    const table in = people(10);
    rng_type rng(18);
    const anonymize_result r = anonymize_table(in, {}, profiler_options{}, rng);
    EXPECT_EQ(r.data.rows, in.rows);
    EXPECT_TRUE(r.columns.empty());
}

TEST(AnonymizerTest, EmptyTableAnonymizesToEmptyTable) {
    const table in = people(0);
    rng_type rng(19);
    const anonymize_result r = anonymize_table(in, {"email", "age"}, profiler_options{}, rng);
    EXPECT_EQ(r.data.row_count(), 0u);
    EXPECT_EQ(r.data.header, in.header);
    ASSERT_EQ(r.columns.size(), 2u);
    EXPECT_EQ(r.columns[1].cells, 0u);
}

TEST(AnonymizerTest, OverflowingNumbersAnonymizeAsText) {
    table in;
    in.header = {"reading"};
    in.rows = {{"1.5"}, {"1e400"}, {"2.25"}, {"-3e500"}};
    rng_type rng(20);
    anonymize_result r;
    ASSERT_NO_THROW(r = anonymize_table(in, {"reading"}, profiler_options{}, rng));
    ASSERT_EQ(r.columns.size(), 1u);
    EXPECT_EQ(r.columns[0].kind, column_kind::text);
    for (const auto& row : r.data.rows) EXPECT_FALSE(row[0].empty());
}

TEST(AnonymizerTest, SynthesizedTextAvoidsConfiguredNullTokens) {
    // twenty distinct one-character values: a text column of length 1
    table in;
    in.header = {"code"};
    for (char c = '0'; c <= '9'; ++c) in.rows.push_back({std::string(1, c)});
    for (char c = 'b'; c <= 'k'; ++c) in.rows.push_back({std::string(1, c)});
    profiler_options popt;
    popt.null_tokens = {"", "x", "y", "z"};

    for (std::uint64_t seed = 0; seed < 20; ++seed) {
        rng_type rng(seed);
        const anonymize_result r = anonymize_table(in, {"code"}, popt, rng);
        ASSERT_EQ(r.columns[0].kind, column_kind::text);
        for (const auto& row : r.data.rows) {
            ASSERT_EQ(row[0].size(), 1u);
            EXPECT_FALSE(is_null_like(row[0], popt.null_tokens)) << row[0];
        }
    }
}
