#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "sample/sampler.hpp"
#include "util/errors.hpp"

using namespace csvsa;

namespace {
// id column holds the original row number so order and provenance can be checked.
table numbered_table(std::size_t rows) {
    table t;
    t.header = {"id", "name", "score"};
    for (std::size_t i = 0; i < rows; ++i)
        t.rows.push_back({std::to_string(i), "n" + std::to_string(i), std::to_string(i * 10)});
    return t;
}

std::vector<int> ids(const table& t) {
    std::vector<int> out;
    for (const auto& r : t.rows) out.push_back(std::stoi(r[0]));
    return out;
}
}

TEST(SamplerTest, RowCountBoundHoldsForAllK) {
    const table t = numbered_table(25);
    for (std::size_t k = 0; k <= 40; ++k) {
        rng_type rng(k);
        sample_spec spec;
        spec.row_count = k;
        EXPECT_EQ(sample_table(t, spec, rng).row_count(), std::min<std::size_t>(k, 25)) << "k=" << k;
    }
}

TEST(SamplerTest, KeepsOriginalRelativeOrderWithoutDuplicates) {
    const table t = numbered_table(100);
    rng_type rng(123);
    sample_spec spec;
    spec.row_count = 30;
    const table s = sample_table(t, spec, rng);
    const auto got = ids(s);
    ASSERT_EQ(got.size(), 30u);
    EXPECT_TRUE(std::is_sorted(got.begin(), got.end()));
    EXPECT_EQ(std::adjacent_find(got.begin(), got.end()), got.end());
    // whole rows travel together
    for (const auto& r : s.rows) EXPECT_EQ(r[1], "n" + r[0]);
}

TEST(SamplerTest, FractionRoundsToNearest) {
    const table t = numbered_table(10);
    rng_type rng(1);
    sample_spec spec;
    spec.row_fraction = 0.25;   // 2.5 -> 3
    EXPECT_EQ(sample_table(t, spec, rng).row_count(), 3u);
    spec.row_fraction = 1.0;
    EXPECT_EQ(sample_table(t, spec, rng).row_count(), 10u);
    spec.row_fraction = 0.01;   // 0.1 -> 0
    EXPECT_EQ(sample_table(t, spec, rng).row_count(), 0u);
}

TEST(SamplerTest, ZeroRowsGivesHeaderOnlyTable) {
    const table t = numbered_table(5);
    rng_type rng(1);
    sample_spec spec;
    spec.row_count = 0;
    const table s = sample_table(t, spec, rng);
    EXPECT_EQ(s.row_count(), 0u);
    EXPECT_EQ(s.header, t.header);
}

TEST(SamplerTest, NoSpecKeepsEverything) {
    const table t = numbered_table(7);
    rng_type rng(1);
    const table s = sample_table(t, sample_spec{}, rng);
    EXPECT_EQ(s.rows, t.rows);
}

TEST(SamplerTest, FractionOutsideRangeIsASpecificationError) {
    const table t = numbered_table(5);
    rng_type rng(1);
    for (double f : {0.0, -0.5, 1.5, std::numeric_limits<double>::quiet_NaN()}) {
        sample_spec spec;
        spec.row_fraction = f;
        EXPECT_THROW(sample_table(t, spec, rng), specification_error) << f;
    }
}

TEST(SamplerTest, CountAndFractionTogetherIsASpecificationError) {
    const table t = numbered_table(5);
    rng_type rng(1);
    sample_spec spec;
    spec.row_count = 2;
    spec.row_fraction = 0.5;
    EXPECT_THROW(sample_table(t, spec, rng), specification_error);
}

TEST(SamplerTest, KeepsRequestedColumnsInHeaderOrder) {
    const table t = numbered_table(4);
    rng_type rng(1);
    sample_spec spec;
    spec.columns_to_keep = std::vector<std::string>{"score", "id", "score"};
    const table s = sample_table(t, spec, rng);
    EXPECT_EQ(s.header, (std::vector<std::string>{"id", "score"}));
    ASSERT_EQ(s.row_count(), 4u);
    EXPECT_EQ(s.rows[2], (std::vector<std::string>{"2", "20"}));
}

TEST(SamplerTest, UnknownRetainedColumnIsASpecificationError) {
    const table t = numbered_table(4);
    rng_type rng(1);
    sample_spec spec;
    spec.columns_to_keep = std::vector<std::string>{"id", "missing"};
    EXPECT_THROW(sample_table(t, spec, rng), specification_error);
}

TEST(SamplerTest, HeaderlessColumnsByIndexKeepPositionalNames) {
    table t = numbered_table(3);
    t.has_header = false;
    t.header = positional_header(3);
    rng_type rng(1);
    sample_spec spec;
    spec.columns_to_keep = std::vector<std::string>{"2"};
    const table s = sample_table(t, spec, rng);
    EXPECT_EQ(s.header, (std::vector<std::string>{"column_2"}));
    EXPECT_FALSE(s.has_header);
    EXPECT_EQ(s.rows[1][0], "10");
}

TEST(SamplerTest, SameSeedSameSelection) {
    const table t = numbered_table(200);
    sample_spec spec;
    spec.row_count = 50;
    rng_type a(99), b(99), c(100);
    const auto first = ids(sample_table(t, spec, a));
    EXPECT_EQ(first, ids(sample_table(t, spec, b)));
    EXPECT_NE(first, ids(sample_table(t, spec, c)));
}

TEST(SamplerTest, SelectionIsRoughlyUniform) {
    const table t = numbered_table(10);
    std::vector<int> hits(10, 0);
    rng_type rng(2024);
    sample_spec spec;
    spec.row_count = 3;
    const int trials = 6000;
    for (int i = 0; i < trials; ++i)
        for (int id : ids(sample_table(t, spec, rng))) ++hits[id];
    // each row is picked with probability 3/10
    for (int h : hits) EXPECT_NEAR(static_cast<double>(h) / trials, 0.3, 0.03);
}
