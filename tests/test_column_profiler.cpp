#include <gtest/gtest.h>

#include "ColumnProfiler.h"
#include "GuardrailExceptions.h"
#include "TestHelpers.h"

#include <cmath>

class ColumnProfilerTest : public ::testing::Test {
protected:
    GuardrailConfig config;
    ColumnProfiler profiler{config};
};

TEST_F(ColumnProfilerTest, NumericSummary) {
    const ProfiledColumn result = profiler.profileColumn("x", makeColumn({"1", "2", "3", "4", nullptr}),
                                                         ColumnType::NUMERIC);
    const ColumnProfile& p = result.profile;
    EXPECT_EQ(p.rowCount, 5u);
    EXPECT_EQ(p.nullCount, 1u);
    ASSERT_TRUE(p.nullRate.has_value());
    EXPECT_DOUBLE_EQ(*p.nullRate, 0.2);
    EXPECT_EQ(p.distinctCount, 4u);
    EXPECT_EQ(p.invalidCount, 0u);
    ASSERT_TRUE(p.numeric.has_value());
    EXPECT_DOUBLE_EQ(p.numeric->min, 1.0);
    EXPECT_DOUBLE_EQ(p.numeric->max, 4.0);
    EXPECT_DOUBLE_EQ(p.numeric->mean, 2.5);
    EXPECT_NEAR(p.numeric->stddev, std::sqrt(1.25), 1e-12);
    EXPECT_DOUBLE_EQ(p.numeric->p25, 1.75);
    EXPECT_DOUBLE_EQ(p.numeric->p50, 2.5);
    EXPECT_DOUBLE_EQ(p.numeric->p75, 3.25);
    EXPECT_EQ(p.numeric->outlierCount, 0u);
    EXPECT_FALSE(p.degraded);
    EXPECT_EQ(result.distribution.numericValues.size(), 4u);
}

TEST_F(ColumnProfilerTest, UnparseableValuesAreCountedAsInvalid) {
    const ColumnProfile p = profiler.profileColumn("x", makeColumn({"1", "2", "oops"}), ColumnType::NUMERIC).profile;
    EXPECT_EQ(p.invalidCount, 1u);
    EXPECT_EQ(p.type, ColumnType::NUMERIC);
    ASSERT_TRUE(p.numeric.has_value());
    EXPECT_DOUBLE_EQ(p.numeric->mean, 1.5);
}

TEST_F(ColumnProfilerTest, DegradesToTextWhenNothingParses) {
    const ProfiledColumn result = profiler.profileColumn("x", makeColumn({"abc", "de", nullptr}), ColumnType::NUMERIC);
    const ColumnProfile& p = result.profile;
    EXPECT_TRUE(p.degraded);
    EXPECT_EQ(p.type, ColumnType::TEXT);
    EXPECT_EQ(p.declaredType, ColumnType::NUMERIC);
    EXPECT_EQ(p.invalidCount, 2u);
    EXPECT_FALSE(p.numeric.has_value());
    ASSERT_TRUE(p.text.has_value());
    EXPECT_EQ(p.text->minLength, 2u);
    EXPECT_EQ(p.text->maxLength, 3u);
    EXPECT_FALSE(p.note.empty());
    EXPECT_TRUE(result.distribution.numericValues.empty());
}

TEST_F(ColumnProfilerTest, TopValuesBreakTiesByFirstAppearance) {
    const ColumnProfile p = profiler.profileColumn("c", makeColumn({"b", "a", "a", "b", "c"}),
                                                   ColumnType::CATEGORICAL).profile;
    ASSERT_EQ(p.topValues.size(), 3u);
    EXPECT_EQ(p.topValues[0].value, "b");
    EXPECT_EQ(p.topValues[0].count, 2u);
    EXPECT_DOUBLE_EQ(p.topValues[0].share, 0.4);
    EXPECT_EQ(p.topValues[1].value, "a");
    EXPECT_EQ(p.topValues[2].value, "c");
}

TEST(ColumnProfilerTopNTest, TopValuesAreCapped) {
    GuardrailConfig config;
    config.thresholds.topN = 2;
    const ColumnProfiler profiler(config);
    const ProfiledColumn result = profiler.profileColumn("c", makeColumn({"x", "y", "z", "z"}), ColumnType::CATEGORICAL);
    ASSERT_EQ(result.profile.topValues.size(), 2u);
    EXPECT_EQ(result.profile.topValues[0].value, "z");
    EXPECT_EQ(result.distribution.categories.size(), 3u);
}

TEST_F(ColumnProfilerTest, BooleanValuesAreNormalized) {
    const ColumnProfile p = profiler.profileColumn("b", makeColumn({"True", "true", "FALSE"}),
                                                   ColumnType::BOOLEAN).profile;
    ASSERT_EQ(p.topValues.size(), 2u);
    EXPECT_EQ(p.topValues[0].value, "true");
    EXPECT_EQ(p.topValues[0].count, 2u);
    EXPECT_EQ(p.topValues[1].value, "false");
    EXPECT_EQ(p.distinctCount, 2u);
}

TEST_F(ColumnProfilerTest, ExtremeNumbersKeepAFiniteMean) {
    const ColumnProfile p = profiler.profileColumn("x", makeColumn({"-1.7e308", "1.7e308"}),
                                                   ColumnType::NUMERIC).profile;
    ASSERT_TRUE(p.numeric.has_value());
    EXPECT_DOUBLE_EQ(p.numeric->mean, 0.0);
    EXPECT_FALSE(std::isfinite(p.numeric->stddev));
    EXPECT_FALSE(p.note.empty());
}

TEST_F(ColumnProfilerTest, DatetimeRangeAndGranularity) {
    const ColumnProfile days = profiler.profileColumn("d", makeColumn({"2024-03-15", "2024-01-01"}),
                                                      ColumnType::DATETIME).profile;
    ASSERT_TRUE(days.datetime.has_value());
    EXPECT_EQ(days.datetime->min, "2024-01-01T00:00:00Z");
    EXPECT_EQ(days.datetime->max, "2024-03-15T00:00:00Z");
    EXPECT_EQ(days.datetime->granularity, "day");

    auto granularity = [&](std::initializer_list<const char*> cells) {
        return profiler.profileColumn("d", makeColumn(cells), ColumnType::DATETIME).profile.datetime->granularity;
    };
    EXPECT_EQ(granularity({"2024-01-01", "2025-01-01"}), "year");
    EXPECT_EQ(granularity({"2024-01-01", "2024-02-01"}), "month");
    EXPECT_EQ(granularity({"2024-01-01 10:00", "2024-01-01 11:00"}), "hour");
    EXPECT_EQ(granularity({"2024-01-01 10:30"}), "minute");
    EXPECT_EQ(granularity({"2024-01-01 10:30:05"}), "second");
}

TEST_F(ColumnProfilerTest, TextLengths) {
    const ColumnProfile p = profiler.profileColumn("t", makeColumn({"ab", "abcd", nullptr}), ColumnType::TEXT).profile;
    ASSERT_TRUE(p.text.has_value());
    EXPECT_EQ(p.text->minLength, 2u);
    EXPECT_EQ(p.text->maxLength, 4u);
    EXPECT_DOUBLE_EQ(p.text->meanLength, 3.0);
}

TEST_F(ColumnProfilerTest, EmptyColumnHasNoRates) {
    const ColumnProfile p = profiler.profileColumn("e", RawColumn{}, ColumnType::NUMERIC).profile;
    EXPECT_EQ(p.rowCount, 0u);
    EXPECT_FALSE(p.nullRate.has_value());
    EXPECT_FALSE(p.numeric.has_value());
    EXPECT_FALSE(p.degraded);
}

TEST_F(ColumnProfilerTest, SampleValuesAreFirstDistinct) {
    const ColumnProfile p = profiler.profileColumn("s", makeColumn({"a", "b", "a", "c", nullptr, "d", "e", "f"}),
                                                   ColumnType::TEXT).profile;
    EXPECT_EQ(p.sampleValues, (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST_F(ColumnProfilerTest, ProfileTableKeepsColumnOrder) {
    const Table table = makeTable({{"n", makeColumn({"1", "2", "3"})},
                                   {"t", makeColumn({"x", "y", "z"})},
                                   {"b", makeColumn({"true", "false", "true"})}});
    const std::vector<ColumnSchema> schema = {{"n", ColumnType::NUMERIC, false},
                                              {"t", ColumnType::TEXT, false},
                                              {"b", ColumnType::BOOLEAN, false}};
    const auto results = profiler.profileTable(table, schema);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].profile.name, "n");
    EXPECT_EQ(results[1].profile.name, "t");
    EXPECT_EQ(results[2].profile.name, "b");
    for (const auto& r : results) {
        EXPECT_LE(r.profile.nullCount, r.profile.rowCount);
    }
}

TEST_F(ColumnProfilerTest, ProfileTableHonoursCancellation) {
    const Table table = makeTable({{"n", makeColumn({"1"})}});
    const std::vector<ColumnSchema> schema = {{"n", ColumnType::NUMERIC, false}};
    EXPECT_THROW(profiler.profileTable(table, schema, [] { return true; }), Guardrail::CancelledException);
}

TEST_F(ColumnProfilerTest, ProfileTableRejectsMismatchedSchema) {
    const Table table = makeTable({{"n", makeColumn({"1"})}});
    EXPECT_THROW(profiler.profileTable(table, {}), Guardrail::InvalidTableException);
}
