#include <gtest/gtest.h>

#include "DataQualityEngine.h"
#include "GuardrailExceptions.h"
#include "ReportJson.h"
#include "TableLoader.h"
#include "TestHelpers.h"

#include <algorithm>
#include <string>

namespace {
Table customers() {
    return makeTable({{"id", makeColumn({"1", "2", "3", "4", "5", "6", "7", "8", "9", "10"})},
                      {"age", repeatColumn({{"30", 5}, {"50", 5}})},
                      {"status", repeatColumn({{"active", 9}, {"closed", 1}})},
                      {"joined", repeatColumn({{"2024-01-05", 4}, {"2024-02-07", 4}, {"", 2}})},
                      {"note", makeColumn({"a", "bb", "ccc", "dddd", "e", "ff", "ggg", "hhhh", "i", "jj"})}});
}

size_t countMetric(const Report& report, DriftMetric metric, const std::string& column) {
    return static_cast<size_t>(std::count_if(report.driftFindings.begin(), report.driftFindings.end(),
        [&](const DriftFinding& f) { return f.metric == metric && f.column == column; }));
}
} // namespace

class DataQualityEngineTest : public ::testing::Test {
protected:
    DataQualityEngine engine{GuardrailConfig{}};
};

TEST_F(DataQualityEngineTest, NoBaselineMeansNoFindingsAndFullScore) {
    const Table table = customers();
    const Report report = engine.analyze(table);

    EXPECT_FALSE(report.baselineUsed);
    EXPECT_TRUE(report.schemaFindings.empty());
    EXPECT_TRUE(report.driftFindings.empty());
    EXPECT_TRUE(report.findings.empty());
    EXPECT_DOUBLE_EQ(report.qualityScore, 100.0);
    ASSERT_EQ(report.columns.size(), table.colCount());
    for (size_t i = 0; i < table.colCount(); ++i) {
        EXPECT_EQ(report.columns[i].name, table.columnNames()[i]);
    }
    EXPECT_EQ(report.datasetRows, 10u);
    EXPECT_EQ(report.datasetColumns, 5u);
}

TEST_F(DataQualityEngineTest, InferredTypesAndProfileInvariants) {
    const Report report = engine.analyze(customers());
    EXPECT_EQ(report.columns[0].type, ColumnType::NUMERIC);
    EXPECT_EQ(report.columns[1].type, ColumnType::NUMERIC);
    EXPECT_EQ(report.columns[2].type, ColumnType::CATEGORICAL);
    EXPECT_EQ(report.columns[3].type, ColumnType::DATETIME);
    EXPECT_EQ(report.columns[4].type, ColumnType::TEXT);

    for (const auto& p : report.columns) {
        EXPECT_LE(p.nullCount, p.rowCount);
        if (p.numeric) {
            EXPECT_LE(p.numeric->p25, p.numeric->p50);
            EXPECT_LE(p.numeric->p50, p.numeric->p75);
        }
    }
}

TEST_F(DataQualityEngineTest, AnalysisIsDeterministic) {
    const Table dataset = customers();
    const Table baseline = makeTable({{"id", makeColumn({"1", "2", "3"})},
                                      {"age", makeColumn({"20", "30", "90"})},
                                      {"status", makeColumn({"active", "pending", "active"})}});
    const std::string first = ReportJson::toJson(engine.analyze(dataset, &baseline));
    const std::string second = ReportJson::toJson(engine.analyze(dataset, &baseline));
    EXPECT_EQ(first, second);
}

TEST_F(DataQualityEngineTest, SchemaDiffThroughEngine) {
    const Table baseline = makeTable({{"A", makeColumn({"1", "2"})}, {"B", makeColumn({"x", "y"})},
                                      {"C", makeColumn({"3", "4"})}});
    const Table dataset = makeTable({{"B", makeColumn({"x", "y"})}, {"C", makeColumn({"3", "4"})},
                                     {"D", makeColumn({"5", "6"})}});
    const Report report = engine.analyze(dataset, &baseline);

    ASSERT_EQ(report.schemaFindings.size(), 2u);
    EXPECT_EQ(report.schemaFindings[0].kind, SchemaChange::COLUMN_REMOVED);
    EXPECT_EQ(report.schemaFindings[0].column, "A");
    EXPECT_EQ(report.schemaFindings[1].kind, SchemaChange::COLUMN_ADDED);
    EXPECT_EQ(report.schemaFindings[1].column, "D");
    EXPECT_TRUE(report.baselineUsed);
    EXPECT_EQ(report.baselineRows, 2u);
    EXPECT_EQ(report.baselineColumns, 3u);
}

TEST_F(DataQualityEngineTest, AgeDriftScenario) {
    const Table baseline = makeTable({{"age", repeatColumn({{"30", 5}, {"50", 5}})}});
    const Table shifted = makeTable({{"age", repeatColumn({{"65", 5}, {"85", 5}})}});
    const Table steady = makeTable({{"age", repeatColumn({{"35", 5}, {"55", 5}})}});

    const Report critical = engine.analyze(shifted, &baseline);
    ASSERT_EQ(countMetric(critical, DriftMetric::MEAN_SHIFT, "age"), 1u);
    const auto it = std::find_if(critical.driftFindings.begin(), critical.driftFindings.end(),
                                 [](const DriftFinding& f) { return f.metric == DriftMetric::MEAN_SHIFT; });
    EXPECT_EQ(it->severity, Severity::CRITICAL);

    const Report calm = engine.analyze(steady, &baseline);
    EXPECT_EQ(countMetric(calm, DriftMetric::MEAN_SHIFT, "age"), 0u);
}

TEST_F(DataQualityEngineTest, StatusCategoryScenario) {
    const Table baseline = makeTable({{"status", repeatColumn({{"active", 9}, {"closed", 1}})}});
    const Table dataset = makeTable({{"status", repeatColumn({{"active", 5}, {"pending", 5}})}});
    const Report report = engine.analyze(dataset, &baseline);

    ASSERT_EQ(countMetric(report, DriftMetric::MISSING_CATEGORY, "status"), 1u);
    ASSERT_EQ(countMetric(report, DriftMetric::NEW_CATEGORY, "status"), 1u);
    for (const auto& f : report.driftFindings) {
        if (f.metric == DriftMetric::MISSING_CATEGORY) {
            EXPECT_EQ(f.detail, "closed");
            EXPECT_EQ(f.severity, Severity::CRITICAL);
        }
        if (f.metric == DriftMetric::NEW_CATEGORY) {
            EXPECT_EQ(f.detail, "pending");
            EXPECT_EQ(f.severity, Severity::WARNING);
        }
    }
    // missing_category + categorical PSI are critical, new_category is a warning.
    EXPECT_EQ(report.severityCounts.critical, 2u);
    EXPECT_EQ(report.severityCounts.warning, 1u);
    EXPECT_DOUBLE_EQ(report.qualityScore, 65.0);
    EXPECT_EQ(report.findings.front().severity, Severity::CRITICAL);
    EXPECT_EQ(report.findings.back().kind, "new_category");
}

TEST_F(DataQualityEngineTest, ZeroRowBaselineIsTreatedAsAbsent) {
    const Table baseline = TableLoader().fromCsvText("id,age,status\n");
    const Report report = engine.analyze(customers(), &baseline);

    EXPECT_FALSE(report.baselineUsed);
    EXPECT_TRUE(report.schemaFindings.empty());
    EXPECT_TRUE(report.driftFindings.empty());
    EXPECT_DOUBLE_EQ(report.qualityScore, 100.0);
    ASSERT_FALSE(report.notes.empty());
    EXPECT_NE(report.notes.back().find("Baseline has no rows"), std::string::npos);
}

TEST_F(DataQualityEngineTest, ZeroRowDatasetHasNoNullRates) {
    const Table dataset = TableLoader().fromCsvText("a,b\n");
    const Report report = engine.analyze(dataset);
    ASSERT_EQ(report.columns.size(), 2u);
    EXPECT_FALSE(report.columns[0].nullRate.has_value());
    EXPECT_TRUE(report.sampleRows.empty());
}

TEST_F(DataQualityEngineTest, TypeOverrideDegradesAndIsNoted) {
    GuardrailConfig config;
    config.columnTypeOverrides["note"] = ColumnType::NUMERIC;
    const DataQualityEngine overridden(config);
    const Report report = overridden.analyze(customers());

    const ColumnProfile& note = report.columns[4];
    EXPECT_TRUE(note.degraded);
    EXPECT_EQ(note.type, ColumnType::TEXT);
    EXPECT_EQ(note.declaredType, ColumnType::NUMERIC);
    ASSERT_FALSE(report.notes.empty());
    EXPECT_NE(report.notes.front().find("note"), std::string::npos);
}

TEST_F(DataQualityEngineTest, SampleRowsAreCapped) {
    RawColumn values;
    for (int i = 0; i < 25; ++i) values.emplace_back(std::to_string(i));
    values[1] = MissingValue{};
    const Table table = makeTable({{"v", values}});

    const Report report = engine.analyze(table);
    ASSERT_EQ(report.sampleColumns, (std::vector<std::string>{"v"}));
    ASSERT_EQ(report.sampleRows.size(), 20u);
    EXPECT_EQ(report.sampleRows[0][0], std::optional<std::string>("0"));
    EXPECT_FALSE(report.sampleRows[1][0].has_value());
}

TEST_F(DataQualityEngineTest, CancellationStopsAnalysis) {
    EXPECT_THROW(engine.analyze(customers(), nullptr, [] { return true; }), Guardrail::CancelledException);
}

TEST(DataQualityEngineConfigTest, RejectsInvalidThresholds) {
    GuardrailConfig config;
    config.thresholds.psiWarning = 0.5;
    config.thresholds.psiCritical = 0.2;
    EXPECT_THROW(DataQualityEngine{config}, Guardrail::ConfigurationException);
}
