#include <gtest/gtest.h>

#include "SchemaDiffer.h"

namespace {
ColumnProfile profile(const std::string& name, ColumnType declared, ColumnType effective) {
    ColumnProfile p;
    p.name = name;
    p.declaredType = declared;
    p.type = effective;
    p.degraded = declared != effective;
    return p;
}

ColumnProfile profile(const std::string& name, ColumnType type) {
    return profile(name, type, type);
}
} // namespace

TEST(SchemaDifferTest, RemovedThenAdded) {
    const std::vector<ColumnProfile> baseline = {profile("A", ColumnType::NUMERIC), profile("B", ColumnType::TEXT),
                                                 profile("C", ColumnType::TEXT)};
    const std::vector<ColumnProfile> dataset = {profile("B", ColumnType::TEXT), profile("C", ColumnType::TEXT),
                                                profile("D", ColumnType::BOOLEAN)};

    const auto findings = SchemaDiffer().diff(dataset, baseline);
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].kind, SchemaChange::COLUMN_REMOVED);
    EXPECT_EQ(findings[0].column, "A");
    EXPECT_EQ(findings[0].severity, Severity::CRITICAL);
    EXPECT_EQ(findings[1].kind, SchemaChange::COLUMN_ADDED);
    EXPECT_EQ(findings[1].column, "D");
    EXPECT_EQ(findings[1].severity, Severity::WARNING);
}

TEST(SchemaDifferTest, TypeChangesComeLast) {
    const std::vector<ColumnProfile> baseline = {profile("id", ColumnType::NUMERIC), profile("gone", ColumnType::TEXT)};
    const std::vector<ColumnProfile> dataset = {profile("id", ColumnType::TEXT), profile("new", ColumnType::NUMERIC)};

    const auto findings = SchemaDiffer().diff(dataset, baseline);
    ASSERT_EQ(findings.size(), 3u);
    EXPECT_EQ(findings[0].kind, SchemaChange::COLUMN_REMOVED);
    EXPECT_EQ(findings[1].kind, SchemaChange::COLUMN_ADDED);
    EXPECT_EQ(findings[2].kind, SchemaChange::TYPE_CHANGED);
    EXPECT_EQ(findings[2].column, "id");
    EXPECT_EQ(findings[2].oldType, ColumnType::NUMERIC);
    EXPECT_EQ(findings[2].newType, ColumnType::TEXT);
    EXPECT_EQ(findings[2].severity, Severity::CRITICAL);
}

TEST(SchemaDifferTest, DegradationAloneIsNotATypeChange) {
    const std::vector<ColumnProfile> baseline = {profile("x", ColumnType::NUMERIC)};
    const std::vector<ColumnProfile> dataset = {profile("x", ColumnType::NUMERIC, ColumnType::TEXT)};
    EXPECT_TRUE(SchemaDiffer().diff(dataset, baseline).empty());
}

TEST(SchemaDifferTest, IdenticalSchemasProduceNothing) {
    const std::vector<ColumnProfile> cols = {profile("a", ColumnType::NUMERIC), profile("b", ColumnType::CATEGORICAL)};
    EXPECT_TRUE(SchemaDiffer().diff(cols, cols).empty());
}
