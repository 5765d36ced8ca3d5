#pragma once

#include "ColumnProfiler.h"
#include "FindingAggregator.h"
#include "Findings.h"
#include "Table.h"

#include <optional>
#include <string>
#include <vector>

struct Report {
    size_t datasetRows = 0;
    size_t datasetColumns = 0;
    bool baselineUsed = false;
    size_t baselineRows = 0;
    size_t baselineColumns = 0;

    // Dataset columns in table order.
    std::vector<ColumnProfile> columns;
    std::vector<SchemaFinding> schemaFindings;
    std::vector<DriftFinding> driftFindings;
    std::vector<Finding> findings;

    double qualityScore = 100.0;
    SeverityCounts severityCounts;
    std::vector<Recommendation> recommendations;
    std::vector<std::string> notes;
    std::string summary;

    // Leading dataset rows; std::nullopt marks a missing cell.
    std::vector<std::string> sampleColumns;
    std::vector<std::vector<std::optional<std::string>>> sampleRows;
};

/**
 * @brief Assembles a Report from already computed parts.
 */
class ReportBuilder {
public:
    explicit ReportBuilder(size_t sampleRowCount) : sampleRowCount_(sampleRowCount) {}

    ReportBuilder& dataset(const Table& table, std::vector<ColumnProfile> profiles);
    ReportBuilder& baseline(const Table& table);
    ReportBuilder& schemaFindings(std::vector<SchemaFinding> findings);
    ReportBuilder& aggregated(AggregatedFindings aggregated);
    ReportBuilder& note(std::string text);

    Report build();

private:
    size_t sampleRowCount_;
    Report report_;
};
