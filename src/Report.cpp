#include "Report.h"

#include <algorithm>

ReportBuilder& ReportBuilder::dataset(const Table& table, std::vector<ColumnProfile> profiles) {
    report_.datasetRows = table.rowCount();
    report_.datasetColumns = table.colCount();
    report_.columns = std::move(profiles);

    report_.sampleColumns = table.columnNames();
    const size_t rows = std::min(sampleRowCount_, table.rowCount());
    report_.sampleRows.assign(rows, std::vector<std::optional<std::string>>(table.colCount()));
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < table.colCount(); ++c) {
            if (const std::string* text = std::get_if<std::string>(&table.cell(r, c))) {
                report_.sampleRows[r][c] = *text;
            }
        }
    }
    return *this;
}

ReportBuilder& ReportBuilder::baseline(const Table& table) {
    report_.baselineUsed = true;
    report_.baselineRows = table.rowCount();
    report_.baselineColumns = table.colCount();
    return *this;
}

ReportBuilder& ReportBuilder::schemaFindings(std::vector<SchemaFinding> findings) {
    report_.schemaFindings = std::move(findings);
    return *this;
}

ReportBuilder& ReportBuilder::aggregated(AggregatedFindings aggregated) {
    report_.driftFindings = std::move(aggregated.driftFindings);
    report_.findings = std::move(aggregated.findings);
    report_.qualityScore = aggregated.qualityScore;
    report_.severityCounts = aggregated.counts;
    report_.recommendations = std::move(aggregated.recommendations);
    report_.summary = std::move(aggregated.summary);
    return *this;
}

ReportBuilder& ReportBuilder::note(std::string text) {
    report_.notes.push_back(std::move(text));
    return *this;
}

Report ReportBuilder::build() {
    return std::move(report_);
}
