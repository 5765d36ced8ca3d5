#include "FindingAggregator.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace {
std::string fixed(double value, int digits) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(digits) << value;
    return os.str();
}

std::string percent(double share) {
    return fixed(share * 100.0, 1) + "%";
}

std::string describeSchema(const SchemaFinding& f) {
    switch (f.kind) {
        case SchemaChange::COLUMN_REMOVED:
            return "Column '" + f.column + "' (" + columnTypeName(f.oldType) + ") is missing from the dataset.";
        case SchemaChange::COLUMN_ADDED:
            return "Column '" + f.column + "' (" + columnTypeName(f.newType) + ") is not in the baseline.";
        case SchemaChange::TYPE_CHANGED:
            return "Column '" + f.column + "' changed type from " + columnTypeName(f.oldType) + " to " +
                   columnTypeName(f.newType) + ".";
    }
    return {};
}

std::string describeDrift(const DriftFinding& f) {
    switch (f.metric) {
        case DriftMetric::NULL_RATE_DELTA:
            return "Null rate of '" + f.column + "' moved by " + fixed(f.value * 100.0, 1) + " percentage points.";
        case DriftMetric::MEAN_SHIFT:
            return "Mean of '" + f.column + "' shifted by " + fixed(f.value, 2) + " baseline standard deviations.";
        case DriftMetric::POPULATION_STABILITY_INDEX:
            return "Distribution of '" + f.column + "' drifted (PSI " + fixed(f.value, 4) + ").";
        case DriftMetric::NEW_CATEGORY:
            return "Column '" + f.column + "' has new category '" + f.detail + "' (" + percent(f.value) +
                   " of values).";
        case DriftMetric::MISSING_CATEGORY:
            return "Category '" + f.detail + "' of '" + f.column + "' disappeared (" + percent(f.value) +
                   " of baseline values).";
    }
    return {};
}

Recommendation makeRecommendation(const std::string& column, const char* issue, const char* advice,
                                  Severity severity) {
    Recommendation r;
    r.column = column;
    r.issue = issue;
    r.recommendation = advice;
    r.severity = severity;
    return r;
}
} // namespace

Finding FindingAggregator::fromSchema(const SchemaFinding& finding) {
    Finding f;
    f.source = Finding::Source::SCHEMA;
    f.column = finding.column;
    f.kind = schemaChangeName(finding.kind);
    f.severity = finding.severity;
    if (finding.kind == SchemaChange::TYPE_CHANGED) {
        f.detail = std::string(columnTypeName(finding.oldType)) + " -> " + columnTypeName(finding.newType);
    }
    f.message = describeSchema(finding);
    return f;
}

Finding FindingAggregator::fromDrift(const DriftFinding& finding) {
    Finding f;
    f.source = Finding::Source::DRIFT;
    f.column = finding.column;
    f.kind = driftMetricName(finding.metric);
    f.severity = finding.severity;
    f.value = finding.value;
    f.detail = finding.detail;
    f.message = describeDrift(finding);
    return f;
}

bool FindingAggregator::precedes(const Finding& a, const Finding& b) {
    if (a.severity != b.severity) return a.severity > b.severity;
    return std::tie(a.column, a.kind, a.detail) < std::tie(b.column, b.kind, b.detail);
}

void FindingAggregator::sortDriftFindings(std::vector<DriftFinding>& findings) {
    std::stable_sort(findings.begin(), findings.end(), [](const DriftFinding& a, const DriftFinding& b) {
        if (a.severity != b.severity) return a.severity > b.severity;
        const std::string ak = driftMetricName(a.metric);
        const std::string bk = driftMetricName(b.metric);
        return std::tie(a.column, ak, a.detail) < std::tie(b.column, bk, b.detail);
    });
}

SeverityCounts FindingAggregator::countSeverities(const std::vector<Finding>& findings) {
    SeverityCounts counts;
    for (const auto& f : findings) {
        switch (f.severity) {
            case Severity::INFO: ++counts.info; break;
            case Severity::WARNING: ++counts.warning; break;
            case Severity::CRITICAL: ++counts.critical; break;
        }
    }
    return counts;
}

double FindingAggregator::qualityScore(const SeverityCounts& counts) const {
    const ThresholdConfig& t = config_.thresholds;
    const double penalty = t.penaltyCritical * static_cast<double>(counts.critical) +
                           t.penaltyWarning * static_cast<double>(counts.warning) +
                           t.penaltyInfo * static_cast<double>(counts.info);
    return std::max(0.0, 100.0 - penalty);
}

std::vector<Recommendation> FindingAggregator::recommend(const std::vector<ColumnProfile>& profiles) const {
    const ThresholdConfig& t = config_.thresholds;
    std::vector<Recommendation> out;
    for (const auto& p : profiles) {
        const double missing = p.nullRate.value_or(0.0);
        if (missing >= t.missingWarningRate) {
            out.push_back(makeRecommendation(
                p.name, "missing_values",
                "Consider imputing missing values (mean/median for numeric, mode for categorical).",
                missing >= t.missingCriticalRate ? Severity::CRITICAL : Severity::WARNING));
        }
        if (p.numeric && p.numeric->outlierCount > 0) {
            out.push_back(makeRecommendation(p.name, "outliers",
                                             "Consider clipping, winsorization, or removing outliers.",
                                             Severity::WARNING));
        }
        if (p.invalidCount > 0 && p.rowCount > 0) {
            const double invalidShare = static_cast<double>(p.invalidCount) / static_cast<double>(p.rowCount);
            out.push_back(makeRecommendation(
                p.name, "schema_violations",
                "Consider casting values to the inferred type or cleaning invalid entries.",
                invalidShare > t.invalidCriticalRate ? Severity::CRITICAL : Severity::WARNING));
        }
    }
    return out;
}

AggregatedFindings FindingAggregator::aggregate(const std::vector<ColumnProfile>& profiles,
                                                const std::vector<SchemaFinding>& schemaFindings,
                                                std::vector<DriftFinding> driftFindings,
                                                size_t rowCount,
                                                bool baselineUsed) const {
    AggregatedFindings result;

    sortDriftFindings(driftFindings);
    result.findings.reserve(schemaFindings.size() + driftFindings.size());
    for (const auto& f : schemaFindings) result.findings.push_back(fromSchema(f));
    for (const auto& f : driftFindings) result.findings.push_back(fromDrift(f));
    std::stable_sort(result.findings.begin(), result.findings.end(), precedes);
    result.driftFindings = std::move(driftFindings);

    result.counts = countSeverities(result.findings);
    result.qualityScore = qualityScore(result.counts);
    result.recommendations = recommend(profiles);

    size_t invalidTotal = 0;
    for (const auto& p : profiles) invalidTotal += p.invalidCount;

    std::ostringstream summary;
    summary << "Rows: " << rowCount << ", Columns: " << profiles.size() << ". "
            << "Schema violations: " << invalidTotal << ". "
            << "Recommendations: " << result.recommendations.size() << ". "
            << "Quality score: " << fixed(result.qualityScore, 0) << ". "
            << "Findings: " << result.counts.critical << " critical, " << result.counts.warning << " warning, "
            << result.counts.info << " info.";
    if (baselineUsed) summary << " Baseline drift comparison included.";
    result.summary = summary.str();
    return result;
}
