#pragma once

#include "ColumnProfiler.h"
#include "Findings.h"
#include "GuardrailConfig.h"

#include <string>
#include <vector>

struct SeverityCounts {
    size_t info = 0;
    size_t warning = 0;
    size_t critical = 0;

    size_t total() const noexcept { return info + warning + critical; }
};

struct AggregatedFindings {
    std::vector<DriftFinding> driftFindings;
    std::vector<Finding> findings;
    SeverityCounts counts;
    double qualityScore = 100.0;
    std::vector<Recommendation> recommendations;
    std::string summary;
};

/**
 * @brief Orders findings, scores the dataset and derives recommendations.
 * @details Ordering is severity descending, then column name, then finding kind,
 *          then detail. The score only depends on severity counts.
 */
class FindingAggregator {
public:
    explicit FindingAggregator(const GuardrailConfig& config) : config_(config) {}

    AggregatedFindings aggregate(const std::vector<ColumnProfile>& profiles,
                                 const std::vector<SchemaFinding>& schemaFindings,
                                 std::vector<DriftFinding> driftFindings,
                                 size_t rowCount,
                                 bool baselineUsed) const;

    static Finding fromSchema(const SchemaFinding& finding);
    static Finding fromDrift(const DriftFinding& finding);
    static bool precedes(const Finding& a, const Finding& b);
    static void sortDriftFindings(std::vector<DriftFinding>& findings);

    static SeverityCounts countSeverities(const std::vector<Finding>& findings);

    /**
     * @brief max(0, 100 - sum of per-severity penalties).
     */
    double qualityScore(const SeverityCounts& counts) const;

    std::vector<Recommendation> recommend(const std::vector<ColumnProfile>& profiles) const;

private:
    const GuardrailConfig& config_;
};
