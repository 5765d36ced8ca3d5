#pragma once

#include "ColumnProfiler.h"
#include "Findings.h"

#include <vector>

/**
 * @brief Compares dataset columns against baseline columns by exact name.
 * @details Uses declared types, so a column that only degraded while profiling
 *          does not count as a type change. Output order: removed columns in
 *          baseline order, added columns in dataset order, then type changes in
 *          dataset order.
 */
class SchemaDiffer {
public:
    std::vector<SchemaFinding> diff(const std::vector<ColumnProfile>& dataset,
                                    const std::vector<ColumnProfile>& baseline) const;

    static Severity severityFor(SchemaChange kind) noexcept;
};
