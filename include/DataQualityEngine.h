#pragma once

#include "ColumnProfiler.h"
#include "GuardrailConfig.h"
#include "Report.h"
#include "Table.h"

/**
 * @brief Runs inference, profiling, schema diff, drift detection and aggregation.
 * @details Holds no per-request state; one engine can serve concurrent calls.
 */
class DataQualityEngine {
public:
    /**
     * @throws Guardrail::ConfigurationException when @p config does not validate.
     */
    explicit DataQualityEngine(GuardrailConfig config);

    /**
     * @brief Profiles @p dataset and, when given, compares it against @p baseline.
     * @pre Both tables satisfy the Table invariants.
     * @post A baseline with zero rows is treated as absent and noted in the report.
     * @throws Guardrail::CancelledException when @p shouldCancel reports true.
     */
    Report analyze(const Table& dataset, const Table* baseline = nullptr, const CancelCheck& shouldCancel = {}) const;

    const GuardrailConfig& config() const noexcept { return config_; }

private:
    GuardrailConfig config_;
};
