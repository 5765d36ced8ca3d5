#pragma once

#include "ColumnProfiler.h"
#include "Findings.h"
#include "GuardrailConfig.h"

#include <string>
#include <vector>

struct DriftResult {
    std::vector<DriftFinding> findings;
    std::vector<std::string> notes;
};

/**
 * @brief Measures how each shared column moved between baseline and dataset.
 * @details Only columns present on both sides with compatible effective types are
 *          compared. Numeric columns get null-rate, mean-shift and binned PSI;
 *          categorical and boolean columns get null-rate, categorical PSI and
 *          new / missing category findings; text and datetime columns get the
 *          null-rate metric only.
 */
class DriftDetector {
public:
    explicit DriftDetector(const GuardrailConfig& config) : config_(config) {}

    /**
     * @pre Both vectors come from ColumnProfiler::profileTable.
     * @post Findings are grouped by dataset column order; the aggregator sorts them.
     * @throws Guardrail::CancelledException when @p shouldCancel reports true.
     */
    DriftResult detect(const std::vector<ProfiledColumn>& dataset,
                       const std::vector<ProfiledColumn>& baseline,
                       const CancelCheck& shouldCancel = {}) const;

    std::vector<DriftFinding> compareColumn(const ProfiledColumn& current, const ProfiledColumn& reference) const;

    static bool typesComparable(ColumnType a, ColumnType b) noexcept;

private:
    void nullRateDrift(const ColumnProfile& current, const ColumnProfile& reference,
                       std::vector<DriftFinding>& out) const;
    void numericDrift(const ProfiledColumn& current, const ProfiledColumn& reference,
                      std::vector<DriftFinding>& out) const;
    void categoricalDrift(const ProfiledColumn& current, const ProfiledColumn& reference,
                          std::vector<DriftFinding>& out) const;

    const GuardrailConfig& config_;
};
