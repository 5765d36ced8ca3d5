#include "DriftDetector.h"

#include "GuardrailExceptions.h"
#include "StatsUtils.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
bool isCategoryLike(ColumnType type) {
    return type == ColumnType::CATEGORICAL || type == ColumnType::BOOLEAN;
}

DriftFinding makeFinding(const std::string& column, DriftMetric metric, double value, Severity severity,
                         std::string detail = {}) {
    DriftFinding f;
    f.column = column;
    f.metric = metric;
    f.value = value;
    f.severity = severity;
    f.detail = std::move(detail);
    return f;
}

struct ColumnSlot {
    std::vector<DriftFinding> findings;
    std::string note;
};
} // namespace

bool DriftDetector::typesComparable(ColumnType a, ColumnType b) noexcept {
    if (a == b) return true;
    return isCategoryLike(a) && isCategoryLike(b);
}

void DriftDetector::nullRateDrift(const ColumnProfile& current, const ColumnProfile& reference,
                                  std::vector<DriftFinding>& out) const {
    if (!current.nullRate || !reference.nullRate) return;
    const ThresholdConfig& t = config_.thresholds;
    const double delta = std::abs(*current.nullRate - *reference.nullRate);

    if (delta > t.nullRateCritical) {
        out.push_back(makeFinding(current.name, DriftMetric::NULL_RATE_DELTA, delta, Severity::CRITICAL));
    } else if (delta > t.nullRateWarning) {
        out.push_back(makeFinding(current.name, DriftMetric::NULL_RATE_DELTA, delta, Severity::WARNING));
    } else if (delta > t.nullRateMinimum) {
        out.push_back(makeFinding(current.name, DriftMetric::NULL_RATE_DELTA, delta, Severity::INFO));
    }
}

void DriftDetector::numericDrift(const ProfiledColumn& current, const ProfiledColumn& reference,
                                 std::vector<DriftFinding>& out) const {
    const ThresholdConfig& t = config_.thresholds;
    const ColumnProfile& cur = current.profile;
    const ColumnProfile& ref = reference.profile;
    if (!cur.numeric || !ref.numeric) return;

    const double scale = std::max(ref.numeric->stddev, t.stdEpsilon);
    const double shift = std::abs(cur.numeric->mean - ref.numeric->mean) / scale;
    if (shift >= t.meanShiftCritical) {
        out.push_back(makeFinding(cur.name, DriftMetric::MEAN_SHIFT, shift, Severity::CRITICAL));
    } else if (shift >= t.meanShiftWarning) {
        out.push_back(makeFinding(cur.name, DriftMetric::MEAN_SHIFT, shift, Severity::WARNING));
    }

    const double lo = ref.numeric->min;
    const double hi = ref.numeric->max;
    if (!(hi > lo)) return;

    const auto expected = StatsUtils::equalWidthHistogram(reference.distribution.numericValues, lo, hi, t.psiBins);
    const auto actual = StatsUtils::equalWidthHistogram(current.distribution.numericValues, lo, hi, t.psiBins);
    const double psi = StatsUtils::populationStabilityIndex(expected, actual, t.psiSmoothing);
    if (psi >= t.psiCritical) {
        out.push_back(makeFinding(cur.name, DriftMetric::POPULATION_STABILITY_INDEX, psi, Severity::CRITICAL));
    } else if (psi >= t.psiWarning) {
        out.push_back(makeFinding(cur.name, DriftMetric::POPULATION_STABILITY_INDEX, psi, Severity::WARNING));
    }
}

void DriftDetector::categoricalDrift(const ProfiledColumn& current, const ProfiledColumn& reference,
                                     std::vector<DriftFinding>& out) const {
    const ThresholdConfig& t = config_.thresholds;
    const std::string& column = current.profile.name;
    const auto& curCategories = current.distribution.categories;
    const auto& refCategories = reference.distribution.categories;

    // Union: baseline first-appearance order, then categories only the dataset has.
    std::unordered_map<std::string, size_t> slot;
    std::vector<double> expected;
    std::vector<double> actual;
    for (const auto& c : refCategories) {
        slot.emplace(c.value, expected.size());
        expected.push_back(static_cast<double>(c.count));
        actual.push_back(0.0);
    }
    std::vector<const CategoryCount*> added;
    for (const auto& c : curCategories) {
        const auto it = slot.find(c.value);
        if (it != slot.end()) {
            actual[it->second] = static_cast<double>(c.count);
            continue;
        }
        slot.emplace(c.value, expected.size());
        expected.push_back(0.0);
        actual.push_back(static_cast<double>(c.count));
        added.push_back(&c);
    }

    const double psi = StatsUtils::populationStabilityIndex(expected, actual, t.psiSmoothing);
    if (psi >= t.psiCritical) {
        out.push_back(makeFinding(column, DriftMetric::POPULATION_STABILITY_INDEX, psi, Severity::CRITICAL));
    } else if (psi >= t.psiWarning) {
        out.push_back(makeFinding(column, DriftMetric::POPULATION_STABILITY_INDEX, psi, Severity::WARNING));
    }

    // A category absent from one side only matters when that side has data at all.
    if (!refCategories.empty()) {
        for (const CategoryCount* c : added) {
            out.push_back(makeFinding(column, DriftMetric::NEW_CATEGORY, c->share, Severity::WARNING, c->value));
        }
    }
    if (!curCategories.empty()) {
        for (size_t i = 0; i < refCategories.size(); ++i) {
            const CategoryCount& c = refCategories[i];
            if (actual[i] > 0.0 || c.share < t.missingCategoryMinShare) continue;
            out.push_back(makeFinding(column, DriftMetric::MISSING_CATEGORY, c.share, Severity::CRITICAL, c.value));
        }
    }
}

std::vector<DriftFinding> DriftDetector::compareColumn(const ProfiledColumn& current,
                                                       const ProfiledColumn& reference) const {
    std::vector<DriftFinding> out;
    const ColumnType curType = current.profile.type;
    const ColumnType refType = reference.profile.type;
    if (!typesComparable(curType, refType)) return out;

    nullRateDrift(current.profile, reference.profile, out);
    if (curType == ColumnType::NUMERIC) {
        numericDrift(current, reference, out);
    } else if (isCategoryLike(curType)) {
        categoricalDrift(current, reference, out);
    }
    return out;
}

DriftResult DriftDetector::detect(const std::vector<ProfiledColumn>& dataset,
                                  const std::vector<ProfiledColumn>& baseline,
                                  const CancelCheck& shouldCancel) const {
    DriftResult result;

    std::unordered_map<std::string, size_t> baselineIndex;
    for (size_t i = 0; i < baseline.size(); ++i) baselineIndex.emplace(baseline[i].profile.name, i);

    // (dataset index, baseline index) for every shared column, in dataset order.
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < dataset.size(); ++i) {
        const auto it = baselineIndex.find(dataset[i].profile.name);
        if (it != baselineIndex.end()) pairs.emplace_back(i, it->second);
    }
    if (pairs.empty()) {
        result.notes.push_back("No shared columns between current and baseline datasets.");
        return result;
    }

    std::vector<ColumnSlot> slots(pairs.size());
    std::atomic<bool> cancelled{false};

    #ifdef USE_OPENMP
    const int workers = config_.threads > 0 ? static_cast<int>(config_.threads) : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(workers)
    #endif
    for (size_t k = 0; k < pairs.size(); ++k) {
        if (cancelled.load(std::memory_order_relaxed)) continue;
        if (shouldCancel && shouldCancel()) {
            cancelled.store(true, std::memory_order_relaxed);
            continue;
        }

        const ProfiledColumn& current = dataset[pairs[k].first];
        const ProfiledColumn& reference = baseline[pairs[k].second];
        if (!typesComparable(current.profile.type, reference.profile.type)) {
            slots[k].note = "Column '" + current.profile.name + "' is " + columnTypeName(current.profile.type) +
                            " but was " + columnTypeName(reference.profile.type) +
                            " in the baseline; drift metrics skipped.";
            continue;
        }
        try {
            slots[k].findings = compareColumn(current, reference);
        } catch (const std::exception& e) {
            slots[k].findings.clear();
            slots[k].note = "Drift metrics for column '" + current.profile.name + "' failed: " + e.what();
        }
    }

    if (cancelled.load()) {
        throw Guardrail::CancelledException("drift detection stopped before completion");
    }

    for (auto& slot : slots) {
        for (auto& f : slot.findings) result.findings.push_back(std::move(f));
        if (!slot.note.empty()) result.notes.push_back(std::move(slot.note));
    }

    if (config_.verbose) {
        std::cerr << "[Guardrail][Drift] compared " << pairs.size() << " shared columns, "
                  << result.findings.size() << " findings\n";
    }
    return result;
}
