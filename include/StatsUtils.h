#pragma once

#include <cstddef>
#include <vector>

namespace StatsUtils {

struct Moments {
    size_t count = 0;
    double mean = 0.0;
    double populationVariance = 0.0;
};

// Welford accumulation; variance divides by N.
Moments populationMoments(const std::vector<double>& values);

double percentileSorted(const std::vector<double>& sorted, double q);

size_t iqrOutlierCount(const std::vector<double>& sorted, double multiplier);

/**
 * @brief Population stability index between two count vectors over the same bins.
 * @details Proportions are floored at @p smoothing so empty bins stay finite.
 *          Returns 0 when either side has no observations.
 */
double populationStabilityIndex(const std::vector<double>& expectedCounts,
                                const std::vector<double>& actualCounts,
                                double smoothing);

/**
 * @brief Counts values into @p bins equal-width bins spanning [lo, hi].
 * @details Values outside the range land in the first or last bin.
 */
std::vector<double> equalWidthHistogram(const std::vector<double>& values, double lo, double hi, size_t bins);

} // namespace StatsUtils
