#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace StatsUtils {
Moments populationMoments(const std::vector<double>& values) {
    Moments m;
    double m2 = 0.0;
    for (double value : values) {
        ++m.count;
        const double n = static_cast<double>(m.count);
        const double delta = value - m.mean;
        // Split update keeps the mean finite when value and mean sit at opposite ends of the range.
        const double previousMean = m.mean;
        m.mean += value / n - previousMean / n;
        m2 += delta * (value - m.mean);
    }
    m.populationVariance = (m.count > 0) ? std::max(0.0, m2 / static_cast<double>(m.count)) : 0.0;
    return m;
}

double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * t;
}

size_t iqrOutlierCount(const std::vector<double>& sorted, double multiplier) {
    if (sorted.size() < 2) return 0;
    const double q1 = percentileSorted(sorted, 0.25);
    const double q3 = percentileSorted(sorted, 0.75);
    const double iqr = q3 - q1;
    if (!(iqr > 0.0)) return 0;

    const double lower = q1 - multiplier * iqr;
    const double upper = q3 + multiplier * iqr;
    const auto firstInside = std::lower_bound(sorted.begin(), sorted.end(), lower);
    const auto firstAbove = std::upper_bound(sorted.begin(), sorted.end(), upper);
    return static_cast<size_t>(std::distance(sorted.begin(), firstInside)) +
           static_cast<size_t>(std::distance(firstAbove, sorted.end()));
}

double populationStabilityIndex(const std::vector<double>& expectedCounts,
                                const std::vector<double>& actualCounts,
                                double smoothing) {
    const double expectedTotal = std::accumulate(expectedCounts.begin(), expectedCounts.end(), 0.0);
    const double actualTotal = std::accumulate(actualCounts.begin(), actualCounts.end(), 0.0);
    if (expectedTotal <= 0.0 || actualTotal <= 0.0) return 0.0;

    const size_t bins = std::min(expectedCounts.size(), actualCounts.size());
    double psi = 0.0;
    for (size_t i = 0; i < bins; ++i) {
        const double e = std::max(expectedCounts[i] / expectedTotal, smoothing);
        const double a = std::max(actualCounts[i] / actualTotal, smoothing);
        psi += (a - e) * std::log(a / e);
    }
    return psi;
}

std::vector<double> equalWidthHistogram(const std::vector<double>& values, double lo, double hi, size_t bins) {
    std::vector<double> counts(bins, 0.0);
    if (bins == 0) return counts;
    const double width = (hi - lo) / static_cast<double>(bins);
    for (double v : values) {
        size_t idx = 0;
        if (width > 0.0 && v > lo) {
            // Clamp before the cast; values far past hi would overflow size_t.
            const double pos = (v - lo) / width;
            idx = pos >= static_cast<double>(bins) ? bins - 1 : static_cast<size_t>(pos);
        }
        counts[idx] += 1.0;
    }
    return counts;
}
}
