#include "ColumnProfiler.h"

#include "GuardrailExceptions.h"
#include "StatsUtils.h"
#include "ValueParsers.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <limits>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
// Frequency table that remembers first appearance.
class FrequencyTable {
public:
    void add(const std::string& value) {
        const auto it = index_.find(value);
        if (it == index_.end()) {
            index_.emplace(value, entries_.size());
            entries_.push_back(CategoryCount{value, 1, 0.0});
        } else {
            ++entries_[it->second].count;
        }
        ++total_;
    }

    size_t distinct() const noexcept { return entries_.size(); }

    std::vector<CategoryCount> withShares() const {
        std::vector<CategoryCount> out = entries_;
        for (auto& entry : out) {
            entry.share = (total_ > 0) ? static_cast<double>(entry.count) / static_cast<double>(total_) : 0.0;
        }
        return out;
    }

private:
    std::unordered_map<std::string, size_t> index_;
    std::vector<CategoryCount> entries_;
    size_t total_ = 0;
};

std::vector<CategoryCount> topCategories(std::vector<CategoryCount> categories, size_t topN) {
    // stable_sort keeps first-seen order among equal counts.
    std::stable_sort(categories.begin(), categories.end(), [](const CategoryCount& a, const CategoryCount& b) {
        return a.count > b.count;
    });
    if (categories.size() > topN) categories.resize(topN);
    return categories;
}

std::string granularityOf(const std::vector<ValueParsers::DateTimeValue>& values) {
    bool seconds = false;
    bool minutes = false;
    bool hours = false;
    bool days = false;
    bool months = false;
    for (const auto& v : values) {
        seconds = seconds || v.second != 0 || v.fractionalSeconds;
        minutes = minutes || v.minute != 0;
        hours = hours || v.hour != 0;
        days = days || v.day != 1;
        months = months || v.month != 1;
    }
    if (seconds) return "second";
    if (minutes) return "minute";
    if (hours) return "hour";
    if (days) return "day";
    if (months) return "month";
    return "year";
}

TextSummary summarizeLengths(const RawColumn& column) {
    TextSummary summary;
    size_t count = 0;
    double total = 0.0;
    summary.minLength = std::numeric_limits<size_t>::max();
    for (const RawValue& cell : column) {
        const std::string* text = std::get_if<std::string>(&cell);
        if (text == nullptr) continue;
        ++count;
        total += static_cast<double>(text->size());
        summary.minLength = std::min(summary.minLength, text->size());
        summary.maxLength = std::max(summary.maxLength, text->size());
    }
    if (count == 0) {
        summary.minLength = 0;
        return summary;
    }
    summary.meanLength = total / static_cast<double>(count);
    return summary;
}

void degradeToText(ProfiledColumn& out, const RawColumn& column, const std::string& reason) {
    ColumnProfile& p = out.profile;
    p.type = ColumnType::TEXT;
    p.degraded = true;
    p.numeric.reset();
    p.datetime.reset();
    p.topValues.clear();
    p.text = summarizeLengths(column);
    p.note = reason;
    out.distribution = ColumnDistribution{};
}

// Last resort when profiling threw: counts only, no value parsing.
ProfiledColumn minimalProfile(const std::string& name, const RawColumn& column, ColumnType declaredType,
                              const std::string& reason) {
    ProfiledColumn out;
    ColumnProfile& p = out.profile;
    p.name = name;
    p.declaredType = declaredType;
    p.type = ColumnType::TEXT;
    p.degraded = true;
    p.rowCount = column.size();
    for (const RawValue& cell : column) {
        if (isMissing(cell)) ++p.nullCount;
    }
    if (p.rowCount > 0) {
        p.nullRate = static_cast<double>(p.nullCount) / static_cast<double>(p.rowCount);
    }
    p.note = reason;
    return out;
}
} // namespace

ProfiledColumn ColumnProfiler::profileColumn(const std::string& name, const RawColumn& column,
                                             ColumnType declaredType) const {
    const ThresholdConfig& t = config_.thresholds;

    ProfiledColumn out;
    ColumnProfile& p = out.profile;
    p.name = name;
    p.declaredType = declaredType;
    p.type = declaredType;
    p.rowCount = column.size();

    FrequencyTable rawValues;
    for (const RawValue& cell : column) {
        const std::string* text = std::get_if<std::string>(&cell);
        if (text == nullptr) {
            ++p.nullCount;
            continue;
        }
        if (p.sampleValues.size() < t.sampleValueCount &&
            std::find(p.sampleValues.begin(), p.sampleValues.end(), *text) == p.sampleValues.end()) {
            p.sampleValues.push_back(*text);
        }
        rawValues.add(*text);
    }
    p.distinctCount = rawValues.distinct();
    if (p.rowCount > 0) {
        p.nullRate = static_cast<double>(p.nullCount) / static_cast<double>(p.rowCount);
    }
    const size_t nonNull = p.rowCount - p.nullCount;

    switch (declaredType) {
        case ColumnType::NUMERIC: {
            std::vector<double> values;
            values.reserve(nonNull);
            for (const RawValue& cell : column) {
                const std::string* text = std::get_if<std::string>(&cell);
                if (text == nullptr) continue;
                double v = 0.0;
                if (ValueParsers::parseNumber(*text, v)) {
                    values.push_back(v);
                } else {
                    ++p.invalidCount;
                }
            }
            if (values.empty()) break;

            std::sort(values.begin(), values.end());
            const StatsUtils::Moments moments = StatsUtils::populationMoments(values);
            NumericSummary summary;
            summary.min = values.front();
            summary.max = values.back();
            summary.mean = moments.mean;
            summary.stddev = std::sqrt(moments.populationVariance);
            summary.p25 = StatsUtils::percentileSorted(values, 0.25);
            summary.p50 = StatsUtils::percentileSorted(values, 0.50);
            summary.p75 = StatsUtils::percentileSorted(values, 0.75);
            summary.outlierCount = StatsUtils::iqrOutlierCount(values, t.outlierIqrMultiplier);
            p.numeric = summary;
            if (!std::isfinite(summary.mean) || !std::isfinite(summary.stddev)) {
                p.note = "values exceed the representable range; mean or standard deviation is not finite";
            }
            out.distribution.numericValues = std::move(values);
            break;
        }
        case ColumnType::BOOLEAN: {
            FrequencyTable normalized;
            for (const RawValue& cell : column) {
                const std::string* text = std::get_if<std::string>(&cell);
                if (text == nullptr) continue;
                bool b = false;
                if (ValueParsers::parseBoolean(*text, b)) {
                    normalized.add(b ? "true" : "false");
                } else {
                    ++p.invalidCount;
                }
            }
            p.distinctCount = normalized.distinct();
            out.distribution.categories = normalized.withShares();
            p.topValues = topCategories(out.distribution.categories, t.topN);
            break;
        }
        case ColumnType::CATEGORICAL: {
            out.distribution.categories = rawValues.withShares();
            p.topValues = topCategories(out.distribution.categories, t.topN);
            break;
        }
        case ColumnType::DATETIME: {
            std::vector<ValueParsers::DateTimeValue> parsed;
            parsed.reserve(nonNull);
            for (const RawValue& cell : column) {
                const std::string* text = std::get_if<std::string>(&cell);
                if (text == nullptr) continue;
                ValueParsers::DateTimeValue dt;
                if (ValueParsers::parseDateTime(*text, dt)) {
                    parsed.push_back(dt);
                } else {
                    ++p.invalidCount;
                }
            }
            if (parsed.empty()) break;

            const auto [lo, hi] = std::minmax_element(parsed.begin(), parsed.end(),
                [](const ValueParsers::DateTimeValue& a, const ValueParsers::DateTimeValue& b) {
                    return a.epochSeconds < b.epochSeconds;
                });
            DatetimeSummary summary;
            summary.minEpochSeconds = lo->epochSeconds;
            summary.maxEpochSeconds = hi->epochSeconds;
            summary.min = ValueParsers::formatIsoDateTime(lo->epochSeconds);
            summary.max = ValueParsers::formatIsoDateTime(hi->epochSeconds);
            summary.granularity = granularityOf(parsed);
            p.datetime = summary;
            break;
        }
        case ColumnType::TEXT:
            p.text = summarizeLengths(column);
            break;
    }

    if (nonNull > 0 && p.invalidCount == nonNull && declaredType != ColumnType::TEXT) {
        degradeToText(out, column,
                      std::string("no value parses as ") + columnTypeName(declaredType) + "; profiled as text");
    }
    return out;
}

std::vector<ProfiledColumn> ColumnProfiler::profileTable(const Table& table,
                                                         const std::vector<ColumnSchema>& schema,
                                                         const CancelCheck& shouldCancel) const {
    if (schema.size() != table.colCount()) {
        throw Guardrail::InvalidTableException("schema has " + std::to_string(schema.size()) +
                                               " columns, table has " + std::to_string(table.colCount()));
    }

    std::vector<ProfiledColumn> results(table.colCount());
    std::atomic<bool> cancelled{false};

    #ifdef USE_OPENMP
    const int workers = config_.threads > 0 ? static_cast<int>(config_.threads) : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(workers)
    #endif
    for (size_t c = 0; c < table.colCount(); ++c) {
        if (cancelled.load(std::memory_order_relaxed)) continue;
        if (shouldCancel && shouldCancel()) {
            cancelled.store(true, std::memory_order_relaxed);
            continue;
        }

        const std::string& name = schema[c].name;
        const RawColumn& column = table.column(c);
        try {
            results[c] = profileColumn(name, column, schema[c].type);
        } catch (const std::exception& e) {
            results[c] = minimalProfile(name, column, schema[c].type, std::string("profiling failed: ") + e.what());
        }
    }

    if (cancelled.load()) {
        throw Guardrail::CancelledException("column profiling stopped before completion");
    }

    if (config_.verbose) {
        for (const auto& result : results) {
            if (result.profile.degraded) {
                std::cerr << "[Guardrail][Profiler] column '" << result.profile.name << "' degraded: "
                          << result.profile.note << "\n";
            }
        }
    }
    return results;
}
