#pragma once

#include "ColumnType.h"
#include "GuardrailConfig.h"
#include "SchemaInferencer.h"
#include "Table.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using CancelCheck = std::function<bool()>;

struct NumericSummary {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double stddev = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    size_t outlierCount = 0;
};

struct CategoryCount {
    std::string value;
    size_t count = 0;
    double share = 0.0;
};

struct DatetimeSummary {
    int64_t minEpochSeconds = 0;
    int64_t maxEpochSeconds = 0;
    std::string min;
    std::string max;
    std::string granularity;
};

struct TextSummary {
    size_t minLength = 0;
    double meanLength = 0.0;
    size_t maxLength = 0;
};

struct ColumnProfile {
    std::string name;
    ColumnType type = ColumnType::TEXT;
    // Type before any degradation; what schema comparison looks at.
    ColumnType declaredType = ColumnType::TEXT;
    bool degraded = false;
    size_t rowCount = 0;
    size_t nullCount = 0;
    std::optional<double> nullRate;
    size_t distinctCount = 0;
    size_t invalidCount = 0;
    std::vector<std::string> sampleValues;

    std::optional<NumericSummary> numeric;
    std::vector<CategoryCount> topValues;
    std::optional<DatetimeSummary> datetime;
    std::optional<TextSummary> text;

    std::string note;
};

/**
 * @brief Per-column material the drift detector needs beyond the profile.
 * @details `numericValues` is sorted; `categories` is the full frequency table in
 *          first-appearance order.
 */
struct ColumnDistribution {
    std::vector<double> numericValues;
    std::vector<CategoryCount> categories;
};

struct ProfiledColumn {
    ColumnProfile profile;
    ColumnDistribution distribution;
};

class ColumnProfiler {
public:
    explicit ColumnProfiler(const GuardrailConfig& config) : config_(config) {}

    /**
     * @brief Profiles one column as @p declaredType.
     * @details Non-null values that do not parse as the declared type are counted in
     *          invalidCount. With no parseable value at all, the column degrades to
     *          TEXT and is profiled from raw lengths.
     */
    ProfiledColumn profileColumn(const std::string& name, const RawColumn& column, ColumnType declaredType) const;

    /**
     * @brief Profiles every column, in parallel when OpenMP is available.
     * @pre schema.size() == table.colCount().
     * @post Result i belongs to column i. A failure inside one column degrades that
     *       column only.
     * @throws Guardrail::CancelledException when @p shouldCancel reports true.
     */
    std::vector<ProfiledColumn> profileTable(const Table& table,
                                             const std::vector<ColumnSchema>& schema,
                                             const CancelCheck& shouldCancel = {}) const;

private:
    const GuardrailConfig& config_;
};
