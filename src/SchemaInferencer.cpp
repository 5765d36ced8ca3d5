#include "SchemaInferencer.h"

#include "ValueParsers.h"

#include <unordered_set>
#ifdef USE_OPENMP
#include <omp.h>
#endif

ColumnType SchemaInferencer::inferColumnType(const RawColumn& column) const {
    bool allBoolean = true;
    bool allNumeric = true;
    bool allDatetime = true;
    size_t nonNull = 0;
    std::unordered_set<std::string> distinct;

    for (const RawValue& cell : column) {
        const std::string* text = std::get_if<std::string>(&cell);
        if (text == nullptr) continue;
        ++nonNull;
        distinct.insert(*text);

        if (allBoolean) {
            bool b = false;
            allBoolean = ValueParsers::parseBoolean(*text, b);
        }
        if (allNumeric) {
            double d = 0.0;
            allNumeric = ValueParsers::parseNumber(*text, d);
        }
        if (allDatetime) {
            ValueParsers::DateTimeValue dt;
            allDatetime = ValueParsers::parseDateTime(*text, dt);
        }
    }

    if (nonNull == 0) return ColumnType::TEXT;
    if (allBoolean) return ColumnType::BOOLEAN;
    if (allNumeric) return ColumnType::NUMERIC;
    if (allDatetime) return ColumnType::DATETIME;

    const ThresholdConfig& t = config_.thresholds;
    const double distinctCount = static_cast<double>(distinct.size());
    if (distinctCount <= t.categoricalMaxDistinctFraction * static_cast<double>(nonNull) &&
        distinct.size() <= t.categoricalMaxDistinct) {
        return ColumnType::CATEGORICAL;
    }
    return ColumnType::TEXT;
}

std::vector<ColumnSchema> SchemaInferencer::inferSchema(const Table& table) const {
    std::vector<ColumnSchema> schema(table.colCount());
    #ifdef USE_OPENMP
    const int workers = config_.threads > 0 ? static_cast<int>(config_.threads) : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(workers)
    #endif
    for (size_t c = 0; c < table.colCount(); ++c) {
        ColumnSchema& col = schema[c];
        col.name = table.columnNames()[c];
        const auto it = config_.columnTypeOverrides.find(col.name);
        if (it != config_.columnTypeOverrides.end()) {
            col.type = it->second;
            col.overridden = true;
        } else {
            col.type = inferColumnType(table.column(c));
        }
    }
    return schema;
}
