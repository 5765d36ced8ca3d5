#pragma once

#include "ColumnType.h"
#include "GuardrailConfig.h"
#include "Table.h"

#include <string>
#include <vector>

struct ColumnSchema {
    std::string name;
    ColumnType type = ColumnType::TEXT;
    bool overridden = false;
};

/**
 * @brief Assigns one ColumnType per column from its non-missing values.
 * @details Order of tests: boolean literals, numbers, date/time patterns, the
 *          categorical distinct-count limits, then text. The result depends only
 *          on the set of values, never on their order.
 */
class SchemaInferencer {
public:
    explicit SchemaInferencer(const GuardrailConfig& config) : config_(config) {}

    ColumnType inferColumnType(const RawColumn& column) const;

    /**
     * @brief Infers every column, then applies `type.<column>` overrides.
     */
    std::vector<ColumnSchema> inferSchema(const Table& table) const;

private:
    const GuardrailConfig& config_;
};
