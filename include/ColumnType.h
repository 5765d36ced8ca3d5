#pragma once

#include <optional>
#include <string>

enum class ColumnType { NUMERIC, BOOLEAN, CATEGORICAL, DATETIME, TEXT };

inline const char* columnTypeName(ColumnType type) {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::BOOLEAN: return "boolean";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::DATETIME: return "datetime";
        case ColumnType::TEXT: return "text";
    }
    return "text";
}

inline std::optional<ColumnType> columnTypeFromName(const std::string& name) {
    if (name == "numeric") return ColumnType::NUMERIC;
    if (name == "boolean") return ColumnType::BOOLEAN;
    if (name == "categorical") return ColumnType::CATEGORICAL;
    if (name == "datetime") return ColumnType::DATETIME;
    if (name == "text") return ColumnType::TEXT;
    return std::nullopt;
}
