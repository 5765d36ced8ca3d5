#include "Table.h"

#include "GuardrailExceptions.h"

Table::Table(std::vector<std::string> columnNames, std::vector<RawColumn> columns)
    : columnNames_(std::move(columnNames)), columns_(std::move(columns)) {
    if (columns_.empty()) {
        throw Guardrail::InvalidTableException("table has no columns");
    }
    if (columnNames_.size() != columns_.size()) {
        throw Guardrail::InvalidTableException("expected " + std::to_string(columnNames_.size()) +
                                               " columns for the given names, got " +
                                               std::to_string(columns_.size()));
    }

    rowCount_ = columns_.front().size();
    for (size_t i = 0; i < columns_.size(); ++i) {
        const std::string& name = columnNames_[i];
        if (name.empty()) {
            throw Guardrail::InvalidTableException("column " + std::to_string(i + 1) + " has an empty name");
        }
        if (!indexByName_.emplace(name, i).second) {
            throw Guardrail::InvalidTableException("duplicate column name '" + name + "'");
        }
        if (columns_[i].size() != rowCount_) {
            throw Guardrail::InvalidTableException("column '" + name + "' has " +
                                                   std::to_string(columns_[i].size()) + " rows, expected " +
                                                   std::to_string(rowCount_));
        }
    }
}

int Table::findColumnIndex(const std::string& name) const {
    const auto it = indexByName_.find(name);
    if (it == indexByName_.end()) return -1;
    return static_cast<int>(it->second);
}
