#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

struct MissingValue {
    bool operator==(const MissingValue&) const noexcept { return true; }
};

using RawValue = std::variant<MissingValue, std::string>;
using RawColumn = std::vector<RawValue>;

inline bool isMissing(const RawValue& value) noexcept {
    return std::holds_alternative<MissingValue>(value);
}

/**
 * @brief Immutable column-major table of raw cells.
 * @details Column names are unique and every column has rowCount() cells.
 */
class Table {
public:
    /**
     * @throws Guardrail::InvalidTableException for zero columns, a names/columns
     *         count mismatch, empty or duplicate names, or ragged columns.
     */
    Table(std::vector<std::string> columnNames, std::vector<RawColumn> columns);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<std::string>& columnNames() const noexcept { return columnNames_; }
    const RawColumn& column(size_t index) const { return columns_.at(index); }
    const RawValue& cell(size_t row, size_t col) const { return columns_.at(col).at(row); }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

private:
    std::vector<std::string> columnNames_;
    std::vector<RawColumn> columns_;
    std::unordered_map<std::string, size_t> indexByName_;
    size_t rowCount_ = 0;
};
