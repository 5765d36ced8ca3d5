#pragma once

#include "CSVUtils.h"
#include "Table.h"

#include <istream>
#include <string>

/**
 * @brief Builds a Table from CSV input.
 * @details The first record is the header. Missing tokens (empty, NA, N/A, null,
 *          none, nan, missing; case-insensitive) become MissingValue; short rows
 *          are padded with MissingValue.
 */
class TableLoader {
public:
    explicit TableLoader(char delimiter = ',', CSVUtils::ParseLimits limits = CSVUtils::ParseLimits{})
        : delimiter_(delimiter), limits_(limits) {}

    /**
     * @throws Guardrail::DatasetException on an empty or malformed CSV, or a row
     *         wider than the header.
     */
    Table fromCsvStream(std::istream& in, const std::string& sourceLabel = "input") const;
    Table fromCsvText(const std::string& text, const std::string& sourceLabel = "input") const;

    /**
     * @throws Guardrail::IOException when the file cannot be opened.
     */
    Table fromCsvFile(const std::string& path) const;

private:
    char delimiter_;
    CSVUtils::ParseLimits limits_;
};
