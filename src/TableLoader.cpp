#include "TableLoader.h"

#include "CommonUtils.h"
#include "GuardrailExceptions.h"

#include <fstream>
#include <sstream>

namespace {
std::string recordError(const std::string& sourceLabel, size_t recordNo, const std::string& what) {
    return sourceLabel + " record " + std::to_string(recordNo) + ": " + what;
}
}

Table TableLoader::fromCsvStream(std::istream& in, const std::string& sourceLabel) const {
    CSVUtils::skipBOM(in);

    CSVUtils::RecordStatus status = CSVUtils::RecordStatus::OK;
    std::vector<std::string> header;
    size_t recordNo = 0;
    while (header.empty()) {
        ++recordNo;
        header = CSVUtils::parseCSVLine(in, delimiter_, status, limits_);
        if (status == CSVUtils::RecordStatus::END_OF_INPUT) {
            throw Guardrail::DatasetException(sourceLabel + " is empty (no header row)");
        }
        if (status != CSVUtils::RecordStatus::OK) {
            throw Guardrail::DatasetException(recordError(sourceLabel, recordNo, "malformed header"));
        }
    }
    header = CSVUtils::normalizeHeader(header);

    std::vector<RawColumn> columns(header.size());
    while (true) {
        ++recordNo;
        std::vector<std::string> row = CSVUtils::parseCSVLine(in, delimiter_, status, limits_);
        if (status == CSVUtils::RecordStatus::END_OF_INPUT) break;
        if (status == CSVUtils::RecordStatus::MALFORMED) {
            throw Guardrail::DatasetException(recordError(sourceLabel, recordNo, "unterminated quoted field"));
        }
        if (status == CSVUtils::RecordStatus::LIMIT_EXCEEDED) {
            throw Guardrail::DatasetException(recordError(sourceLabel, recordNo, "field or column limit exceeded"));
        }
        if (row.empty()) continue;
        if (row.size() > header.size()) {
            throw Guardrail::DatasetException(recordError(sourceLabel, recordNo,
                "expected " + std::to_string(header.size()) + " fields, saw " + std::to_string(row.size())));
        }

        for (size_t c = 0; c < header.size(); ++c) {
            if (c >= row.size() || CommonUtils::isMissingToken(row[c])) {
                columns[c].emplace_back(MissingValue{});
            } else {
                columns[c].emplace_back(std::move(row[c]));
            }
        }
    }

    return Table(std::move(header), std::move(columns));
}

Table TableLoader::fromCsvText(const std::string& text, const std::string& sourceLabel) const {
    std::istringstream in(text);
    return fromCsvStream(in, sourceLabel);
}

Table TableLoader::fromCsvFile(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Guardrail::IOException("Could not open file: " + path);
    return fromCsvStream(in, path);
}
