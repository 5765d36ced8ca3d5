#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Record-level CSV tokenization and header normalization.
// Cells come back as text; deciding what is missing belongs to TableLoader.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;   // 8 MiB
	size_t maxColumns = 20000;
};

enum class RecordStatus { OK, END_OF_INPUT, MALFORMED, LIMIT_EXCEEDED };

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span physical lines.
 * @param status receives MALFORMED for an unterminated quote and LIMIT_EXCEEDED
 *        when a field or the column count passes @p limits.
 * @return the record's fields; empty for a blank line or end of input.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  RecordStatus& status,
									  const ParseLimits& limits = ParseLimits{});

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
