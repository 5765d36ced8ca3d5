#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      RecordStatus& status,
                                      const ParseLimits& limits) {
    status = RecordStatus::OK;
    if (is.peek() == EOF) {
        status = RecordStatus::END_OF_INPUT;
        return {};
    }

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) {
            status = RecordStatus::LIMIT_EXCEEDED;
        }
    };

    char c = 0;
    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    field.push_back('"');
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                field.push_back('\n');
            } else {
                field.push_back(c);
            }
        } else if (c == '"' && trimUnquotedField(field).empty() && !fieldQuoted) {
            field.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else if (!fieldQuoted) {
            field.push_back(c);
        }
        // characters after a closing quote and before the delimiter are dropped

        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) {
            status = RecordStatus::LIMIT_EXCEEDED;
        }
        if (status == RecordStatus::LIMIT_EXCEEDED) return {};
    }

    if (inQuotes) {
        status = RecordStatus::MALFORMED;
        return {};
    }

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(field).empty()) {
        return {};
    }
    pushField();
    if (status == RecordStatus::LIMIT_EXCEEDED) return {};
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        const std::string original = out[i];
        if (seen.count(out[i]) > 0) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix)) > 0) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}
} // namespace CSVUtils
