#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ValueParsers {

struct DateTimeValue {
    int64_t epochSeconds = 0;
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    bool fractionalSeconds = false;
};

/**
 * @brief Locale-invariant number parsing: optional sign, digits, one '.', optional exponent.
 * @details Thousands separators, percent signs and non-finite spellings are rejected.
 */
bool parseNumber(std::string_view text, double& out);

/**
 * @brief Case-insensitive "true"/"false" only.
 */
bool parseBoolean(std::string_view text, bool& out);

/**
 * @brief Parses the supported calendar formats with an optional time of day.
 * @details Date: YYYY-MM-DD, YYYY/MM/DD, DD/MM/YYYY or MM/DD/YYYY, DD-MM-YYYY.
 *          Time (after ' ' or 'T'): HH:MM or HH:MM:SS[.fff], optional trailing 'Z'.
 */
bool parseDateTime(std::string_view text, DateTimeValue& out);

std::string formatIsoDateTime(int64_t epochSeconds);

} // namespace ValueParsers
