#include "ValueParsers.h"

#include "CommonUtils.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>

namespace {
bool parseFixedInt(std::string_view s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        const unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
}

bool parseDatePart(std::string_view datePart, int& year, int& month, int& day) {
    if (datePart.size() != 10) return false;

    // YYYY-MM-DD / YYYY/MM/DD
    if ((datePart[4] == '-' || datePart[4] == '/') && datePart[7] == datePart[4]) {
        return parseFixedInt(datePart, 0, 4, year) &&
               parseFixedInt(datePart, 5, 2, month) &&
               parseFixedInt(datePart, 8, 2, day);
    }

    // dd/mm/yyyy or mm/dd/yyyy; a first field above 12 can only be a day.
    if (datePart[2] == '/' && datePart[5] == '/') {
        int a = 0;
        int b = 0;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, year)) {
            return false;
        }
        if (a > 12) {
            day = a;
            month = b;
        } else {
            month = a;
            day = b;
        }
        return true;
    }

    // DD-MM-YYYY
    if (datePart[2] == '-' && datePart[5] == '-') {
        return parseFixedInt(datePart, 0, 2, day) &&
               parseFixedInt(datePart, 3, 2, month) &&
               parseFixedInt(datePart, 6, 4, year);
    }

    return false;
}

bool parseTimePart(std::string_view timePart, int& hour, int& minute, int& second, bool& fractional) {
    hour = minute = second = 0;
    fractional = false;
    if (timePart.empty()) return true;
    if (timePart.back() == 'Z' || timePart.back() == 'z') timePart.remove_suffix(1);

    if (timePart.size() < 5 || timePart[2] != ':') return false;
    if (!parseFixedInt(timePart, 0, 2, hour) || !parseFixedInt(timePart, 3, 2, minute)) return false;
    if (timePart.size() == 5) return true;

    if (timePart.size() < 8 || timePart[5] != ':' || !parseFixedInt(timePart, 6, 2, second)) return false;
    if (timePart.size() == 8) return true;

    if (timePart[8] != '.' || timePart.size() == 9) return false;
    for (size_t i = 9; i < timePart.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(timePart[i]))) return false;
    }
    fractional = true;
    return true;
}
} // namespace

namespace ValueParsers {

bool parseNumber(std::string_view text, double& out) {
    const std::string s = CommonUtils::trim(text);
    if (s.empty()) return false;

    size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    bool digits = false;
    bool dot = false;
    for (; i < s.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(s[i]);
        if (std::isdigit(ch)) {
            digits = true;
        } else if (ch == '.' && !dot) {
            dot = true;
        } else if ((ch == 'e' || ch == 'E') && digits) {
            size_t j = i + 1;
            if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;
            if (j >= s.size()) return false;
            for (; j < s.size(); ++j) {
                if (!std::isdigit(static_cast<unsigned char>(s[j]))) return false;
            }
            break;
        } else {
            return false;
        }
    }
    if (!digits) return false;

    const char* begin = s.data() + (s[0] == '+' ? 1 : 0);
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(begin, end, out, std::chars_format::general);
    return ec == std::errc{} && ptr == end && std::isfinite(out);
}

bool parseBoolean(std::string_view text, bool& out) {
    const std::string s = CommonUtils::trim(text);
    if (CommonUtils::iequals(s, "true")) {
        out = true;
        return true;
    }
    if (CommonUtils::iequals(s, "false")) {
        out = false;
        return true;
    }
    return false;
}

bool parseDateTime(std::string_view text, DateTimeValue& out) {
    const std::string s = CommonUtils::trim(text);
    if (s.size() < 10) return false;

    std::string_view datePart(s);
    std::string_view timePart;
    if (s.size() > 10) {
        if (s[10] != ' ' && s[10] != 'T') return false;
        datePart = std::string_view(s).substr(0, 10);
        timePart = std::string_view(s).substr(11);
        if (timePart.empty()) return false;
    }

    DateTimeValue value;
    if (!parseDatePart(datePart, value.year, value.month, value.day)) return false;
    if (!parseTimePart(timePart, value.hour, value.minute, value.second, value.fractionalSeconds)) return false;

    if (value.month < 1 || value.month > 12) return false;
    if (value.day < 1 || value.day > daysInMonth(value.year, value.month)) return false;
    if (value.hour > 23 || value.minute > 59 || value.second > 59) return false;

    const int64_t days = daysFromCivil(value.year, static_cast<unsigned>(value.month), static_cast<unsigned>(value.day));
    value.epochSeconds = days * 86400 + static_cast<int64_t>(value.hour) * 3600 +
                         static_cast<int64_t>(value.minute) * 60 + value.second;
    out = value;
    return true;
}

std::string formatIsoDateTime(int64_t epochSeconds) {
    int64_t days = epochSeconds / 86400;
    int64_t rem = epochSeconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  year, month, day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return buf;
}

} // namespace ValueParsers
