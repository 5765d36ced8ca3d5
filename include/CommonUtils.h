#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Tokens the loader treats as an absent cell.
inline bool isMissingToken(std::string_view raw) {
    const std::string s = toLower(trim(raw));
    return s.empty() || s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

} // namespace CommonUtils
