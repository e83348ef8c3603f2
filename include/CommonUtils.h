#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

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

/**
 * @brief Strict numeric coercion of a single cell.
 * @details Surrounding whitespace and one leading '+' are accepted; anything else
 *          left over after the number, or a non-finite result, is a failure.
 */
inline bool parseNumber(std::string_view raw, double& out) {
    std::string s = trim(raw);
    if (!s.empty() && s.front() == '+') s.erase(s.begin());
    if (s.empty()) return false;
    // from_chars would accept "inf"/"nan" spellings; those are not numbers here.
    if (std::isalpha(static_cast<unsigned char>(s.front()))) return false;
    if (s.front() == '-' && s.size() > 1 && std::isalpha(static_cast<unsigned char>(s[1]))) return false;

    const char* b = s.data();
    const char* e = b + s.size();
    double parsed = 0.0;
    auto [p, ec] = std::from_chars(b, e, parsed, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(parsed)) return false;
    out = parsed;
    return true;
}

inline bool isNumber(std::string_view raw) {
    double ignored = 0.0;
    return parseNumber(raw, ignored);
}

// Shortest round-trip text form of a double ("3", "2.5", "34.333333333333336").
inline std::string formatNumber(double value) {
    char buf[64];
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return std::to_string(value);
    return std::string(buf, p);
}

inline double medianByNth(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (values.size() % 2 == 0) {
        std::nth_element(values.begin(), values.begin() + (mid - 1), values.begin() + mid);
        const long double lo = static_cast<long double>(values[mid - 1]);
        const long double hi = static_cast<long double>(upper);
        return static_cast<double>((lo + hi) / 2.0L);
    }
    return upper;
}

inline std::vector<std::string> splitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

} // namespace CommonUtils
