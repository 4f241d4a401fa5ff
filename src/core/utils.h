/**
 * SongGraph - Utility Functions
 */

#ifndef SONGGRAPH_UTILS_H
#define SONGGRAPH_UTILS_H

#include <string>
#include <cmath>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <limits>
#include <algorithm>

namespace songgraph {
namespace utils {

/* ============================================================================
 * String Utilities
 * ============================================================================ */

inline char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ascii_lower);
    return s;
}

/**
 * ASCII case-insensitive equality. Non-ASCII bytes must match exactly.
 */
inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
    }
    return true;
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

/* ============================================================================
 * Number Parsing
 * ============================================================================ */

/**
 * Parse a whole-string float. Surrounding whitespace is allowed.
 */
inline std::optional<float> parse_float(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    float value = std::strtof(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/**
 * Parse a whole-string signed integer. Surrounding whitespace is allowed.
 */
inline std::optional<long long> parse_int(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

/**
 * Parse a whole-string integer that must fit in an int.
 */
inline std::optional<int> parse_int32(const std::string& text) {
    auto value = parse_int(text);
    if (!value || *value < std::numeric_limits<int>::min() ||
        *value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

/**
 * Parse a 1-based selection index. Only plain digits are accepted.
 */
inline std::optional<size_t> parse_index(const std::string& text) {
    std::string s = trim(text);
    if (s.empty() || s.size() > 9) return std::nullopt;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return static_cast<size_t>(std::stoul(s));
}

/**
 * Parse an explicit-content token (true/yes/1, false/no/0, any case).
 */
inline std::optional<bool> parse_bool_token(const std::string& text) {
    std::string s = to_lower(trim(text));
    if (s == "true" || s == "yes" || s == "1") return true;
    if (s == "false" || s == "no" || s == "0") return false;
    return std::nullopt;
}

/* ============================================================================
 * Formatting
 * ============================================================================ */

/**
 * Fixed two-decimal rendering used in labels and summaries.
 */
inline std::string format_fixed2(float value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(value));
    return buf;
}

} // namespace utils
} // namespace songgraph

#endif // SONGGRAPH_UTILS_H
