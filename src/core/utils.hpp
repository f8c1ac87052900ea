#pragma once

#include <string>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace income_api {

/**
 * Shared string and number helpers used by the config loader, the query parser and
 * the record model.
 */
namespace utils {

/**
 * Strip leading and trailing whitespace.
 */
inline std::string trim_copy(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

/**
 * Parse a whole string as a base-10 integer.
 * Returns nullopt on empty input, trailing garbage or overflow.
 */
inline std::optional<int64_t> parse_int64(const std::string& raw) {
    std::string s = trim_copy(raw);
    if (s.empty()) return std::nullopt;
    size_t pos = 0;
    int64_t v = 0;
    try {
        v = std::stoll(s, &pos, 10);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;
    return v;
}

/**
 * Parse a whole string as a finite double. Same failure rules as
 * parse_int64; "nan" and "inf" are rejected.
 */
inline std::optional<double> parse_double(const std::string& raw) {
    std::string s = trim_copy(raw);
    if (s.empty()) return std::nullopt;
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (pos != s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

/**
 * Extract the year from an ISO date ("2023-09-30" -> 2023).
 * Requires exactly four leading digits followed by end of string or '-'.
 */
inline std::optional<int64_t> leading_year(const std::string& s) {
    if (s.size() < 4) return std::nullopt;
    for (size_t i = 0; i < 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    if (s.size() > 4 && s[4] != '-') return std::nullopt;
    return std::stoll(s.substr(0, 4));
}

} // namespace utils
} // namespace income_api
