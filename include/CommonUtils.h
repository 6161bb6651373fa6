#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
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
 * @brief Strictly parses a finite decimal number from text.
 * @details Surrounding whitespace and one leading '+' are ignored; the rest must
 *          be consumed entirely. "inf", "nan" and overflow yield nullopt.
 */
inline std::optional<double> parseFiniteDouble(std::string_view raw) {
    std::string cleaned = trim(raw);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return std::nullopt;

    double out = 0.0;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(out)) return std::nullopt;
    return out;
}

/**
 * @brief Fixed-point rendering with the given number of decimals.
 * @post NaN renders as "NaN", infinities as "Infinity" / "-Infinity".
 */
inline std::string formatFixed(double value, int digits) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    char buf[512];
    const int n = std::snprintf(buf, sizeof(buf), "%.*f", digits, value);
    if (n <= 0) return "";
    std::string out(buf, static_cast<size_t>(std::min<int>(n, static_cast<int>(sizeof(buf)) - 1)));
    // "-0.00" displays as "0.00"
    if (out.front() == '-' && out.find_first_not_of("-0.") == std::string::npos) out.erase(out.begin());
    return out;
}

/**
 * @brief Keeps at most maxChars UTF-8 code points of label.
 * @details Continuation bytes (10xxxxxx) never start a character, so the cut
 *          always lands on a code-point boundary.
 */
inline std::string truncateLabel(const std::string& label, size_t maxChars) {
    if (label.size() <= maxChars) return label;
    size_t chars = 0;
    for (size_t i = 0; i < label.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(label[i]);
        if ((c & 0xC0) == 0x80) continue;
        if (chars == maxChars) return label.substr(0, i);
        ++chars;
    }
    return label;
}

inline void logVerbose(bool verbose, const std::string& line) {
    if (verbose) std::cout << line << "\n";
}

inline void logWarning(const std::string& stage, const std::string& message) {
    std::cerr << "[Tabula][" << stage << " Warning] " << message << "\n";
}

} // namespace CommonUtils
