#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace vortex_l0 {

/**
 * @brief String utility functions shared by the classifiers and plugins
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase a string in place (ASCII)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// True if any needle is a substring of haystack.
inline bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (contains(haystack, n)) return true;
    }
    return false;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Split on a single delimiter character, keeping empty pieces
 */
inline std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : str) {
        if (c == delim) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief Largest cut position <= max_bytes that does not split a UTF-8 sequence
 */
inline size_t utf8_boundary(const std::string& str, size_t max_bytes) {
    if (str.size() <= max_bytes) return str.size();
    size_t pos = max_bytes;
    while (pos > 0 && (static_cast<unsigned char>(str[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

/**
 * @brief At most max_bytes of str, cut on a code-point boundary
 */
inline std::string utf8_prefix(const std::string& str, size_t max_bytes) {
    return str.substr(0, utf8_boundary(str, max_bytes));
}

/**
 * @brief First max_chars bytes (never splitting a UTF-8 sequence), with "..." appended when cut
 */
inline std::string truncate(const std::string& str, size_t max_chars) {
    if (str.size() <= max_chars) return str;
    return utf8_prefix(str, max_chars) + "...";
}

/**
 * @brief Percent-encode everything except RFC 3986 unreserved characters
 */
inline std::string url_encode(const std::string& str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace utils

} // namespace vortex_l0
