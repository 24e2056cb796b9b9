#pragma once

/**
 * String utilities for the desk
 *
 * Symbol normalisation and the small splitting helpers shared by the CLI,
 * the config loader and the cache keys.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace rolldesk {
namespace util {

inline std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

/**
 * Symbols are case-insensitive at every public entry point; caches key on the
 * upper-case form.
 */
inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

/**
 * Split a comma-separated string into a vector of trimmed, uppercase strings.
 * Empty items and duplicates are dropped, first occurrence wins.
 *
 * Example: split_symbols("qqq, TQQQ,,qqq") -> {"QQQ", "TQQQ"}
 */
inline std::vector<std::string> split_symbols(const std::string& s) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = to_upper(trim(item));
        if (!item.empty() && std::find(result.begin(), result.end(), item) == result.end()) {
            result.push_back(item);
        }
    }
    return result;
}

/// Comma-separated list, trimmed, empty items dropped, case kept
inline std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

}  // namespace util
}  // namespace rolldesk
