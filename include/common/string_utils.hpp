// common/string_utils.hpp
#ifndef USML_STRING_UTILS_HPP
#define USML_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include <sstream>

namespace common::utils {

// Splits a string by delimiter, optionally skipping empty parts
inline std::vector<std::string> split_string(
    const std::string& str,
    char delimiter,
    bool skip_empty = false) {

    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string part;

    while (std::getline(ss, part, delimiter)) {
        if (!skip_empty || !part.empty()) {
            parts.push_back(std::move(part));
        }
    }

    return parts;
}

inline std::string trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

inline bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// An identifier as used for table, column, alias and parameter names
inline bool is_identifier(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(str[0])) && str[0] != '_') {
        return false;
    }
    return std::all_of(str.begin() + 1, str.end(), is_identifier_char);
}

} // namespace common::utils

#endif // USML_STRING_UTILS_HPP
