/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "dependabot/utils/string_utils.h"
#include <cctype>
#include <sstream>

namespace dependabot {
namespace utils {

std::string trim(const std::string& str) {
    // Find first non-whitespace character
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    // If all whitespace, return empty string
    if (start == str.length()) {
        return "";
    }

    // Find last non-whitespace character
    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;

    if (str.empty()) {
        tokens.push_back("");  // Empty string → [""]
        return tokens;
    }

    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    // Handle trailing delimiter: "a,b," should produce ["a", "b", ""]
    if (str.back() == delimiter) {
        tokens.push_back("");
    }

    return tokens;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

std::string replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result;
    result.reserve(str.size());

    size_t pos = 0;
    size_t found;
    while ((found = str.find(from, pos)) != std::string::npos) {
        result.append(str, pos, found - pos);
        result += to;
        pos = found + from.size();
    }
    result.append(str, pos, std::string::npos);

    return result;
}

} // namespace utils
} // namespace dependabot
