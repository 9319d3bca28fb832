/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the sanitizer and the error taxonomy.
 *
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>

namespace dependabot {
namespace utils {

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * Empty fields are kept, including a trailing one ("a,b," -> ["a", "b", ""]).
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Join strings with delimiter
 *
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Replace all occurrences of substring
 *
 * Literal replacement, no pattern semantics. An empty @p from leaves the
 * input unchanged.
 *
 * @param str Input string
 * @param from Substring to replace
 * @param to Replacement string
 * @return String with replacements
 */
std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

} // namespace utils
} // namespace dependabot
