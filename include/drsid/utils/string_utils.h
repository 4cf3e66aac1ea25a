/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * String operations used by the identifier pipeline and the CLI.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>

namespace drsid {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Replace every occurrence of one character with another
 *
 * @param str Input string
 * @param from Character to replace
 * @param to Replacement character
 * @return String with replacements
 */
std::string replaceAll(const std::string& str, char from, char to);

/**
 * @brief Collapse every run of a repeated character into a single one
 *
 * collapseRuns("a//b///c", '/') == "a/b/c"
 *
 * @param str Input string
 * @param ch Character whose runs are collapsed
 * @return Collapsed string
 */
std::string collapseRuns(const std::string& str, char ch);

/**
 * @brief Strip every trailing occurrence of a character
 *
 * @param str Input string
 * @param ch Character to strip
 * @return String without trailing ch
 */
std::string trimRight(const std::string& str, char ch);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Check if string ends with suffix
 */
bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief Check that every character is a hexadecimal digit (either case)
 *
 * @param str Input string
 * @return true if non-empty and all of [0-9a-fA-F]
 */
bool isHexString(const std::string& str);

} // namespace utils
} // namespace drsid
