/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "drsid/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace drsid {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string replaceAll(const std::string& str, char from, char to) {
    std::string result = str;
    std::replace(result.begin(), result.end(), from, to);
    return result;
}

std::string collapseRuns(const std::string& str, char ch) {
    std::string result;
    result.reserve(str.length());

    for (char c : str) {
        if (c == ch && !result.empty() && result.back() == ch) {
            continue;
        }
        result.push_back(c);
    }

    return result;
}

std::string trimRight(const std::string& str, char ch) {
    size_t end = str.find_last_not_of(ch);
    if (end == std::string::npos) {
        return "";
    }
    return str.substr(0, end + 1);
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.length() >= suffix.length() &&
           str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool isHexString(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace utils
} // namespace drsid
