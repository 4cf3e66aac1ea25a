/**
 * @file path_normalizer.cpp
 * @brief Logical path canonicalization
 */

#include "drsid/identity/path_normalizer.h"
#include "drsid/utils/string_utils.h"

namespace drsid::identity {

std::string normalizeLogicalPath(const std::string& path) {
    // Backslash is a legal filename character on POSIX, so convert it explicitly
    std::string result = utils::replaceAll(path, '\\', '/');

    result = utils::collapseRuns(result, '/');

    if (result.length() > 1 && utils::endsWith(result, "/")) {
        result = utils::trimRight(result, '/');
    }

    if (!utils::startsWith(result, "/")) {
        result = "/" + result;
    }

    return result;
}

} // namespace drsid::identity
