/**
 * @file path_normalizer.h
 * @brief Logical path canonicalization
 */

#pragma once

#include <string>

namespace drsid::identity {

/**
 * @brief Normalize a repository-relative path to its logical form
 *
 * Applied in order:
 *   1. every '\' becomes '/'
 *   2. runs of '/' collapse to one
 *   3. trailing '/' is stripped unless the path is "/"
 *   4. a leading '/' is added if missing
 *
 * "." and ".." segments are kept as-is. Any input is accepted; "" maps to "/".
 *
 * @param path Path as supplied by the caller
 * @return Normalized logical path
 */
std::string normalizeLogicalPath(const std::string& path);

} // namespace drsid::identity
