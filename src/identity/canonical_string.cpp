/**
 * @file canonical_string.cpp
 * @brief Canonical DID string construction
 */

#include "drsid/identity/canonical_string.h"
#include "drsid/identity/types.h"
#include "drsid/utils/string_utils.h"

namespace drsid::identity {

std::string buildCanonicalString(const std::string& normalizedPath,
                                 const std::string& digest,
                                 int64_t size) {
    std::string canonical = DID_PREFIX;
    canonical += AUTHORITY;
    canonical += ':';
    canonical += normalizedPath;
    canonical += ':';
    canonical += utils::toLower(digest);
    canonical += ':';
    canonical += std::to_string(size);
    return canonical;
}

} // namespace drsid::identity
