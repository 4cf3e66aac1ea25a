/**
 * @file file_identity.cpp
 * @brief Deterministic file identifier pipeline
 */

#include "drsid/identity/file_identity.h"
#include "drsid/identity/canonical_string.h"
#include "drsid/identity/input_validator.h"
#include "drsid/identity/path_normalizer.h"
#include "drsid/utils/string_utils.h"

#include <spdlog/spdlog.h>

namespace drsid::identity {

FileIdentity computeFileIdentity(const std::string& logicalPath,
                                 const std::string& sha256,
                                 int64_t size) {
    requireValidInputs(sha256, size);

    FileIdentity identity;
    identity.normalizedPath = normalizeLogicalPath(logicalPath);
    identity.digest = utils::toLower(sha256);
    identity.size = size;
    identity.canonical = buildCanonicalString(identity.normalizedPath, identity.digest, size);
    identity.uuid = deriveFileUuid(namespaceUuid(), identity.canonical);

    spdlog::debug("[FileIdentity] {} -> {}", identity.canonical, identity.uuid.toString());
    return identity;
}

std::string computeDeterministicUuid(const std::string& logicalPath,
                                     const std::string& sha256,
                                     int64_t size) {
    return computeFileIdentity(logicalPath, sha256, size).uuid.toString();
}

} // namespace drsid::identity
