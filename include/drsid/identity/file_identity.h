/**
 * @file file_identity.h
 * @brief Deterministic file identifier pipeline
 *
 * validate -> normalize path -> build canonical DID -> UUIDv5(namespace, DID)
 *
 * For fixed (path, sha256, size) the result is byte-identical across calls,
 * processes and every conforming implementation of the scheme.
 */

#pragma once

#include "drsid/identity/uuid.h"
#include <cstdint>
#include <string>

namespace drsid::identity {

/// @brief Every value produced along the pipeline
struct FileIdentity {
    std::string normalizedPath;
    std::string digest;         ///< Lowercase SHA-256 hex
    int64_t size = 0;
    std::string canonical;      ///< Canonical DID string
    Uuid uuid;
};

/**
 * @brief Compute the identity of a file
 * @param logicalPath Repository-relative path (normalized here)
 * @param sha256 SHA-256 hex digest, any case
 * @param size File size in bytes
 * @throws drsid::common::InputValidationException on invalid digest or size
 */
FileIdentity computeFileIdentity(const std::string& logicalPath,
                                 const std::string& sha256,
                                 int64_t size);

/**
 * @brief Compute only the formatted deterministic UUID
 * @throws drsid::common::InputValidationException on invalid digest or size
 */
std::string computeDeterministicUuid(const std::string& logicalPath,
                                     const std::string& sha256,
                                     int64_t size);

} // namespace drsid::identity
