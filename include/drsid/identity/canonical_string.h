/**
 * @file canonical_string.h
 * @brief Canonical DID string construction
 *
 * Format: did:gen3:<authority>:<normalized_path>:<lowercase_sha256>:<size>
 *
 * Delimiters inside the path are not escaped, so a path containing ':' gives
 * an ambiguous (but still deterministic) string. Other implementations emit
 * the same literal template, so this must not change.
 */

#pragma once

#include <cstdint>
#include <string>

namespace drsid::identity {

/**
 * @brief Build the canonical DID string
 * @param normalizedPath Output of normalizeLogicalPath()
 * @param digest SHA-256 hex digest, any case (lowercased here)
 * @param size File size in bytes, rendered in decimal
 * @return Canonical string
 */
std::string buildCanonicalString(const std::string& normalizedPath,
                                 const std::string& digest,
                                 int64_t size);

} // namespace drsid::identity
