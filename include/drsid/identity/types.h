/**
 * @file types.h
 * @brief Common types and constants for deterministic file identifiers
 *
 * The constants below are shared with every other implementation of the
 * Git-DRS identifier scheme; changing any of them changes every UUID.
 */

#pragma once

#include <cstddef>
#include <string>

namespace drsid::identity {

/// @brief Authority segment of the canonical DID string
inline constexpr const char* AUTHORITY = "calypr.org";

/// @brief Name hashed under the DNS namespace to obtain the identifier namespace
inline constexpr const char* NAMESPACE_NAME = "aced-idp.org";

/// @brief Expected value of UUIDv3(DNS, NAMESPACE_NAME)
inline constexpr const char* NAMESPACE_UUID_ANCHOR = "3dbb886f-620b-3c52-bcb1-1992e7c6ccd5";

/// @brief Scheme prefix of every canonical string (precedes the authority)
inline constexpr const char* DID_PREFIX = "did:gen3:";

/// @brief Length of a SHA-256 digest in hex characters
inline constexpr size_t SHA256_HEX_LENGTH = 64;

/// @brief Input validation failure kinds, in the order the rules are checked
enum class ValidationError {
    NONE,                   ///< Inputs accepted
    INVALID_DIGEST_LENGTH,  ///< Digest is not exactly 64 characters
    INVALID_DIGEST_FORMAT,  ///< Digest contains a non-hex character
    NEGATIVE_SIZE           ///< Size is below zero
};

/// @brief Input validation result
struct ValidationResult {
    bool valid = true;
    ValidationError error = ValidationError::NONE;
    std::string message;    ///< Empty when valid
};

/// @brief Convert ValidationError to string
inline std::string validationErrorToString(ValidationError e) {
    switch (e) {
        case ValidationError::NONE:                  return "NONE";
        case ValidationError::INVALID_DIGEST_LENGTH: return "INVALID_DIGEST_LENGTH";
        case ValidationError::INVALID_DIGEST_FORMAT: return "INVALID_DIGEST_FORMAT";
        case ValidationError::NEGATIVE_SIZE:         return "NEGATIVE_SIZE";
    }
    return "UNKNOWN";
}

} // namespace drsid::identity
