/**
 * @file input_validator.h
 * @brief Digest and size validation performed before any derivation
 *
 * Rules are checked in order and the first failure wins:
 *   - digest length must be 64              -> INVALID_DIGEST_LENGTH
 *   - digest must match ^[0-9a-fA-F]{64}$   -> INVALID_DIGEST_FORMAT
 *   - size must be >= 0                     -> NEGATIVE_SIZE
 *
 * The digest is not lowercased here.
 */

#pragma once

#include "drsid/identity/types.h"
#include <cstdint>
#include <string>

namespace drsid::identity {

/**
 * @brief Validate the caller-supplied digest and size
 * @param digest SHA-256 hex digest, any case
 * @param size File size in bytes
 * @return ValidationResult; message names the failed rule and offending value
 */
ValidationResult validateInputs(const std::string& digest, int64_t size);

/**
 * @brief Same checks as validateInputs, raising on failure
 * @throws drsid::common::InputValidationException
 */
void requireValidInputs(const std::string& digest, int64_t size);

} // namespace drsid::identity
