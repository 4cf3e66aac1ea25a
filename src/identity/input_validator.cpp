/**
 * @file input_validator.cpp
 * @brief Digest and size validation
 */

#include "drsid/identity/input_validator.h"
#include "drsid/common/exceptions.h"
#include "drsid/utils/string_utils.h"

namespace drsid::identity {

namespace {

ValidationResult failure(ValidationError error, std::string message) {
    ValidationResult result;
    result.valid = false;
    result.error = error;
    result.message = std::move(message);
    return result;
}

} // anonymous namespace

ValidationResult validateInputs(const std::string& digest, int64_t size) {
    if (digest.length() != SHA256_HEX_LENGTH) {
        return failure(ValidationError::INVALID_DIGEST_LENGTH,
                       "SHA256 must be 64 characters, got " + std::to_string(digest.length()));
    }

    if (!utils::isHexString(digest)) {
        return failure(ValidationError::INVALID_DIGEST_FORMAT,
                       "SHA256 must be hexadecimal");
    }

    if (size < 0) {
        return failure(ValidationError::NEGATIVE_SIZE,
                       "Size must be non-negative");
    }

    return ValidationResult{};
}

void requireValidInputs(const std::string& digest, int64_t size) {
    ValidationResult result = validateInputs(digest, size);
    if (!result.valid) {
        throw common::InputValidationException(
            validationErrorToString(result.error), result.message);
    }
}

} // namespace drsid::identity
