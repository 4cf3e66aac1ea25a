/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exception types shared by the drsid library and the drsid-uuid tool.
 *
 * @date 2026-10-19
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace drsid::common {

/**
 * @brief Base exception for all drsid exceptions
 */
class DrsIdException : public std::runtime_error {
public:
    explicit DrsIdException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Digest or size input rejected before derivation
 *
 * Carries the rule code (e.g. "INVALID_DIGEST_LENGTH") and the bare
 * human-readable message next to the prefixed what() text.
 */
class InputValidationException : public DrsIdException {
private:
    std::string code_;
    std::string message_;

public:
    InputValidationException(std::string code, std::string message)
        : DrsIdException("Validation error: " + message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

/**
 * @brief OpenSSL digest operation failed
 */
class CryptoException : public DrsIdException {
public:
    explicit CryptoException(const std::string& message)
        : DrsIdException("Crypto error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public DrsIdException {
public:
    explicit ConfigException(const std::string& message)
        : DrsIdException("Configuration error: " + message) {}
};

/**
 * @brief Batch manifest could not be read or parsed
 */
class ManifestException : public DrsIdException {
public:
    explicit ManifestException(const std::string& message)
        : DrsIdException("Manifest error: " + message) {}
};

/**
 * @brief Malformed command line
 */
class UsageException : public DrsIdException {
public:
    explicit UsageException(const std::string& message)
        : DrsIdException(message) {}
};

} // namespace drsid::common
