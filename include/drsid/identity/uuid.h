/**
 * @file uuid.h
 * @brief UUID value type and name-based (v3/v5) derivation
 *
 * Name-based derivation follows the standard byte-level algorithm:
 * hash(namespace bytes, network order || name bytes) with MD5 (v3) or
 * SHA-1 (v5), keep the first 16 bytes, then patch the version nibble
 * (byte 6) and the variant bits (byte 8).
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace drsid::identity {

/// @brief Name-based UUID versions
enum class UuidVersion : uint8_t {
    MD5 = 3,    ///< UUIDv3
    SHA1 = 5    ///< UUIDv5
};

/**
 * @brief 128-bit UUID in network byte order
 */
class Uuid {
public:
    using Bytes = std::array<uint8_t, 16>;

    /// Nil UUID (all zeros)
    Uuid() : bytes_{} {}

    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Lowercase hyphenated form, e.g. "3dbb886f-620b-3c52-bcb1-1992e7c6ccd5"
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] const Bytes& bytes() const noexcept {
        return bytes_;
    }

    /// Version nibble (high 4 bits of byte 6)
    [[nodiscard]] int version() const noexcept {
        return bytes_[6] >> 4;
    }

    /// True if the variant bits are 10xx (RFC 4122)
    [[nodiscard]] bool isRfc4122Variant() const noexcept {
        return (bytes_[8] & 0xC0) == 0x80;
    }

private:
    Bytes bytes_;
};

/**
 * @brief Standard DNS namespace, 6ba7b810-9dad-11d1-80b4-00c04fd430c8
 */
const Uuid& dnsNamespace();

/**
 * @brief Derive a name-based UUID
 * @param ns Namespace UUID
 * @param name Name, hashed as raw bytes
 * @param version MD5 (v3) or SHA1 (v5)
 * @throws drsid::common::CryptoException if the OpenSSL digest fails
 */
Uuid deriveNameBasedUuid(const Uuid& ns, const std::string& name, UuidVersion version);

/**
 * @brief Identifier namespace: UUIDv3(DNS, "aced-idp.org")
 *
 * Computed on first use and reused for the lifetime of the process.
 * Always equals NAMESPACE_UUID_ANCHOR.
 */
const Uuid& namespaceUuid();

/**
 * @brief Final file identifier: UUIDv5(ns, canonical)
 * @param ns Namespace UUID (normally namespaceUuid())
 * @param canonical Canonical DID string
 */
Uuid deriveFileUuid(const Uuid& ns, const std::string& canonical);

} // namespace drsid::identity
