/**
 * @file uuid.cpp
 * @brief UUID value type and name-based (v3/v5) derivation
 */

#include "drsid/identity/uuid.h"
#include "drsid/identity/types.h"
#include "drsid/common/exceptions.h"

#include <algorithm>
#include <uuid/uuid.h>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace drsid::identity {

namespace {

const EVP_MD* digestFor(UuidVersion version) {
    switch (version) {
        case UuidVersion::MD5:  return EVP_md5();
        case UuidVersion::SHA1: return EVP_sha1();
    }
    return nullptr;
}

} // anonymous namespace

// --- Uuid ---

std::string Uuid::toString() const {
    uuid_t raw;
    std::copy(bytes_.begin(), bytes_.end(), raw);

    char str[37];
    uuid_unparse_lower(raw, str);
    return std::string(str);
}

// --- Derivation ---

const Uuid& dnsNamespace() {
    static const Uuid dns(Uuid::Bytes{
        0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
    });
    return dns;
}

Uuid deriveNameBasedUuid(const Uuid& ns, const std::string& name, UuidVersion version) {
    const EVP_MD* md = digestFor(version);
    if (!md) {
        throw common::CryptoException("unsupported name-based UUID version");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw common::CryptoException("EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx, ns.bytes().data(), ns.bytes().size()) != 1 ||
        EVP_DigestUpdate(ctx, name.data(), name.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        ERR_clear_error();
        throw common::CryptoException(std::string(EVP_MD_name(md)) + " digest failed");
    }
    EVP_MD_CTX_free(ctx);

    // MD5 yields exactly 16 bytes, SHA-1 yields 20 and is truncated
    Uuid::Bytes bytes;
    std::copy(hash, hash + bytes.size(), bytes.begin());

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (static_cast<uint8_t>(version) << 4));
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return Uuid(bytes);
}

const Uuid& namespaceUuid() {
    static const Uuid ns = []() {
        Uuid derived = deriveNameBasedUuid(dnsNamespace(), NAMESPACE_NAME, UuidVersion::MD5);
        spdlog::debug("[Uuid] Namespace derived: {}", derived.toString());
        return derived;
    }();
    return ns;
}

Uuid deriveFileUuid(const Uuid& ns, const std::string& canonical) {
    return deriveNameBasedUuid(ns, canonical, UuidVersion::SHA1);
}

} // namespace drsid::identity
