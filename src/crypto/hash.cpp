// Pasifika - Identifier Hashing Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/crypto/hash.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>
#include <vector>

namespace pasifika {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

Hash256 SHA3Hash(const Byte* data, size_t len) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create digest context");
    }

    Byte digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("SHA3-256 digest failed");
    }

    return Hash256(digest, digestLen);
}

Hash256 SHA3Hash(const std::string& str) {
    return SHA3Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

Hash256 TaggedHash(const std::string& tag, const std::string& value) {
    std::vector<Byte> buf;
    buf.reserve(tag.size() + 1 + value.size());
    buf.insert(buf.end(), tag.begin(), tag.end());
    buf.push_back(0x00);
    buf.insert(buf.end(), value.begin(), value.end());
    return SHA3Hash(buf.data(), buf.size());
}

} // namespace pasifika
