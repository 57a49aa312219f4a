// Pasifika - Identifier Hashing
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// SHA3-256 digests (OpenSSL EVP) used to derive stable identifiers such as
// treasury fund ids from their names.

#ifndef PASIFIKA_CRYPTO_HASH_H
#define PASIFIKA_CRYPTO_HASH_H

#include "pasifika/core/types.h"

#include <string>

namespace pasifika {

/// SHA3-256 of raw bytes; throws std::runtime_error if the digest fails
Hash256 SHA3Hash(const Byte* data, size_t len);

/// SHA3-256 of a string's bytes
Hash256 SHA3Hash(const std::string& str);

/// Domain-separated digest: SHA3-256(tag || 0x00 || value)
Hash256 TaggedHash(const std::string& tag, const std::string& value);

} // namespace pasifika

#endif // PASIFIKA_CRYPTO_HASH_H
