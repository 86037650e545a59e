// ARBITER - Hash Functions
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// SHA-256 and SHA3-256 backed by OpenSSL EVP. Commitments use SHA3-256;
// store checksums use SHA-256.

#ifndef ARBITER_CRYPTO_HASH_H
#define ARBITER_CRYPTO_HASH_H

#include <arbiter/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace arbiter {

class DataStream;

enum class HashAlgorithm {
    SHA256,
    SHA3_256,
};

/// Incremental hasher
class Hasher {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    explicit Hasher(HashAlgorithm algorithm);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    /// Write data to the hasher
    Hasher& Write(const Byte* data, size_t len);

    Hasher& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize and return the digest. The hasher is reset afterwards.
    /// @throws std::runtime_error if the digest backend fails
    Hash256 Finalize();

    /// Reset hasher to initial state
    Hasher& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    HashAlgorithm algorithm_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// SHA-256 of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// SHA3-256 of data in a single call
Hash256 SHA3Hash(const Byte* data, size_t len);

inline Hash256 SHA3Hash(const std::vector<Byte>& data) {
    return SHA3Hash(data.data(), data.size());
}

/// SHA3-256 over the unread contents of a stream
Hash256 SHA3Hash(const DataStream& stream);

} // namespace arbiter

#endif // ARBITER_CRYPTO_HASH_H
