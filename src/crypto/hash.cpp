// ARBITER - Hash Functions Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/crypto/hash.h>
#include <arbiter/core/serialize.h>

#include <openssl/evp.h>

#include <stdexcept>

namespace arbiter {

namespace {

const EVP_MD* SelectDigest(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA3_256: return EVP_sha3_256();
    }
    return EVP_sha256();
}

Hash256 OneShot(HashAlgorithm algorithm, const Byte* data, size_t len) {
    Byte out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_Digest(data, len, out, &outLen, SelectDigest(algorithm), nullptr) != 1 ||
        outLen != Hasher::OUTPUT_SIZE) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return Hash256(out, outLen);
}

} // namespace

// ============================================================================
// Hasher
// ============================================================================

struct Hasher::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {}
    ~Impl() {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

Hasher::Hasher(HashAlgorithm algorithm)
    : impl_(std::make_unique<Impl>()), algorithm_(algorithm) {
    if (!impl_->ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Reset();
}

Hasher::~Hasher() = default;

Hasher& Hasher::Reset() {
    if (EVP_DigestInit_ex(impl_->ctx, SelectDigest(algorithm_), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return *this;
}

Hasher& Hasher::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Hash256 Hasher::Finalize() {
    Byte out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, out, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    Reset();
    return Hash256(out, outLen);
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    return OneShot(HashAlgorithm::SHA256, data, len);
}

Hash256 SHA3Hash(const Byte* data, size_t len) {
    return OneShot(HashAlgorithm::SHA3_256, data, len);
}

Hash256 SHA3Hash(const DataStream& stream) {
    return SHA3Hash(stream.data(), stream.size());
}

} // namespace arbiter
