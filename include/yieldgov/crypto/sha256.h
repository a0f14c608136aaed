// YIELDGOV - SHA256 Hash Function
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest API.

#ifndef YIELDGOV_CRYPTO_SHA256_H
#define YIELDGOV_CRYPTO_SHA256_H

#include "yieldgov/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace yieldgov {

/// SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Big-endian fixed-width helpers used when hashing structured records
    SHA256& WriteU64(uint64_t value);
    SHA256& WriteU256(const Uint256& value);
    SHA256& WriteString(const std::string& value);

    /// Finalize the hash; the hasher must be Reset() before reuse
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace yieldgov

#endif // YIELDGOV_CRYPTO_SHA256_H
