// YIELDGOV - SHA256 Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include "yieldgov/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace yieldgov {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        Init();
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

SHA256& SHA256::WriteU64(uint64_t value) {
    Byte buf[8];
    for (int i = 7; i >= 0; --i) {
        buf[i] = static_cast<Byte>(value & 0xFF);
        value >>= 8;
    }
    return Write(buf, sizeof(buf));
}

SHA256& SHA256::WriteU256(const Uint256& value) {
    Byte buf[32];
    Uint256 v = value;
    for (int i = 31; i >= 0; --i) {
        Uint256 low = v & 0xFF;
        buf[i] = static_cast<Byte>(low.convert_to<unsigned>());
        v >>= 8;
    }
    return Write(buf, sizeof(buf));
}

SHA256& SHA256::WriteString(const std::string& value) {
    WriteU64(value.size());
    return Write(reinterpret_cast<const Byte*>(value.data()), value.size());
}

Hash256 SHA256::Finalize() {
    Byte out[OUTPUT_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, out, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return Hash256(out, OUTPUT_SIZE);
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(data, len);
    return hasher.Finalize();
}

} // namespace yieldgov
