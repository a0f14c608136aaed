// YIELDGOV - Core Types Header
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// This file defines fundamental types used throughout YIELDGOV.

#ifndef YIELDGOV_CORE_TYPES_H
#define YIELDGOV_CORE_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

namespace yieldgov {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// 256-bit unsigned integer (share counts, cash amounts, packed payloads)
using Uint256 = boost::multiprecision::uint256_t;

/// 512-bit unsigned integer for intermediate products
using Uint512 = boost::multiprecision::uint512_t;

/// Cash amount in smallest units
using Amount = Uint256;

/// Ownership token count
using ShareCount = Uint256;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Agreement identifier (also reused as a parameter selector by some proposals)
using AgreementId = uint64_t;

/// Secondary token id inside a shared multi-agreement ledger
using TokenId = uint64_t;

/// 10000 bp = 100%
constexpr uint64_t BASIS_POINTS = 10000;

/// Durations (seconds)
constexpr int64_t ONE_HOUR = 60 * 60;
constexpr int64_t ONE_DAY = 24 * ONE_HOUR;

/// floor(a * b / d) without intermediate overflow. Returns 0 when d == 0.
Uint256 MulDiv(const Uint256& a, const Uint256& b, const Uint256& d);

/// Basis-point share of a value: floor(value * bp / 10000)
inline Uint256 ApplyBasisPoints(const Uint256& value, uint64_t bp) {
    return MulDiv(value, Uint256(bp), Uint256(BASIS_POINTS));
}

/// Decimal rendering of a 256-bit value
std::string ToDecimalString(const Uint256& value);

// ============================================================================
// Fixed-size byte containers
// ============================================================================

/// Generic fixed-width byte string
template<size_t BITS>
class BaseBlob {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseBlob() noexcept {
        data_.fill(0);
    }

    explicit BaseBlob(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    BaseBlob(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseBlob& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseBlob& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic (big-endian) ordering
    bool operator<(const BaseBlob& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex, most significant byte first, no prefix
    std::string ToHex() const;

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit digest (event log chaining)
class Hash256 : public BaseBlob<256> {
public:
    using BaseBlob<256>::BaseBlob;
};

/**
 * 160-bit account address.
 *
 * Byte 0 is the most significant byte, so an address converts to the
 * integer it reads as in hex. The null address is the "no holder" sentinel
 * used for mint and burn.
 */
class Address : public BaseBlob<160> {
public:
    using BaseBlob<160>::BaseBlob;

    /// Integer value of the address (fits in the low 160 bits)
    Uint256 ToUint256() const;

    /// Build from the low 160 bits of an integer
    static Address FromUint256(const Uint256& value);

    /// Parse "0x..." or bare 40-digit hex; throws std::invalid_argument
    static Address FromHex(const std::string& hex);

    /// "0x" + 40 hex digits
    std::string ToString() const;

    /// Small deterministic address, handy for fixtures and registries
    static Address FromId(uint64_t id);
};

/// Mask selecting the 160 address bits of an integer
const Uint256& AddressMask();

} // namespace yieldgov

namespace std {
template<>
struct hash<yieldgov::Address> {
    size_t operator()(const yieldgov::Address& addr) const noexcept {
        size_t h = 0;
        for (auto b : addr) {
            h = h * 131 + b;
        }
        return h;
    }
};
} // namespace std

#endif // YIELDGOV_CORE_TYPES_H
