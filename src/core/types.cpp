// YIELDGOV - Core Types Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include "yieldgov/core/types.h"

#include <stdexcept>

namespace yieldgov {

// ============================================================================
// Arithmetic Helpers
// ============================================================================

Uint256 MulDiv(const Uint256& a, const Uint256& b, const Uint256& d) {
    if (d == 0) {
        return 0;
    }
    Uint512 product = Uint512(a) * Uint512(b);
    Uint512 quotient = product / Uint512(d);
    return Uint256(quotient);
}

std::string ToDecimalString(const Uint256& value) {
    return value.str();
}

const Uint256& AddressMask() {
    static const Uint256 mask = (Uint256(1) << 160) - 1;
    return mask;
}

// ============================================================================
// BaseBlob Implementation
// ============================================================================

template<size_t BITS>
std::string BaseBlob<BITS>::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }
    return result;
}

// Explicit template instantiations
template class BaseBlob<256>;
template class BaseBlob<160>;

// ============================================================================
// Address Implementation
// ============================================================================

Uint256 Address::ToUint256() const {
    Uint256 value = 0;
    for (size_t i = 0; i < SIZE; ++i) {
        value <<= 8;
        value |= data_[i];
    }
    return value;
}

Address Address::FromUint256(const Uint256& value) {
    Address addr;
    Uint256 v = value;
    v &= AddressMask();
    for (size_t i = SIZE; i > 0; --i) {
        Uint256 low = v & 0xFF;
        addr.data_[i - 1] = static_cast<Byte>(low.convert_to<unsigned>());
        v >>= 8;
    }
    return addr;
}

Address Address::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for address");
    }

    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return static_cast<Byte>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<Byte>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<Byte>(c - 'A' + 10);
        throw std::invalid_argument("Invalid hex character");
    };

    Address addr;
    for (size_t i = 0; i < SIZE; ++i) {
        Byte high = hexCharToNibble(digits[i * 2]);
        Byte low = hexCharToNibble(digits[i * 2 + 1]);
        addr.data_[i] = static_cast<Byte>((high << 4) | low);
    }
    return addr;
}

std::string Address::ToString() const {
    return "0x" + ToHex();
}

Address Address::FromId(uint64_t id) {
    return FromUint256(Uint256(id));
}

} // namespace yieldgov
