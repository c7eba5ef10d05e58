// ENDOW - Core Types Header
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// This file defines fundamental types used throughout ENDOW.

#ifndef ENDOW_CORE_TYPES_H
#define ENDOW_CORE_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace endow {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units. Supplies with 18 decimals overflow 64 bits,
/// so all balances and fixed-point products use 256-bit integers.
using Amount = boost::multiprecision::uint256_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Block number on the host chain
using BlockNumber = uint64_t;

/// Decimal string form of an amount
std::string AmountToString(const Amount& value);

/// Parse a non-negative decimal integer (no sign, no exponent)
std::optional<Amount> ParseAmount(const std::string& str);

// ============================================================================
// Address - 160-bit account identity
// ============================================================================

/**
 * A 20-byte account identity (token, treasury, pool manager, user...).
 *
 * Stored and displayed big-endian ("0x" followed by 40 hex digits), so the
 * ordering operator matches numeric ordering of the address.
 * The all-zero address is the null identity; it doubles as the mint/burn
 * sentinel and as the native-currency marker in pool keys.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;
    
    /// Null address
    Address() noexcept { data_.fill(0); }
    
    explicit Address(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}
    
    /// Convenience for tests and fixtures: all bytes set to one value
    static Address Filled(Byte value) {
        std::array<Byte, SIZE> data;
        data.fill(value);
        return Address(data);
    }
    
    /// Parse "0x"-prefixed or bare 40-digit hex. Returns nullopt on bad input.
    static std::optional<Address> FromHex(const std::string& hex);
    
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    constexpr size_t size() const noexcept { return SIZE; }
    
    bool operator==(const Address& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Address& other) const noexcept { return !(*this == other); }
    bool operator<(const Address& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }
    
    /// "0x" + 40 lowercase hex digits
    std::string ToString() const;
    
    /// First and last bytes only, for log lines
    std::string ToShortString() const;

private:
    std::array<Byte, SIZE> data_;
};

} // namespace endow

#endif // ENDOW_CORE_TYPES_H
