// ENDOW - Core Types Implementation
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/core/types.h"
#include "endow/core/hex.h"

#include <algorithm>
#include <limits>

namespace endow {

// ============================================================================
// Amount Helpers
// ============================================================================

std::string AmountToString(const Amount& value) {
    return value.str();
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty() || str.size() > 78) {
        return std::nullopt;
    }
    
    Amount result = 0;
    const Amount limit = std::numeric_limits<Amount>::max();
    for (char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        unsigned digit = static_cast<unsigned>(c - '0');
        if (result > (limit - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return result;
}

// ============================================================================
// Address Implementation
// ============================================================================

std::optional<Address> Address::FromHex(const std::string& hex) {
    if (!IsValidHex(hex) || StripHexPrefix(hex).size() != SIZE * 2) {
        return std::nullopt;
    }
    
    std::vector<Byte> bytes = HexToBytes(hex);
    std::array<Byte, SIZE> data;
    std::copy(bytes.begin(), bytes.end(), data.begin());
    return Address(data);
}

std::string Address::ToString() const {
    return "0x" + BytesToHex(data_.data(), SIZE);
}

std::string Address::ToShortString() const {
    std::string full = BytesToHex(data_.data(), SIZE);
    return "0x" + full.substr(0, 4) + ".." + full.substr(full.size() - 4);
}

} // namespace endow
