// ENDOW - Serialization Implementation
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/core/serialize.h"
#include "endow/core/hex.h"

namespace endow {

// ============================================================================
// DataStream Implementation
// ============================================================================

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + read_pos_, data_.size() - read_pos_);
}

void DataStream::FromHex(const std::string& hex) {
    clear();
    std::vector<uint8_t> bytes = HexToBytes(hex);
    data_ = std::move(bytes);
}

} // namespace endow
