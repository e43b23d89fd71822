/**
 * @file Hex.cpp
 * @brief Implementation of hex helpers.
 */
#include "domain/encoding/Hex.hpp"

namespace sourceproof::domain::encoding {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int NibbleValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string ToHex(const Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0f]);
    }
    return out;
}

std::string ToPrefixedHex(const Bytes& bytes) {
    return "0x" + ToHex(bytes);
}

bool IsHexDigit(char c) {
    return NibbleValue(c) >= 0;
}

std::string StripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

std::optional<Bytes> FromHex(const std::string& hex) {
    const std::string digits = StripHexPrefix(hex);
    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }

    Bytes bytes;
    bytes.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = NibbleValue(digits[i]);
        int lo = NibbleValue(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

} // namespace sourceproof::domain::encoding
