/**
 * @file Address.cpp
 * @brief Implementation of address helpers.
 */
#include "domain/encoding/Address.hpp"

#include <algorithm>
#include <cctype>
#include "domain/encoding/Keccak.hpp"

namespace sourceproof::domain::encoding {

bool IsAddress(const std::string& address) {
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return false;
    }
    return std::all_of(address.begin() + 2, address.end(), IsHexDigit);
}

std::optional<std::string> ToChecksumAddress(const std::string& address) {
    if (!IsAddress(address)) {
        return std::nullopt;
    }

    std::string lower = address.substr(2);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    // Nibble i of keccak(lowercase hex) decides the case of hex digit i.
    const Bytes hash = Keccak256(lower);
    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); ++i) {
        std::uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
        char c = lower[i];
        out.push_back(nibble >= 8 ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
    }
    return out;
}

} // namespace sourceproof::domain::encoding
