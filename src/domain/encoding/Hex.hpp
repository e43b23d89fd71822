/**
 * @file Hex.hpp
 * @brief Hex string <-> byte conversion.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sourceproof::domain::encoding {

using Bytes = std::vector<std::uint8_t>;

/** @brief Lowercase hex of the bytes, without prefix. */
std::string ToHex(const Bytes& bytes);

/** @brief Lowercase hex of the bytes, with "0x" prefix. */
std::string ToPrefixedHex(const Bytes& bytes);

/**
 * @brief Parses a hex string, with or without "0x".
 * @return nullopt on odd length or non-hex characters.
 */
std::optional<Bytes> FromHex(const std::string& hex);

/** @brief True for [0-9a-fA-F]. */
bool IsHexDigit(char c);

/** @brief Removes a leading "0x"/"0X" if present. */
std::string StripHexPrefix(const std::string& hex);

} // namespace sourceproof::domain::encoding
