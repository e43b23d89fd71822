/**
 * @file Keccak.hpp
 * @brief Keccak-256 (original padding, as used by Ethereum).
 */

#pragma once
#include <string>
#include "domain/encoding/Hex.hpp"

namespace sourceproof::domain::encoding {

/** @brief 32-byte Keccak-256 digest of the input bytes. */
Bytes Keccak256(const std::uint8_t* data, size_t size);

/** @brief Digest of a string's raw bytes. */
Bytes Keccak256(const std::string& data);

/** @brief "0x"-prefixed lowercase hex digest of a string's raw bytes. */
std::string Keccak256Hex(const std::string& data);

} // namespace sourceproof::domain::encoding
