/**
 * @file Address.hpp
 * @brief 20-byte account addresses and their EIP-55 checksum form.
 */

#pragma once
#include <optional>
#include <string>

namespace sourceproof::domain::encoding {

/** @brief True for "0x" followed by exactly 40 hex digits (any case). */
bool IsAddress(const std::string& address);

/**
 * @brief Mixed-case checksum encoding of an address.
 * @return nullopt if the input is not an address.
 */
std::optional<std::string> ToChecksumAddress(const std::string& address);

} // namespace sourceproof::domain::encoding
