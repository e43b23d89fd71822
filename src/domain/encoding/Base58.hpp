/**
 * @file Base58.hpp
 * @brief Base58 (bitcoin alphabet) encoding, as used for IPFS multihashes.
 */

#pragma once
#include <string>
#include "domain/encoding/Hex.hpp"

namespace sourceproof::domain::encoding {

/** @brief Encodes bytes; each leading zero byte becomes a leading '1'. */
std::string EncodeBase58(const Bytes& bytes);

} // namespace sourceproof::domain::encoding
