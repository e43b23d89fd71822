/**
 * @file RawFile.hpp
 * @brief An uploaded blob, as submitted.
 */

#pragma once
#include <string>

namespace sourceproof::domain {

/**
 * @struct RawFile
 * @brief Opaque submitted file. Content is addressed by its keccak-256 digest.
 */
struct RawFile {
    std::string name;    ///< Name as submitted (informational only).
    std::string content; ///< Raw bytes.
};

} // namespace sourceproof::domain
