/**
 * @file MetadataLocator.hpp
 * @brief Decodes the CBOR metadata reference appended to compiled bytecode.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace sourceproof::application {

/**
 * @struct ContentAddress
 * @brief Storage location derived from the metadata hash embedded in bytecode.
 */
struct ContentAddress {
    std::string scheme; ///< "swarm/bzzr0", "swarm/bzzr1" or "ipfs".
    std::string digest; ///< Hex (swarm) or base58 multihash (ipfs).

    /** @brief Path fragment, e.g. "/ipfs/Qm...". */
    std::string path() const { return "/" + scheme + "/" + digest; }
};

/**
 * @class MetadataLocator
 * @brief Maps deployed bytecode to the content address of its metadata.
 */
class MetadataLocator {
public:
    /**
     * @brief Decodes the trailer and picks bzzr0, then bzzr1, then ipfs.
     * @throws domain::MetadataReferenceMissing if the trailer is unreadable or carries none of them.
     */
    ContentAddress locate(const std::string& deployedBytecode) const;

    /**
     * @brief Decodes the trailing CBOR map.
     * @return The decoded map, or a discarded value if the trailer is malformed.
     */
    static nlohmann::json DecodeTrailer(const std::string& deployedBytecode);
};

} // namespace sourceproof::application
