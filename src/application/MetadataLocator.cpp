/**
 * @file MetadataLocator.cpp
 * @brief Implementation of MetadataLocator.
 */
#include "application/MetadataLocator.hpp"

#include <iostream>
#include "domain/VerificationErrors.hpp"
#include "domain/encoding/Base58.hpp"
#include "domain/encoding/Hex.hpp"

namespace sourceproof::application {

namespace {

using domain::encoding::Bytes;

bool BytesAt(const nlohmann::json& map, const char* key, Bytes& out) {
    if (!map.contains(key) || !map.at(key).is_binary()) {
        return false;
    }
    const auto& binary = map.at(key).get_binary();
    out.assign(binary.begin(), binary.end());
    return !out.empty();
}

} // namespace

nlohmann::json MetadataLocator::DecodeTrailer(const std::string& deployedBytecode) {
    const nlohmann::json invalid(nlohmann::json::value_t::discarded);

    auto bytes = domain::encoding::FromHex(deployedBytecode);
    if (!bytes || bytes->size() < 2) {
        return invalid;
    }

    const size_t size = bytes->size();
    const size_t cborLength = (static_cast<size_t>((*bytes)[size - 2]) << 8) | (*bytes)[size - 1];
    if (cborLength + 2 > size) {
        return invalid;
    }

    auto first = bytes->begin() + static_cast<std::ptrdiff_t>(size - 2 - cborLength);
    auto last = bytes->end() - 2;
    nlohmann::json decoded = nlohmann::json::from_cbor(first, last, true, false);
    if (decoded.is_discarded() || !decoded.is_object()) {
        return invalid;
    }
    return decoded;
}

ContentAddress MetadataLocator::locate(const std::string& deployedBytecode) const {
    const nlohmann::json trailer = DecodeTrailer(deployedBytecode);

    Bytes digest;
    if (!trailer.is_discarded()) {
        if (BytesAt(trailer, "bzzr0", digest)) {
            return {"swarm/bzzr0", domain::encoding::ToHex(digest)};
        }
        if (BytesAt(trailer, "bzzr1", digest)) {
            return {"swarm/bzzr1", domain::encoding::ToHex(digest)};
        }
        if (BytesAt(trailer, "ipfs", digest)) {
            return {"ipfs", domain::encoding::EncodeBase58(digest)};
        }
    }

    const std::string message =
        "Re-compilation successful, but could not find reference to metadata file in cbor data.";
    std::cerr << "[MetadataLocator] [STOREDATA] " << message << std::endl;
    throw domain::MetadataReferenceMissing(message, {"[STOREDATA]", {}, {}});
}

} // namespace sourceproof::application
