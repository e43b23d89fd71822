/**
 * @file MetadataSelector.hpp
 * @brief Picks compiler metadata documents out of an upload.
 */

#pragma once
#include <vector>
#include "domain/MetadataDescriptor.hpp"
#include "domain/RawFile.hpp"

namespace sourceproof::application {

/**
 * @class MetadataSelector
 * @brief Filters raw files down to Solidity metadata descriptors.
 */
class MetadataSelector {
public:
    /** @brief Language identifier a descriptor must declare to be retained. */
    static constexpr const char* kTargetLanguage = "Solidity";

    /**
     * @brief Parses every file as JSON and keeps Solidity metadata documents.
     * @param files Uploaded files, in submission order.
     * @return Descriptors in input order.
     * @throws domain::NoMetadataFound if no file qualifies.
     */
    std::vector<domain::MetadataDescriptor> select(const std::vector<domain::RawFile>& files) const;
};

} // namespace sourceproof::application
