/**
 * @file SourceAssembler.hpp
 * @brief Rebuilds the exact source set a metadata descriptor commits to.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "domain/CheckedContract.hpp"
#include "domain/RawFile.hpp"

namespace sourceproof::application {

/**
 * @class SourceAssembler
 * @brief Tamper-detection boundary: every returned source hashes to its declared digest.
 */
class SourceAssembler {
public:
    /**
     * @brief Resolves every source the descriptor declares.
     *
     * Inline content is checked against its digest; otherwise the digest is
     * looked up among the uploaded files. Uploaded files the descriptor does
     * not reference are ignored.
     *
     * @throws domain::SourceHashMismatch if inline content does not hash to its digest.
     * @throws domain::SourceNotFound if a digest has no matching upload.
     */
    domain::SourceSet assemble(const domain::MetadataDescriptor& descriptor,
                               const std::vector<domain::RawFile>& files) const;

    /** @brief Index of upload content keyed by lowercase "0x"-prefixed keccak-256. */
    static std::map<std::string, std::string> IndexByHash(const std::vector<domain::RawFile>& files);
};

} // namespace sourceproof::application
