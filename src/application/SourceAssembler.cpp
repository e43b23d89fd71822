/**
 * @file SourceAssembler.cpp
 * @brief Implementation of SourceAssembler.
 */
#include "application/SourceAssembler.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include "domain/VerificationErrors.hpp"
#include "domain/encoding/Keccak.hpp"

namespace sourceproof::application {

namespace {

std::string NormalizeDigest(std::string digest) {
    std::transform(digest.begin(), digest.end(), digest.begin(), [](unsigned char c) { return std::tolower(c); });
    if (digest.rfind("0x", 0) != 0) {
        digest = "0x" + digest;
    }
    return digest;
}

} // namespace

std::map<std::string, std::string> SourceAssembler::IndexByHash(const std::vector<domain::RawFile>& files) {
    std::map<std::string, std::string> byHash;
    for (const auto& file : files) {
        byHash[domain::encoding::Keccak256Hex(file.content)] = file.content;
    }
    return byHash;
}

domain::SourceSet SourceAssembler::assemble(const domain::MetadataDescriptor& descriptor,
                                            const std::vector<domain::RawFile>& files) const {
    domain::SourceSet sources;
    const auto byHash = IndexByHash(files);

    for (const auto& [fileName, declared] : descriptor.sources()) {
        const std::string hash = NormalizeDigest(declared.keccak256);

        if (declared.content) {
            if (domain::encoding::Keccak256Hex(*declared.content) != hash) {
                const std::string message = "Invalid content for file " + fileName;
                std::cerr << "[SourceAssembler] [REARRANGE] fileName=" << fileName << " " << message << std::endl;
                throw domain::SourceHashMismatch(message, {"[REARRANGE]", {}, {}}, fileName);
            }
            sources[fileName] = *declared.content;
            continue;
        }

        auto it = byHash.find(hash);
        if (it == byHash.end()) {
            const std::string message =
                "The metadata file mentions a source file called \"" + fileName + "\" "
                "that cannot be found in your upload.\nIts keccak256 hash is " + declared.keccak256 + ". "
                "Please try to find it and include it in the upload.";
            std::cerr << "[SourceAssembler] [REARRANGE] fileName=" << fileName << " " << message << std::endl;
            throw domain::SourceNotFound(message, {"[REARRANGE]", {}, {}}, fileName, declared.keccak256);
        }
        sources[fileName] = it->second;
    }
    return sources;
}

} // namespace sourceproof::application
