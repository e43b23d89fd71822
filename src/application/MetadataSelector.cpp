/**
 * @file MetadataSelector.cpp
 * @brief Implementation of MetadataSelector.
 */
#include "application/MetadataSelector.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include "domain/VerificationErrors.hpp"

namespace sourceproof::application {

std::vector<domain::MetadataDescriptor> MetadataSelector::select(const std::vector<domain::RawFile>& files) const {
    std::vector<domain::MetadataDescriptor> descriptors;

    for (const auto& file : files) {
        // Most uploaded files are sources, not JSON; those are skipped quietly.
        nlohmann::json document = nlohmann::json::parse(file.content, nullptr, false);
        if (document.is_discarded() || !document.is_object()) {
            continue;
        }

        domain::MetadataDescriptor descriptor(std::move(document));
        if (descriptor.language() == kTargetLanguage) {
            descriptors.push_back(std::move(descriptor));
        }
    }

    if (descriptors.empty()) {
        const std::string message = "Metadata file not found. Did you include \"metadata.json\"?";
        std::cerr << "[MetadataSelector] [FIND] " << message << std::endl;
        throw domain::NoMetadataFound(message, {"[FIND]", {}, {}});
    }
    return descriptors;
}

} // namespace sourceproof::application
