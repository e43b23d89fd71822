/**
 * @file CompilerInputBuilder.cpp
 * @brief Implementation of CompilerInputBuilder.
 */
#include "application/CompilerInputBuilder.hpp"

#include <iostream>
#include "domain/VerificationErrors.hpp"

namespace sourceproof::application {

CompilerInput CompilerInputBuilder::build(const domain::MetadataDescriptor& descriptor,
                                          const domain::SourceSet& sources) const {
    const auto target = descriptor.compilationTarget();
    if (!target) {
        const std::string message = "Could not determine compilation target from metadata.";
        std::cerr << "[CompilerInputBuilder] [REFORMAT] target=" << descriptor.compilationTargetJson().dump()
                  << " " << message << std::endl;
        throw domain::AmbiguousOrMissingTarget(message, {"[REFORMAT]", {}, {}});
    }

    nlohmann::json settings = descriptor.settings().is_object() ? descriptor.settings() : nlohmann::json::object();
    settings.erase("compilationTarget");

    if (!settings.contains("metadata") || !settings["metadata"].is_object()) {
        settings["metadata"] = nlohmann::json::object();
    }
    if (!settings.contains("outputSelection") || !settings["outputSelection"].is_object()) {
        settings["outputSelection"] = nlohmann::json::object();
    }
    settings["outputSelection"][target->fileName][target->contractName] = {
        "evm.bytecode",
        "evm.deployedBytecode",
        "metadata"
    };

    nlohmann::json input = {
        {"language", descriptor.language()},
        {"settings", std::move(settings)},
        {"sources", nlohmann::json::object()}
    };
    for (const auto& [fileName, content] : sources) {
        input["sources"][fileName] = {{"content", content}};
    }

    return CompilerInput{std::move(input), *target};
}

} // namespace sourceproof::application
